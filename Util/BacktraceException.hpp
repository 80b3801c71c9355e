#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief common base wrapper for every exception this
 * project throws, so that extra diagnostics can be
 * attached in one place.
 */
template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return T::what();
	}
};

}

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
