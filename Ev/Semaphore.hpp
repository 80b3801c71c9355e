#ifndef EV_SEMAPHORE_HPP
#define EV_SEMAPHORE_HPP

#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<cstddef>
#include<memory>
#include<utility>

namespace Ev {

namespace Detail {

/* Adapts an Io<a> to the Io<void> the semaphore core runs,
 * carrying the result out on the side.
 */
template<typename a>
struct SemaphoreRunHelper {
	template<typename f>
	static
	Ev::Io<a> run(Ev::Io<a> action, f core_run) {
		auto presult = std::make_shared<std::unique_ptr<a>>();
		auto void_action = action.then([presult](a rv) {
			*presult = Util::make_unique<a>(std::move(rv));
			return Ev::lift();
		});
		return core_run(std::move(void_action)).then([presult]() {
			return Ev::lift(std::move(**presult));
		});
	}
};
template<>
struct SemaphoreRunHelper<void> {
	template<typename f>
	static
	Ev::Io<void> run(Ev::Io<void> action, f core_run) {
		return core_run(std::move(action));
	}
};

}

/** class Ev::Semaphore
 *
 * @brief limits the number of greenthreads that can be
 * inside `run` at the same time.
 *
 * @desc Extra greenthreads block, in arrival order,
 * until a running one completes or throws.
 * With a limit of 1 this serializes whole actions,
 * including all their yield points.
 */
class Semaphore {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	Ev::Io<void> core_run(Ev::Io<void> action);

public:
	Semaphore() =delete;
	Semaphore(Semaphore const&) =delete;

	Semaphore(Semaphore&& o);
	~Semaphore();
	explicit
	Semaphore(std::size_t max);

	/* Throws whatever the given action throws.  */
	template<typename a>
	Ev::Io<a> run(Ev::Io<a> action) {
		return Detail::SemaphoreRunHelper<a>::run(std::move(action), [this](Ev::Io<void> action) {
			return core_run(std::move(action));
		});
	}
};

}

#endif /* !defined(EV_SEMAPHORE_HPP) */
