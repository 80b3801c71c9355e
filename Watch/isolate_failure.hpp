#ifndef WATCH_ISOLATE_FAILURE_HPP
#define WATCH_ISOLATE_FAILURE_HPP

#include"Ev/Io.hpp"
#include"Watch/MinedDepth.hpp"
#include<exception>

namespace Watch {

/** Watch::isolate_failure
 *
 * @brief runs `io`, and if it fails with any
 * `std::exception`, hands it to `handler` instead.
 *
 * @desc `Watch::ClassifierDefect` is not handled and
 * still fails the returned action.
 * `handler` takes a `std::exception const&` and returns
 * an `Ev::Io<a>`.
 */
template<typename a, typename F>
Ev::Io<a> isolate_failure(Ev::Io<a> io, F handler) {
	return io.template catching<std::exception>([handler](std::exception const& e) {
		auto defect = dynamic_cast<ClassifierDefect const*>(&e);
		if (defect) {
			auto copy = *defect;
			return Ev::lift().then([copy]() -> Ev::Io<a> {
				throw copy;
			});
		}
		return Ev::Io<a>(handler(e));
	});
}

}

#endif /* !defined(WATCH_ISOLATE_FAILURE_HPP) */
