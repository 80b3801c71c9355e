#ifndef EV_QUEUE_HPP
#define EV_QUEUE_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<queue>

namespace Ev {

/** class Ev::Queue<a>
 *
 * @brief unbounded FIFO between greenthreads.
 *
 * @desc `get` blocks the calling greenthread until an
 * item is available.
 * Items are handed to blocked getters in the order the
 * getters arrived.
 * Copies share the same underlying queue.
 */
template<typename a>
class Queue {
private:
	struct Impl {
		std::queue<a> items;
		std::queue<std::function<void(a)>> getters;
	};
	std::shared_ptr<Impl> pimpl;

public:
	Queue() : pimpl(std::make_shared<Impl>()) { }

	Ev::Io<void> put(a item) {
		auto impl = pimpl;
		auto pitem = std::make_shared<a>(std::move(item));
		return Ev::lift().then([impl, pitem]() {
			if (impl->getters.empty()) {
				impl->items.push(std::move(*pitem));
				return Ev::lift();
			}
			auto getter = std::move(impl->getters.front());
			impl->getters.pop();
			return Ev::concurrent(Ev::Io<void>([ getter
							   , pitem
							   ]( std::function<void()> pass
							    , std::function<void(std::exception_ptr)>
							    ) {
				pass();
				getter(std::move(*pitem));
			}));
		});
	}

	Ev::Io<a> get() {
		auto impl = pimpl;
		return Ev::Io<a>([impl]( std::function<void(a)> pass
				       , std::function<void(std::exception_ptr)>
				       ) {
			if (impl->items.empty()) {
				impl->getters.push(std::move(pass));
				return;
			}
			auto item = std::move(impl->items.front());
			impl->items.pop();
			pass(std::move(item));
		});
	}

	std::size_t size() const {
		return pimpl->items.size();
	}
	bool empty() const {
		return pimpl->items.empty();
	}
};

}

#endif /* !defined(EV_QUEUE_HPP) */
