#include"Ev/Event.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include<functional>
#include<vector>

namespace Ev {

class Event::Impl {
public:
	bool flag;
	std::vector<std::function<void()>> waiters;

	Impl() : flag(false) { }
};

Event::Event() : pimpl(std::make_shared<Impl>()) { }

Ev::Io<void> Event::set() {
	auto impl = pimpl;
	return Ev::lift().then([impl]() {
		if (impl->flag)
			return Ev::lift();
		impl->flag = true;

		auto waiters = std::move(impl->waiters);
		impl->waiters.clear();

		/* Resume each waiter in its own greenthread.  */
		auto act = Ev::lift();
		for (auto& w : waiters) {
			auto pass = std::move(w);
			act += Ev::concurrent(Ev::Io<void>([pass
							   ]( std::function<void()> p
							    , std::function<void(std::exception_ptr)>
							    ) {
				p();
				pass();
			}));
		}
		return act;
	});
}

Ev::Io<void> Event::wait() {
	auto impl = pimpl;
	return Ev::Io<void>([impl]( std::function<void()> pass
				  , std::function<void(std::exception_ptr)>
				  ) {
		if (impl->flag)
			pass();
		else
			impl->waiters.push_back(std::move(pass));
	});
}

bool Event::is_set() const {
	return pimpl->flag;
}

}
