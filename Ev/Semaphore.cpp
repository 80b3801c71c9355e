#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<functional>
#include<queue>
#include<utility>

namespace Ev {

class Semaphore::Impl {
private:
	std::size_t remaining;

	struct Waiting {
		Ev::Io<void> action;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::queue<Waiting> waiting;

	void release() {
		if (waiting.empty()) {
			++remaining;
			return;
		}
		assert(remaining == 0);
		auto next = std::move(waiting.front());
		waiting.pop();
		enter( std::move(next.action)
		     , std::move(next.pass)
		     , std::move(next.fail)
		     );
	}
	void enter( Ev::Io<void> action
		  , std::function<void()> pass
		  , std::function<void(std::exception_ptr)> fail
		  ) {
		action.run([this, pass]() {
			release();
			pass();
		}, [this, fail](std::exception_ptr e) {
			release();
			fail(e);
		});
	}

public:
	explicit
	Impl(std::size_t max) : remaining(max) { }

	Ev::Io<void> run(Ev::Io<void> action) {
		return Ev::Io<void>([ this, action
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (remaining > 0) {
				--remaining;
				enter(action, std::move(pass), std::move(fail));
			} else {
				waiting.push(Waiting{
					action, std::move(pass), std::move(fail)
				});
			}
		}) + Ev::yield();
	}
};

Semaphore::Semaphore(Semaphore&&) =default;
Semaphore::~Semaphore() =default;

Semaphore::Semaphore(std::size_t max)
	: pimpl(Util::make_unique<Impl>(max)) { }

Ev::Io<void> Semaphore::core_run(Ev::Io<void> action) {
	return pimpl->run(Ev::yield() + std::move(action));
}

}
