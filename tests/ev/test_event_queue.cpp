#undef NDEBUG
#include"Ev/Event.hpp"
#include"Ev/Io.hpp"
#include"Ev/Queue.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<memory>
#include<string>
#include<vector>

int main() {
	auto event = Ev::Event();
	auto queue = Ev::Queue<std::string>();
	auto waiters_done = std::make_shared<int>(0);
	auto got = std::make_shared<std::vector<std::string>>();

	auto waiter = [event, waiters_done]() {
		auto ev = event;
		return ev.wait().then([waiters_done]() {
			++*waiters_done;
			return Ev::lift();
		});
	};
	auto getter = [queue, got]() {
		auto q = queue;
		return q.get().then([got](std::string s) {
			got->push_back(s);
			return Ev::lift();
		});
	};

	auto code = Ev::lift().then([&]() {
		assert(!event.is_set());
		return Ev::concurrent(waiter())
		     + Ev::concurrent(waiter())
		     + Ev::yield(5)
		     ;
	}).then([&]() {
		/* Not yet set.  */
		assert(*waiters_done == 0);
		return event.set() + Ev::yield(5);
	}).then([&]() {
		assert(event.is_set());
		assert(*waiters_done == 2);

		/* Waiting on an already-set event does not
		 * block, and setting again does nothing.  */
		return event.set() + waiter();
	}).then([&]() {
		assert(*waiters_done == 3);

		/* Items put before anyone gets are kept in
		 * order.  */
		return queue.put("a") + queue.put("b");
	}).then([&]() {
		assert(queue.size() == 2);
		return getter() + getter();
	}).then([&]() {
		assert(queue.empty());
		assert(got->size() == 2);
		assert((*got)[0] == "a");
		assert((*got)[1] == "b");

		/* Getters that arrive first block, and are
		 * served in arrival order.  */
		return Ev::concurrent(getter())
		     + Ev::yield(2)
		     + Ev::concurrent(getter())
		     + Ev::yield(5)
		     ;
	}).then([&]() {
		assert(got->size() == 2);
		return queue.put("c") + queue.put("d") + Ev::yield(5);
	}).then([&]() {
		assert(queue.empty());
		assert(got->size() == 4);
		assert((*got)[2] == "c");
		assert((*got)[3] == "d");

		/* Concurrent tasks only start once the current
		 * greenthread yields.  */
		auto flag = std::make_shared<bool>(false);
		return Ev::concurrent(Ev::yield().then([flag]() {
			*flag = true;
			return Ev::lift();
		})).then([flag]() {
			assert(!*flag);
			return Ev::yield(3);
		}).then([flag]() {
			assert(*flag);
			return Ev::lift(0);
		});
	});

	return Ev::start(code);
}
