#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<memory>
#include<string>
#include<vector>

namespace {

/* Number of simultaneous threads the semaphore should allow.
 */
auto constexpr max = std::size_t(16);
/* Number of actual threads we will launch.  */
auto constexpr num_threads = std::size_t(5000);

/* Number of times we will Ev::yield() while within the
 * semaphore.
 */
auto constexpr busy_loop = std::size_t(20);

/* Keep track of the number of threads running in the
 * semaphore.  */
auto num_running = std::size_t(0);
/* Keep track of the number of times we actually
 * ran.
 */
auto num_completed = std::size_t(0);

auto hit_max = false;

/* Do nothing useful.  */
Ev::Io<void> be_busy(bool should_throw) {
	return Ev::lift().then([]() {
		++num_running;
		assert(num_running <= max);
		if (num_running == max)
			hit_max = true;
		return Ev::yield();
	}).then([]() {
		auto act = Ev::lift();
		for (auto i = std::size_t(0); i < busy_loop; ++i) {
			act += Ev::yield();
		}
		return act;
	}).then([]() {
		assert(num_running != 0);
		--num_running;
		return Ev::lift();
	}).then([should_throw]() {
		if (should_throw)
			throw std::exception();
		return Ev::lift();
	});
}

/* Run one thread.  */
Ev::Io<void> action(Ev::Semaphore& sem, bool should_throw) {
	return sem.run(be_busy(should_throw)).then([should_throw]() {
		assert(!should_throw);
		++num_completed;
		return Ev::lift();
	}).catching<std::exception>([should_throw](std::exception const&) {
		assert(should_throw);
		++num_completed;
		return Ev::lift();
	});
}

/* Run simultaneous threads.  */
Ev::Io<void> launch_loop(Ev::Semaphore& sem, std::size_t remaining) {
	return Ev::yield().then([&sem, remaining]() {
		if (remaining == 0)
			return Ev::lift();
		return Ev::concurrent(action(sem, (remaining % 2) == 0))
		     + launch_loop(sem, remaining - 1)
		     ;
	});
}
Ev::Io<void> launch_em_all(Ev::Semaphore& sem) {
	return launch_loop(sem, num_threads);
}

/* Wait for num_completed to reach target.  */
Ev::Io<void> wait_for_completion() {
	return Ev::yield().then([]() {
		if (num_completed < num_threads)
			return wait_for_completion();
		return Ev::lift();
	});
}

/* With a limit of 1, whole actions run one after the
 * other, even across yields.  */
Ev::Io<void> serialized_step( Ev::Semaphore& mutex
			    , std::shared_ptr<std::vector<int>> trace
			    , int id
			    ) {
	return mutex.run(Ev::lift().then([trace, id]() {
		trace->push_back(id);
		return Ev::yield(3);
	}).then([trace, id]() {
		trace->push_back(-id);
		return Ev::lift();
	}));
}
Ev::Io<void> check_serialized() {
	auto mutex = std::make_shared<Ev::Semaphore>(1);
	auto trace = std::make_shared<std::vector<int>>();
	return Ev::concurrent(serialized_step(*mutex, trace, 1))
	     + Ev::concurrent(serialized_step(*mutex, trace, 2))
	     + Ev::concurrent(serialized_step(*mutex, trace, 3))
	     + Ev::yield(50)
	     + Ev::lift().then([mutex, trace]() {
		/* Waits for anything still inside.  */
		return mutex->run(Ev::lift());
	}).then([trace]() {
		assert(trace->size() == 6);
		for (auto i = std::size_t(0); i < trace->size(); i += 2)
			assert((*trace)[i] == -(*trace)[i + 1]);
		return Ev::lift();
	});
}

}

int main() {
	auto sem = Ev::Semaphore(max);

	auto code = Ev::lift().then([&]() {
		return launch_em_all(sem);
	}).then([]() {
		return wait_for_completion();
	}).then([]() {
		return Ev::yield(25);
	}).then([&]() {
		assert(hit_max);

		return sem.run(Ev::lift(std::string("this is a test")));
	}).then([&](std::string res) {
		assert(res == "this is a test");

		return check_serialized();
	}).then([&]() {
		return sem.run(Ev::lift(0));
	});

	return Ev::start(code);
}
