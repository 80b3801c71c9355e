#undef NDEBUG
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Ev/yield.hpp>
#include<S/Bus.hpp>
#include<assert.h>
#include<memory>
#include<stdexcept>
#include<string>

Ev::Io<void> io_main() {
	auto bus = std::make_shared<S::Bus>();
	auto flag = std::make_shared<bool>();
	auto flag2 = std::make_shared<bool>();
	return Ev::yield().then([=]() {
		/* Should be benign.  */
		return bus->raise(42);
	}).then([=]() {
		*flag = false;
		bus->subscribe<int>([=](int const& i) {
			if (i == 42)
				*flag = true;
			return Ev::lift();
		});
		return bus->raise(40).then([=]() {
			/* Previous subscription should not have
			 * an effect.  */
			assert(!*flag);
			return bus->raise(42);
		}).then([=] () {
			/* Subscription should have triggered.  */
			assert(*flag);
			return Ev::yield();
		});
	}).then([=]() {
		/* Types are strict.  */
		*flag = false;
		return bus->raise<double>(42.0).then([=]() {
			/* Previous subscription should not trigger,
			 * it is registered for int, not double.  */
			assert(!*flag);
			return Ev::lift();
		});
	}).then([=]() {
		*flag = false;
		bus->subscribe<double>([=](double const& i) {
			if (i == 42.0)
				*flag = true;
			return Ev::lift();
		});
		return bus->raise<double>(42.0).then([=]() {
			assert(*flag);
			return Ev::lift();
		});
	}).then([=]() {
		*flag = false;
		*flag2 = false;
		/* Test multiple subscriptions.  */
		bus->subscribe<double>([=](double const& i) {
			*flag2 = true;
			return Ev::lift();
		});
		return bus->raise<double>(42.0).then([=]() {
			/* Both subscriptions should have triggered.  */
			assert(*flag);
			assert(*flag2);
			return Ev::lift();
		});
	}).then([=]() {
		/* Cancelled subscribers are skipped, the rest
		 * still run.  */
		auto count = std::make_shared<int>(0);
		auto sub = bus->subscribe<std::string>([=](std::string const&) {
			++*count;
			return Ev::lift();
		});
		bus->subscribe<std::string>([=](std::string const&) {
			*count += 10;
			return Ev::lift();
		});
		assert(sub.active());
		return bus->raise(std::string("x")).then([=]() mutable {
			assert(*count == 11);
			sub.cancel();
			assert(!sub.active());
			/* Cancelling twice is harmless.  */
			sub.cancel();
			return bus->raise(std::string("y"));
		}).then([=]() {
			assert(*count == 21);
			return Ev::lift();
		});
	}).then([=]() {
		/* A raise waits for every subscriber, and
		 * reports a subscriber's exception afterwards.  */
		auto done = std::make_shared<bool>(false);
		bus->subscribe<char>([=](char const&) {
			return Ev::yield(5).then([=]() {
				*done = true;
				return Ev::lift();
			});
		});
		bus->subscribe<char>([=](char const&) {
			throw std::runtime_error("subscriber failed");
			return Ev::lift();
		});
		return bus->raise('c').then([]() {
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const&) {
			return Ev::lift(true);
		}).then([=](bool threw) {
			assert(threw);
			assert(*done);
			return Ev::lift();
		});
	});
}

int main() {
	return Ev::start(io_main().then([](){
		return Ev::lift(0);
	}));
}
