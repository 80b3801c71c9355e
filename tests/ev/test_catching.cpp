#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

namespace {

struct Derived : public std::runtime_error {
	Derived() : std::runtime_error("derived") { }
};

}

int main() {
	auto code = Ev::yield().then([]() {
		throw int(42);
		return Ev::lift(1);
	}).catching<int>([](int const& i) {
		assert(i == 42);
		return Ev::lift(0);
	}).then([](int v) {
		assert(v == 0);

		/* Handlers catch derived exceptions.  */
		return Ev::lift().then([]() {
			throw Derived();
			return Ev::lift(std::string("not reached"));
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			return Ev::lift(std::string(e.what()));
		});
	}).then([](std::string s) {
		assert(s == "derived");

		/* Unrelated exceptions pass through to an outer
		 * handler.  */
		auto inner_hit = std::make_shared<bool>(false);
		return Ev::lift().then([]() {
			throw std::logic_error("defect");
			return Ev::lift();
		}).catching<std::runtime_error>([inner_hit](std::runtime_error const&) {
			*inner_hit = true;
			return Ev::lift();
		}).then([]() {
			return Ev::lift(false);
		}).catching<std::logic_error>([inner_hit](std::logic_error const& e) {
			assert(!*inner_hit);
			assert(std::string(e.what()) == "defect");
			return Ev::lift(true);
		});
	}).then([](bool outer_hit) {
		assert(outer_hit);

		/* A handler that throws is caught further out.  */
		return Ev::lift().then([]() {
			throw std::runtime_error("first");
			return Ev::lift(0);
		}).catching<std::runtime_error>([](std::runtime_error const&) {
			throw std::invalid_argument("second");
			return Ev::lift(1);
		}).catching<std::invalid_argument>([](std::invalid_argument const&) {
			return Ev::lift(0);
		});
	});
	return Ev::start(code);
}
