#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Watch/Mod/Logger.hpp"
#include"Watch/Msg/Log.hpp"
#include"Watch/Msg/Option.hpp"
#include"Watch/parse_options.hpp"
#include<initializer_list>

namespace Watch { namespace Mod {

LogLevel log_level_from_string(std::string const& name) {
	for (auto l : {Trace, Debug, Info, Warn, Error})
		if (name == log_level_name(l))
			return l;
	throw BadOption("--lnwatch-log-level: unknown level: " + name);
}

Logger::Logger( S::Bus& bus
	      , std::ostream& out_
	      ) : out(out_), min_level(Info) {
	bus.subscribe<Msg::Option
		     >([this](Msg::Option const& o) {
		if (o.name != "lnwatch-log-level")
			return Ev::lift();
		min_level = log_level_from_string(o.value);
		return Ev::lift();
	});
	bus.subscribe<Msg::Log
		     >([this](Msg::Log const& l) {
		if (l.level < min_level)
			return Ev::lift();

		auto start = outs.empty();
		outs.push(std::string(log_level_name(l.level)) + " " + l.message);

		if (!start)
			return Ev::lift();
		return Ev::concurrent(loop());
	});
}

Ev::Io<void> Logger::loop() {
	return Ev::yield().then([this]() {
		if (outs.empty())
			return Ev::lift();
		out << outs.front() << std::endl;
		outs.pop();
		return loop();
	});
}

}}
