#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Watch/Msg/Log.hpp"
#include"Watch/log.hpp"
#include<stdarg.h>

namespace Watch {

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Msg::Log{l, std::move(msg)});
}

char const* log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "error";
}

}
