#ifndef WATCH_LOG_HPP
#define WATCH_LOG_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Watch {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/** Watch::log
 *
 * @brief formats the message printf-style and raises it
 * as a `Watch::Msg::Log` on the bus.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

char const* log_level_name(LogLevel l);

}

#endif /* WATCH_LOG_HPP */
