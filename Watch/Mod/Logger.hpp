#ifndef WATCH_MOD_LOGGER_HPP
#define WATCH_MOD_LOGGER_HPP

#include"Watch/log.hpp"
#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Watch { namespace Mod {

/** class Watch::Mod::Logger
 *
 * @brief writes `Watch::Msg::Log` messages to an output
 * stream, one `<level> <message>` line each.
 *
 * @desc Messages below the level set by the
 * `lnwatch-log-level` option are dropped.
 * The default level is `info`.
 */
class Logger {
private:
	std::ostream& out;
	LogLevel min_level;
	std::queue<std::string> outs;

	Ev::Io<void> loop();

public:
	Logger( S::Bus& bus
	      , std::ostream& out_
	      );

	LogLevel level() const { return min_level; }
};

/* Throws `Watch::BadOption` for unknown names.  */
LogLevel log_level_from_string(std::string const& name);

}}

#endif /* !defined(WATCH_MOD_LOGGER_HPP) */
