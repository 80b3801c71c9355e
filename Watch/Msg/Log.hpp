#ifndef WATCH_MSG_LOG_HPP
#define WATCH_MSG_LOG_HPP

#include"Watch/log.hpp"
#include<string>

namespace Watch { namespace Msg {

/** struct Watch::Msg::Log
 *
 * @brief a log line raised by `Watch::log`.
 */
struct Log {
	Watch::LogLevel level;
	std::string message;
};

}}

#endif /* !defined(WATCH_MSG_LOG_HPP) */
