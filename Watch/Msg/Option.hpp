#ifndef WATCH_MSG_OPTION_HPP
#define WATCH_MSG_OPTION_HPP

#include<string>

namespace Watch { namespace Msg {

/** struct Watch::Msg::Option
 *
 * @brief the value of a configuration option.
 *
 * @desc raised at startup, once per option given.
 * Each module checks `name` against the options it
 * owns and ignores the rest.
 * Flag options given without a value arrive as "true".
 */
struct Option {
	std::string name;
	std::string value;
};

}}

#endif /* !defined(WATCH_MSG_OPTION_HPP) */
