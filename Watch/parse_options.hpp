#ifndef WATCH_PARSE_OPTIONS_HPP
#define WATCH_PARSE_OPTIONS_HPP

#include"Util/BacktraceException.hpp"
#include"Watch/Msg/Option.hpp"
#include<stdexcept>
#include<string>
#include<vector>

namespace Watch {

struct BadOption : public Util::BacktraceException<std::invalid_argument> {
	BadOption(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Watch::BadOption: " + msg
		  ) { }
};

/** Watch::parse_options
 *
 * @brief turns `--name=value` and `--name` arguments
 * into options, in the order given.
 *
 * @desc Parsing stops at the first argument that does
 * not start with `--`, or just after a bare `--`; the
 * index of the first unparsed argument is stored in
 * `rest`.
 * Throws `Watch::BadOption` for unknown names or
 * missing values.
 */
std::vector<Msg::Option>
parse_options(int argc, char** argv, int& rest);

/* Accepts true/false, yes/no, on/off and 1/0.
 * Throws `Watch::BadOption`.  */
bool parse_flag(Msg::Option const& o);

}

#endif /* !defined(WATCH_PARSE_OPTIONS_HPP) */
