#include"Watch/parse_options.hpp"

namespace {

struct Known {
	char const* name;
	/* Can be given without a value.  */
	bool flag;
};
Known const known[] = {
	{"lnwatch-network", false},
	{"lnwatch-htlc-settle-onchain", true},
	{"lnwatch-log-level", false},
	{"lnwatch-tower-db", false}
};

Known const* find_known(std::string const& name) {
	for (auto const& k : known)
		if (name == k.name)
			return &k;
	return nullptr;
}

}

namespace Watch {

std::vector<Msg::Option>
parse_options(int argc, char** argv, int& rest) {
	auto ret = std::vector<Msg::Option>();
	auto i = 1;
	for (; i < argc; ++i) {
		auto arg = std::string(argv[i]);
		if (arg == "--") {
			++i;
			break;
		}
		if (arg.size() < 2 || arg.substr(0, 2) != "--")
			break;
		arg = arg.substr(2);

		auto eq = arg.find('=');
		auto name = arg.substr(0, eq);
		auto k = find_known(name);
		if (!k)
			throw BadOption("unknown option --" + name);

		auto value = std::string();
		if (eq == std::string::npos) {
			if (!k->flag)
				throw BadOption("--" + name + " needs a value");
			value = "true";
		} else
			value = arg.substr(eq + 1);

		ret.push_back(Msg::Option{std::move(name), std::move(value)});
	}
	rest = i;
	return ret;
}

bool parse_flag(Msg::Option const& o) {
	auto const& v = o.value;
	if (v == "true" || v == "yes" || v == "on" || v == "1")
		return true;
	if (v == "false" || v == "no" || v == "off" || v == "0")
		return false;
	throw BadOption("--" + o.name + ": not a flag value: " + v);
}

}
