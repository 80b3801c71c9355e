#undef NDEBUG
#include"Watch/parse_options.hpp"
#include<assert.h>
#include<string>
#include<vector>

namespace {

/* Keeps the strings alive for argv.  */
struct Args {
	std::vector<std::string> strs;
	std::vector<char*> ptrs;

	Args(std::vector<std::string> strs_) : strs(std::move(strs_)) {
		for (auto& s : strs)
			ptrs.push_back(&s[0]);
		ptrs.push_back(nullptr);
	}
	int argc() const { return int(strs.size()); }
	char** argv() { return &ptrs[0]; }
};

bool rejected(std::vector<std::string> strs) {
	auto args = Args(std::move(strs));
	auto rest = int();
	try {
		Watch::parse_options(args.argc(), args.argv(), rest);
	} catch (Watch::BadOption const& e) {
		assert(std::string(e.what()).find("Watch::BadOption: ") == 0);
		return true;
	}
	return false;
}

bool flag(std::string const& value) {
	return Watch::parse_flag(Watch::Msg::Option{"lnwatch-htlc-settle-onchain", value});
}

}

int main() {
	{
		auto args = Args({ "lnwatch-store"
				 , "--lnwatch-network=testnet"
				 , "--lnwatch-htlc-settle-onchain"
				 , "--lnwatch-tower-db=/tmp/x.db"
				 , "list-channels"
				 , "--lnwatch-network=regtest"
				 });
		auto rest = int();
		auto opts = Watch::parse_options(args.argc(), args.argv(), rest);
		assert(opts.size() == 3);
		assert(opts[0].name == "lnwatch-network");
		assert(opts[0].value == "testnet");
		assert(opts[1].name == "lnwatch-htlc-settle-onchain");
		assert(opts[1].value == "true");
		assert(opts[2].value == "/tmp/x.db");
		/* Stops at the command.  */
		assert(rest == 4);
	}
	{
		auto args = Args({ "lnwatch-store"
				 , "--lnwatch-log-level=debug"
				 , "--"
				 , "--lnwatch-network=regtest"
				 });
		auto rest = int();
		auto opts = Watch::parse_options(args.argc(), args.argv(), rest);
		assert(opts.size() == 1);
		assert(rest == 3);
	}
	{
		auto args = Args({"lnwatch-store"});
		auto rest = int();
		auto opts = Watch::parse_options(args.argc(), args.argv(), rest);
		assert(opts.empty());
		assert(rest == 1);
	}
	{
		/* An empty value is still a value.  */
		auto args = Args({"lnwatch-store", "--lnwatch-tower-db="});
		auto rest = int();
		auto opts = Watch::parse_options(args.argc(), args.argv(), rest);
		assert(opts.size() == 1);
		assert(opts[0].value == "");
	}

	assert(rejected({"lnwatch-store", "--lnwatch-bogus=1"}));
	assert(rejected({"lnwatch-store", "--lnwatch-network"}));
	assert(!rejected({"lnwatch-store", "-lnwatch-network"}));

	assert(flag("true") && flag("yes") && flag("on") && flag("1"));
	assert(!flag("false") && !flag("no") && !flag("off") && !flag("0"));
	auto bad = false;
	try {
		flag("maybe");
	} catch (std::invalid_argument const&) {
		bad = true;
	}
	assert(bad);

	return 0;
}
