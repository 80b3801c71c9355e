#include"Bitcoin/OutPoint.hpp"
#include"Ev/Io.hpp"
#include"Watch/SweepStore.hpp"
#include"Watch/parse_options.hpp"
#include"Watch/store_command.hpp"
#include<set>
#include<utility>

namespace {

Bitcoin::OutPoint outpoint_arg(std::vector<std::string> const& args) {
	if (args.size() != 2)
		throw Watch::BadOption(args[0] + ": needs one outpoint");
	return Bitcoin::OutPoint(args[1]);
}

}

namespace Watch {

Ev::Io<int> store_command( Watch::SweepStore& store
			 , std::vector<std::string> const& args
			 , std::ostream& out
			 ) {
	return Ev::lift().then([&store, args, &out]() {
		if (args.empty())
			return Ev::lift(2);
		auto const& cmd = args[0];
		if (cmd == "list-channels")
			return store.list_channels().then([&out](std::vector<std::pair<Bitcoin::OutPoint, std::string>> lst) {
				for (auto const& c : lst)
					out << c.first << " " << c.second
					    << std::endl;
				return Ev::lift(0);
			});
		if (cmd == "list-sweeps")
			return store.list_sweep_outpoints().then([&out](std::set<Bitcoin::OutPoint> s) {
				for (auto const& o : s)
					out << o << std::endl;
				return Ev::lift(0);
			});
		if (cmd == "count-sweeps")
			return store.count_sweep_transactions(outpoint_arg(args)
							     ).then([&out](std::size_t n) {
				out << n << std::endl;
				return Ev::lift(0);
			});
		if (cmd == "forget")
			return store.retire(outpoint_arg(args)).then([]() {
				return Ev::lift(0);
			});
		return Ev::lift(2);
	});
}

}
