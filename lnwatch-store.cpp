#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Watch/Mod/Logger.hpp"
#include"Watch/Msg/DbResource.hpp"
#include"Watch/Msg/Option.hpp"
#include"Watch/SweepStore.hpp"
#include"Watch/parse_options.hpp"
#include"Watch/store_command.hpp"
#include<iostream>
#include<memory>
#include<string>
#include<vector>

namespace {

auto const default_db = std::string("watchtower_db");

void usage() {
	std::cerr
		<< "Usage: lnwatch-store [options] <command> [args]" << std::endl
		<< std::endl
		<< "Commands:" << std::endl
		<< "  list-channels            channels the tower watches" << std::endl
		<< "  list-sweeps              funding outpoints with sweeps" << std::endl
		<< "  count-sweeps <outpoint>  sweeps stored for a channel" << std::endl
		<< "  forget <outpoint>        drop a channel and its sweeps" << std::endl
		<< std::endl
		<< "Options:" << std::endl
		<< "  --lnwatch-tower-db=<file>  default " << default_db << std::endl
		<< "  --lnwatch-log-level=<level>" << std::endl
		;
}

class Main {
private:
	S::Bus bus;
	Watch::Mod::Logger logger;
	Watch::SweepStore store;

	std::vector<Watch::Msg::Option> options;
	std::vector<std::string> args;

	Ev::Io<void> raise_options(std::size_t i) {
		if (i >= options.size())
			return Ev::lift();
		return bus.raise(options[i]).then([this, i]() {
			return raise_options(i + 1);
		});
	}

	Ev::Io<int> command() {
		return Watch::store_command(store, args, std::cout).then([](int ec) {
			if (ec == 2)
				usage();
			return Ev::lift(ec);
		});
	}

public:
	Main() : bus(), logger(bus, std::cerr), store(bus) { }

	Ev::Io<int> run(int argc, char** argv) {
		return Ev::lift().then([this, argc, argv]() {
			auto rest = 0;
			options = Watch::parse_options(argc, argv, rest);
			for (auto i = rest; i < argc; ++i)
				args.push_back(argv[i]);
			if (args.empty()) {
				usage();
				return Ev::lift(2);
			}

			auto path = default_db;
			for (auto const& o : options)
				if (o.name == "lnwatch-tower-db")
					path = o.value;

			return raise_options(0).then([this, path]() {
				return bus.raise(Watch::Msg::DbResource{
					Sqlite3::Db(path)
				});
			}).then([this]() {
				return command();
			});
		}).catching<std::invalid_argument>([](std::invalid_argument const& e) {
			std::cerr << "lnwatch-store: " << e.what() << std::endl;
			return Ev::lift(2);
		});
	}
};

}

int main(int argc, char** argv) {
	auto main_obj = std::make_shared<Main>();
	auto code = main_obj->run(argc, argv).then([main_obj](int ec) {
		/* Ensures main_obj is alive!  */
		return Ev::lift(ec);
	});
	return Ev::start(code);
}
