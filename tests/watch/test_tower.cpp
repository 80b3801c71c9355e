#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"FakeChain.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Watch/ChannelStatus.hpp"
#include"Watch/Mod/Tower.hpp"
#include"Watch/Msg/DbResource.hpp"
#include"Watch/Msg/Log.hpp"
#include"Watch/TowerListener.hpp"
#include<assert.h>

namespace {

struct Fixture {
	S::Bus bus;
	FakeChain::Index index;
	FakeChain::Broadcaster broadcaster;
	Watch::Mod::Tower tower;
	Sqlite3::Db db;

	std::vector<std::string> logs;

	explicit
	Fixture(Sqlite3::Db db_) : broadcaster(index)
				 , tower(bus, index, broadcaster)
				 , db(std::move(db_))
				 {
		bus.subscribe<Watch::Msg::Log
			     >([this](Watch::Msg::Log const& l) {
			logs.push_back(l.message);
			return Ev::lift();
		});
	}

	Ev::Io<void> init() {
		return bus.raise(Watch::Msg::DbResource{db});
	}

	Bitcoin::OutPoint fund(std::uint8_t tag) {
		auto ftx = FakeChain::make_tx( {Bitcoin::OutPoint(FakeChain::rep("aa", 32) + ":0")}
					     , {tag}
					     , tag
					     );
		return Bitcoin::OutPoint(index.add(ftx, 600000, 1000), 0);
	}
	std::size_t count_logs(std::string const& part) const {
		auto n = std::size_t(0);
		for (auto const& l : logs)
			if (l.find(part) != std::string::npos)
				++n;
		return n;
	}
};

/* A revoked commitment is answered with the stored
 * justice transactions, once.  */
Ev::Io<void> test_breach() {
	auto f = std::make_shared<Fixture>(Sqlite3::Db(":memory:"));
	auto funding = f->fund(0xf0);
	auto address = FakeChain::addr(0xf0);
	auto ctx = FakeChain::make_tx({funding}, {0xc0, 0xc1});
	auto c = ctx.get_txid();
	auto c0 = Bitcoin::OutPoint(c, 0);
	auto c1 = Bitcoin::OutPoint(c, 1);
	auto s0 = FakeChain::make_tx({c0}, {0x90});
	auto s1 = FakeChain::make_tx({c1}, {0x91});
	auto listener = std::make_shared<Watch::TowerListener>();

	return f->init().then([f]() {
		return f->tower.start_watching();
	}).then([f, funding, address]() {
		return f->tower.get_turn_number(funding, address);
	}).then([f, funding, address, c0, c1, s0, s1](std::uint64_t ctn) {
		assert(ctn == 0);
		assert(f->tower.is_watching(address));
		assert(f->count_logs("Tower: watching new channel") == 1);
		return f->tower.add_sweep_transaction(funding, 3, c0, s0)
		     + f->tower.add_sweep_transaction(funding, 3, c1, s1)
		     ;
	}).then([f, funding, address]() {
		/* Known channels are not announced again.  */
		return f->tower.get_turn_number(funding, address);
	}).then([f, funding, listener](std::uint64_t ctn) {
		assert(ctn == 3);
		assert(f->count_logs("Tower: watching new channel") == 1);
		*listener = f->tower.listen(funding);
		return f->tower.trigger();
	}).then([f, funding]() {
		/* Nothing happened onchain yet.  */
		assert(f->broadcaster.attempts == 0);
		assert(f->tower.status(funding) == Watch::ChannelStatus());
		return f->tower.count_stored_sweeps(funding);
	}).then([f, ctx](std::size_t n) {
		assert(n == 2);
		/* Breach.  */
		f->index.add(ctx, 600100, 1);
		return f->index.new_tip(f->bus, 600100);
	}).then([f, funding, listener, s0, s1]() {
		assert(f->tower.status(funding) == Watch::ChannelStatus::closed(1));
		assert(f->broadcaster.sent.size() == 2);
		assert(f->broadcaster.sent[0] == s0 || f->broadcaster.sent[0] == s1);
		assert(f->count_logs("broadcast success") == 2);
		assert(f->count_logs(std::string("funding_outpoint=") + std::string(funding)) == 2);
		assert(listener->broadcasts.size() == 2);
		assert(!listener->done.is_set());
		return f->index.new_tip(f->bus, 600101);
	}).then([f, ctx, s0, s1]() {
		/* Already in the mempool: not sent again.  */
		assert(f->broadcaster.attempts == 2);

		/* Justice confirmed and buried.  */
		f->index.set_height(ctx.get_txid(), 600100, 150);
		f->index.add(s0, 600102, 120);
		f->index.add(s1, 600102, 120);
		return f->index.new_tip(f->bus, 600250);
	}).then([f, funding, address, listener]() {
		assert(f->tower.status(funding) == Watch::ChannelStatus::closed_deep());
		assert(!f->tower.is_watching(address));
		assert(listener->done.is_set());
		assert(f->count_logs("unwatching") == 1);
		return f->tower.count_stored_sweeps(funding);
	}).then([f](std::size_t n) {
		assert(n == 0);
		return f->tower.list_channels();
	}).then([f](std::vector<std::pair<Bitcoin::OutPoint, std::string>> chans) {
		assert(chans.empty());
		return f->tower.list_stored_sweeps();
	}).then([f](std::set<Bitcoin::OutPoint> outs) {
		assert(outs.empty());
		return f->index.new_tip(f->bus, 600251);
	}).then([f]() {
		/* Retired exactly once.  */
		assert(f->count_logs("unwatching") == 1);
		assert(f->broadcaster.attempts == 2);
		return f->tower.stop();
	});
}

/* Rejected broadcasts are logged and retried on the next
 * event.  */
Ev::Io<void> test_rejected() {
	auto f = std::make_shared<Fixture>(Sqlite3::Db(":memory:"));
	auto funding = f->fund(0xf1);
	auto address = FakeChain::addr(0xf1);
	auto ctx = FakeChain::make_tx({funding}, {0xc2});
	auto c0 = Bitcoin::OutPoint(ctx.get_txid(), 0);
	auto s0 = FakeChain::make_tx({c0}, {0x92});
	f->broadcaster.reject = true;

	return f->init().then([f]() {
		return f->tower.start_watching();
	}).then([f, funding, address]() {
		return f->tower.get_turn_number(funding, address);
	}).then([f, funding, c0, s0, ctx](std::uint64_t) {
		f->index.add(ctx, 600100, 1);
		return f->tower.add_sweep_transaction(funding, 1, c0, s0);
	}).then([f]() {
		return f->tower.trigger();
	}).then([f, address]() {
		assert(f->broadcaster.attempts == 1);
		assert(f->broadcaster.sent.empty());
		assert(f->count_logs("broadcast failure") == 1);
		assert(f->count_logs("min relay fee not met") == 1);
		assert(f->tower.is_watching(address));
		return f->tower.trigger();
	}).then([f]() {
		assert(f->broadcaster.attempts == 2);
		f->broadcaster.reject = false;
		return f->tower.trigger();
	}).then([f]() {
		assert(f->broadcaster.attempts == 3);
		assert(f->broadcaster.sent.size() == 1);
		return f->tower.stop();
	});
}

/* Channels in the store are watched again after a
 * restart.  */
Ev::Io<void> test_restart() {
	auto db = Sqlite3::Db(":memory:");
	auto first = std::make_shared<Fixture>(db);
	auto funding = first->fund(0xf2);
	auto address = FakeChain::addr(0xf2);
	return first->init().then([first, funding, address]() {
		return first->tower.get_turn_number(funding, address);
	}).then([first, db, address](std::uint64_t) {
		auto second = std::make_shared<Fixture>(db);
		return second->init().then([second]() {
			return second->tower.start_watching();
		}).then([second, address]() {
			assert(second->tower.is_watching(address));
			return second->tower.list_channels();
		}).then([second, address](std::vector<std::pair<Bitcoin::OutPoint, std::string>> chans) {
			assert(chans.size() == 1);
			assert(chans[0].second == address);
			return second->tower.stop();
		});
	});
}

}

int main() {
	auto code = Ev::lift().then([]() {
		return test_breach();
	}).then([]() {
		return test_rejected();
	}).then([]() {
		return test_restart();
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
