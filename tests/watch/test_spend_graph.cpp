#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"FakeChain.hpp"
#include"S/Bus.hpp"
#include"Watch/ChannelStatus.hpp"
#include"Watch/Msg/Option.hpp"
#include"Watch/SpendGraphInspector.hpp"
#include<assert.h>

namespace {

auto const preimage_hex = FakeChain::rep("ab", 32);

struct Fixture {
	S::Bus bus;
	FakeChain::Index index;
	Watch::ChannelStatusTracker tracker;
	Watch::SpendGraphInspector inspector;

	Bitcoin::OutPoint funding;

	Fixture() : inspector(bus, index, tracker) {
		auto ftx = FakeChain::make_tx( {Bitcoin::OutPoint(FakeChain::rep("aa", 32) + ":0")}
					     , {0xf0}
					     );
		funding = Bitcoin::OutPoint(index.add(ftx, 600000, 1000), 0);
	}
};

/* Never spent.  */
Ev::Io<void> test_open() {
	auto f = std::make_shared<Fixture>();
	return f->inspector.inspect(f->funding).then([f](Watch::SpenderMap m) {
		assert(m.size() == 1);
		assert(m.count(f->funding) == 1);
		assert(!m[f->funding]);
		assert(f->tracker.get(f->funding) == Watch::ChannelStatus::open());
		assert(std::string(f->tracker.get(f->funding)) == "open");
		return f->inspector.get_spender(f->funding);
	}).then([](Bitcoin::TxId spender) {
		assert(!spender);
		return Ev::lift();
	});
}

/* Commitment, then first-stage HTLC, then its sweep.  */
Ev::Io<void> test_htlc_chain() {
	auto f = std::make_shared<Fixture>();
	auto& index = f->index;
	/* Output 0 is ours, output 1 is the counterparty's.  */
	index.mine.insert(FakeChain::addr(0xc0));
	auto ctx = FakeChain::make_tx({f->funding}, {0xc0, 0xc1});
	auto c = index.add(ctx, 600100, 5);
	index.mine.insert(FakeChain::addr(0xd0));
	auto htx = FakeChain::make_htlc_success_tx( Bitcoin::OutPoint(c, 0)
						  , {0xd0}
						  , preimage_hex
						  );
	auto h = index.add(htx, 600101, 4);
	index.mine.insert(FakeChain::addr(0xe0));
	auto stx = FakeChain::make_tx({Bitcoin::OutPoint(h, 0)}, {0xe0, 0xe1});
	auto s = index.add(stx, 600102, 3);

	return f->inspector.inspect(f->funding).then([f, c, h, s](Watch::SpenderMap m) {
		assert(m.size() == 3);
		assert(m[f->funding] == c);
		assert(m[Bitcoin::OutPoint(c, 0)] == h);
		assert(m[Bitcoin::OutPoint(h, 0)] == s);
		/* Unknown addresses are handed to the index.  */
		assert(f->index.was_added(FakeChain::addr(0xc1)));
		assert(f->index.was_added(FakeChain::addr(0xe1)));
		assert(!f->index.was_added(FakeChain::addr(0xc0)));
		/* Depth limit: the sweep's own outputs are not
		 * followed.  */
		assert(m.count(Bitcoin::OutPoint(s, 0)) == 0);

		auto st = f->tracker.get(f->funding);
		assert(st == Watch::ChannelStatus::closed(5));
		assert(std::string(st) == "closed (5)");

		/* Now buried.  */
		f->index.set_height(c, 600100, 101);
		return f->inspector.inspect(f->funding);
	}).then([f](Watch::SpenderMap) {
		assert(f->tracker.get(f->funding) == Watch::ChannelStatus::closed_deep());
		assert(std::string(f->tracker.get(f->funding)) == "closed (deep)");
		return Ev::lift();
	});
}

/* Second-depth spender that is not an HTLC transaction.  */
Ev::Io<void> test_not_htlc() {
	auto f = std::make_shared<Fixture>();
	auto& index = f->index;
	index.mine.insert(FakeChain::addr(0xc0));
	auto ctx = FakeChain::make_tx({f->funding}, {0xc0, 0xc1});
	auto c = index.add(ctx, 600100, 5);
	/* A plain spend.  */
	auto ptx = FakeChain::make_tx({Bitcoin::OutPoint(c, 0)}, {0xd1});
	auto p = index.add(ptx, 600101, 4);

	return f->inspector.inspect(f->funding).then([f, c, p](Watch::SpenderMap m) {
		assert(m.size() == 2);
		assert(m[f->funding] == c);
		assert(m[Bitcoin::OutPoint(c, 0)] == p);
		assert(m.count(Bitcoin::OutPoint(p, 0)) == 0);
		/* Outputs of the plain spend are left alone.  */
		assert(!f->index.was_added(FakeChain::addr(0xd1)));
		assert(f->index.was_added(FakeChain::addr(0xc1)));
		return Ev::lift();
	});
}

/* Local-only and future spenders do not count.  */
Ev::Io<void> test_local_spender() {
	auto f = std::make_shared<Fixture>();
	auto ctx = FakeChain::make_tx({f->funding}, {0xc0});
	auto c = f->index.add(ctx, Watch::TxHeight::Local, 0);
	return f->inspector.inspect(f->funding).then([f, c](Watch::SpenderMap m) {
		assert(m.size() == 1);
		assert(!m[f->funding]);
		assert(f->tracker.get(f->funding) == Watch::ChannelStatus::open());

		f->index.set_height(c, Watch::TxHeight::Future, 0);
		return f->inspector.get_spender(f->funding);
	}).then([f, c](Bitcoin::TxId spender) {
		assert(!spender);

		/* Once broadcast it counts.  */
		f->index.set_height(c, Watch::TxHeight::Unconfirmed, 0);
		return f->inspector.get_spender(f->funding);
	}).then([f, c](Bitcoin::TxId spender) {
		assert(spender == c);
		/* get_spender registers the spender's outputs.  */
		assert(f->index.was_added(FakeChain::addr(0xc0)));
		return f->inspector.inspect(f->funding);
	}).then([f](Watch::SpenderMap) {
		assert(f->tracker.get(f->funding) == Watch::ChannelStatus::closed(0));
		return Ev::lift();
	});
}

/* Spender known, body not yet fetched.  */
Ev::Io<void> test_missing_body() {
	auto f = std::make_shared<Fixture>();
	auto ctx = FakeChain::make_tx({f->funding}, {0xc0});
	auto c = f->index.add_without_body(ctx, 600100, 2);
	return f->inspector.inspect(f->funding).then([f, c](Watch::SpenderMap m) {
		assert(m.size() == 1);
		assert(m[f->funding] == c);
		assert(f->tracker.get(f->funding) == Watch::ChannelStatus::closed(2));
		return f->inspector.get_spender(f->funding);
	}).then([c](Bitcoin::TxId spender) {
		assert(spender == c);
		return Ev::lift();
	});
}

Ev::Io<void> test_network_option() {
	auto f = std::make_shared<Fixture>();
	assert(f->inspector.network() == Bitcoin::Mainnet);
	return f->bus.raise(Watch::Msg::Option{"lnwatch-network", "regtest"}).then([f]() {
		assert(f->inspector.network() == Bitcoin::Regtest);
		/* Other options are ignored.  */
		return f->bus.raise(Watch::Msg::Option{"lnwatch-log-level", "debug"});
	}).then([f]() {
		assert(f->inspector.network() == Bitcoin::Regtest);
		return Ev::lift();
	});
}

}

int main() {
	auto code = Ev::lift().then([]() {
		return test_open();
	}).then([]() {
		return test_htlc_chain();
	}).then([]() {
		return test_not_htlc();
	}).then([]() {
		return test_local_spender();
	}).then([]() {
		return test_missing_body();
	}).then([]() {
		return test_network_option();
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
