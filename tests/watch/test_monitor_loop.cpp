#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"FakeChain.hpp"
#include"S/Bus.hpp"
#include"Watch/ChannelOnchainState.hpp"
#include"Watch/ChannelStatus.hpp"
#include"Watch/MinedDepth.hpp"
#include"Watch/MonitorLoop.hpp"
#include"Watch/Msg/IndexSynced.hpp"
#include"Watch/Msg/Log.hpp"
#include"Watch/Msg/TxVerified.hpp"
#include"Watch/ResolverIF.hpp"
#include"Watch/SpendGraphInspector.hpp"
#include<assert.h>
#include<stdexcept>

namespace {

class FakeResolver : public Watch::ResolverIF {
private:
	FakeChain::Index& index;

public:
	bool keep;
	/* Classify the closing transaction like the real
	 * resolvers do.  */
	bool check_depth;
	std::size_t resolves;
	std::size_t tips;
	std::vector<Watch::ChannelOnchainState> states;
	std::vector<Bitcoin::OutPoint> retired;
	/* resolve_closing_tx for this channel throws a
	 * std::out_of_range.  */
	Bitcoin::OutPoint out_of_range;
	/* Number of retire calls still to fail.  */
	std::size_t retire_failures;
	std::size_t retire_attempts;

	explicit
	FakeResolver(FakeChain::Index& index_)
		: index(index_), keep(true), check_depth(false)
		, resolves(0), tips(0)
		, retire_failures(0), retire_attempts(0)
		{ }

	Ev::Io<bool>
	resolve_closing_tx( Bitcoin::OutPoint const& funding
			  , Bitcoin::Tx const& closing_tx
			  ) override {
		++resolves;
		if (funding == out_of_range)
			throw std::out_of_range("map::at");
		if (!check_depth)
			return Ev::lift(keep);
		return Watch::is_deeply_mined(index, closing_tx.get_txid()).then([](bool deep) {
			return Ev::lift(!deep);
		});
	}
	Ev::Io<void>
	persist_channel_state(Watch::ChannelOnchainState const& st) override {
		states.push_back(st);
		return Ev::lift();
	}
	Ev::Io<void> retire(Bitcoin::OutPoint const& funding) override {
		++retire_attempts;
		if (retire_failures > 0) {
			--retire_failures;
			throw std::runtime_error("database is locked");
		}
		retired.push_back(funding);
		return Ev::lift();
	}
	Ev::Io<void> on_chain_tip() override {
		++tips;
		return Ev::lift();
	}
};

struct Fixture {
	S::Bus bus;
	FakeChain::Index index;
	Watch::ChannelStatusTracker tracker;
	Watch::SpendGraphInspector inspector;
	FakeResolver resolver;
	Watch::MonitorLoop loop;

	std::vector<std::string> logs;

	Fixture() : inspector(bus, index, tracker)
		  , resolver(index)
		  , loop(bus, index, resolver, inspector, tracker)
		  {
		bus.subscribe<Watch::Msg::Log
			     >([this](Watch::Msg::Log const& l) {
			logs.push_back(l.message);
			return Ev::lift();
		});
		loop.start();
	}

	Bitcoin::OutPoint fund(std::uint8_t tag) {
		auto ftx = FakeChain::make_tx( {Bitcoin::OutPoint(FakeChain::rep("aa", 32) + ":0")}
					     , {tag}
					     , tag
					     );
		return Bitcoin::OutPoint(index.add(ftx, 600000, 1000), 0);
	}
	Bitcoin::TxId close( Bitcoin::OutPoint const& funding
			   , std::int32_t confirmations
			   ) {
		auto ctx = FakeChain::make_tx({funding}, {0xc0});
		return index.add(ctx, 600100, confirmations);
	}
	bool logged(std::string const& part) const {
		for (auto const& l : logs)
			if (l.find(part) != std::string::npos)
				return true;
		return false;
	}
};

Ev::Io<void> test_track() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	auto b = f->fund(2);
	return f->loop.track(a, FakeChain::addr(1)).then([f, a]() {
		return f->loop.track(a, FakeChain::addr(1));
	}).then([f, b]() {
		assert(f->loop.count_tracked() == 1);
		assert(f->loop.is_tracked(FakeChain::addr(1)));
		assert(f->index.mine.count(FakeChain::addr(1)) == 1);
		/* Same address, different channel: replaced.  */
		return f->loop.track(b, FakeChain::addr(1));
	}).then([f]() {
		assert(f->loop.count_tracked() == 1);
		return f->loop.trigger();
	}).then([f, b]() {
		assert(f->resolver.states.size() == 1);
		assert(f->resolver.states[0].funding_outpoint == b);
		assert(!f->loop.is_tracked(FakeChain::addr(2)));
		assert(f->loop.status(b) == Watch::ChannelStatus());
		return Ev::lift();
	});
}

Ev::Io<void> test_open_channel() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	return f->loop.track(a, FakeChain::addr(1)).then([f]() {
		return f->loop.trigger();
	}).then([f, a]() {
		assert(f->resolver.resolves == 0);
		assert(f->resolver.states.size() == 1);
		auto const& st = f->resolver.states[0];
		assert(st.funding_outpoint == a);
		assert(st.funding_txid == a.txid);
		assert(st.funding_height.height == 600000);
		assert(!st.closing_txid);
		assert(st.closing_height.height == Watch::TxHeight::Local);
		assert(st.keep_watching);
		assert(f->loop.is_tracked(FakeChain::addr(1)));
		return Ev::lift();
	});
}

Ev::Io<void> test_gating() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	return f->loop.track(a, FakeChain::addr(1)).then([f]() {
		f->index.connected = false;
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.states.empty());
		assert(f->logged("synchronizer not set yet"));

		f->index.connected = true;
		f->index.up_to_date = false;
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.states.empty());

		f->index.up_to_date = true;
		f->index.mine.erase(FakeChain::addr(1));
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.states.empty());

		f->index.mine.insert(FakeChain::addr(1));
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.states.size() == 1);
		return Ev::lift();
	});
}

Ev::Io<void> test_close_and_retire() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	auto c = f->close(a, 3);
	f->resolver.keep = false;
	return f->loop.track(a, FakeChain::addr(1)).then([f]() {
		return f->loop.trigger();
	}).then([f, a, c]() {
		assert(f->resolver.resolves == 1);
		assert(f->resolver.states.size() == 1);
		assert(f->resolver.states[0].closing_txid == c);
		assert(f->resolver.states[0].closing_height.confirmations == 3);
		assert(!f->resolver.states[0].keep_watching);
		assert(f->resolver.retired.size() == 1);
		assert(f->resolver.retired[0] == a);
		assert(f->loop.count_tracked() == 0);
		assert(f->logged("unwatching"));
		return f->loop.trigger();
	}).then([f]() {
		/* Retired exactly once.  */
		assert(f->resolver.retired.size() == 1);
		assert(f->resolver.states.size() == 1);
		return Ev::lift();
	});
}

Ev::Io<void> test_closing_body_missing() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	auto ctx = FakeChain::make_tx({a}, {0xc0});
	f->index.add_without_body(ctx, 600100, 1);
	f->resolver.keep = false;
	return f->loop.track(a, FakeChain::addr(1)).then([f]() {
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.resolves == 0);
		assert(f->resolver.states.size() == 1);
		assert(f->resolver.states[0].keep_watching);
		assert(f->logged("still waiting for tx itself"));
		assert(f->loop.count_tracked() == 1);
		return Ev::lift();
	});
}

/* One channel failing does not stop the others.  */
Ev::Io<void> test_error_isolation() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	auto b = f->fund(2);
	f->index.broken.insert(a.txid);
	return f->loop.track(a, FakeChain::addr(1)).then([f, b]() {
		return f->loop.track(b, FakeChain::addr(2));
	}).then([f]() {
		return f->loop.trigger();
	}).then([f, b]() {
		assert(f->resolver.states.size() == 1);
		assert(f->resolver.states[0].funding_outpoint == b);
		assert(f->logged("index unreachable"));
		assert(f->loop.count_tracked() == 2);
		return Ev::lift();
	});
}

Ev::Io<void> test_any_exception_isolated() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	auto b = f->fund(2);
	f->close(a, 200);
	f->close(b, 200);
	f->resolver.keep = false;
	f->resolver.out_of_range = a;
	return f->loop.track(a, FakeChain::addr(1)).then([f, b]() {
		return f->loop.track(b, FakeChain::addr(2));
	}).then([f]() {
		return f->loop.trigger();
	}).then([f, b]() {
		assert(f->resolver.resolves == 2);
		assert(f->logged("map::at"));
		assert(f->resolver.retired.size() == 1);
		assert(f->resolver.retired[0] == b);
		assert(f->loop.is_tracked(FakeChain::addr(1)));
		assert(!f->loop.is_tracked(FakeChain::addr(2)));
		return Ev::lift();
	});
}

Ev::Io<void> test_failed_retire_is_retried() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	f->close(a, 200);
	f->resolver.keep = false;
	f->resolver.retire_failures = 1;
	return f->loop.track(a, FakeChain::addr(1)).then([f]() {
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.retire_attempts == 1);
		assert(f->resolver.retired.empty());
		assert(f->logged("database is locked"));
		assert(!f->logged("unwatching"));
		assert(f->loop.count_tracked() == 1);
		return f->loop.trigger();
	}).then([f, a]() {
		assert(f->resolver.retire_attempts == 2);
		assert(f->resolver.retired.size() == 1);
		assert(f->resolver.retired[0] == a);
		assert(f->logged("unwatching"));
		assert(f->loop.count_tracked() == 0);
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.retire_attempts == 2);
		return Ev::lift();
	});
}

/* Impossible chain data is a defect, not a channel error.  */
Ev::Io<void> test_defect_propagates() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	auto c = f->close(a, 0);
	f->index.set_height(c, -7, 0);
	f->resolver.check_depth = true;
	return f->loop.track(a, FakeChain::addr(1)).then([f]() {
		return f->loop.trigger().then([]() {
			return Ev::lift(false);
		}).catching<std::logic_error>([](std::logic_error const&) {
			return Ev::lift(true);
		});
	}).then([f](bool defect) {
		assert(defect);
		assert(f->resolver.states.empty());
		/* The semaphore was released.  */
		f->resolver.check_depth = false;
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.states.size() == 1);
		return Ev::lift();
	});
}

Ev::Io<void> test_events_and_stop() {
	auto f = std::make_shared<Fixture>();
	auto a = f->fund(1);
	auto other = std::make_shared<FakeChain::Index>();
	return f->loop.track(a, FakeChain::addr(1)).then([f]() {
		return f->index.new_tip(f->bus, 700000);
	}).then([f]() {
		assert(f->resolver.tips == 1);
		assert(f->resolver.states.size() == 1);
		return f->bus.raise(Watch::Msg::TxVerified{&f->index, Bitcoin::TxId()});
	}).then([f]() {
		assert(f->resolver.states.size() == 2);
		return f->bus.raise(Watch::Msg::IndexSynced{&f->index});
	}).then([f, other]() {
		assert(f->resolver.states.size() == 3);
		/* Another index's events are ignored.  */
		return other->new_tip(f->bus, 700001)
		     + f->bus.raise(Watch::Msg::IndexSynced{other.get()});
	}).then([f]() {
		assert(f->resolver.tips == 1);
		assert(f->resolver.states.size() == 3);
		return f->loop.stop();
	}).then([f]() {
		return f->index.new_tip(f->bus, 700002)
		     + f->bus.raise(Watch::Msg::IndexSynced{&f->index})
		     + Ev::yield(5);
	}).then([f]() {
		assert(f->resolver.tips == 1);
		assert(f->resolver.states.size() == 3);
		/* Explicit passes after stop do nothing either.  */
		return f->loop.trigger();
	}).then([f]() {
		assert(f->resolver.states.size() == 3);
		return Ev::lift();
	});
}

}

int main() {
	auto code = Ev::lift().then([]() {
		return test_track();
	}).then([]() {
		return test_open_channel();
	}).then([]() {
		return test_gating();
	}).then([]() {
		return test_close_and_retire();
	}).then([]() {
		return test_closing_body_missing();
	}).then([]() {
		return test_error_isolation();
	}).then([]() {
		return test_any_exception_isolated();
	}).then([]() {
		return test_failed_retire_is_retried();
	}).then([]() {
		return test_defect_propagates();
	}).then([]() {
		return test_events_and_stop();
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
