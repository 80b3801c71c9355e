#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Watch/ChainIndexIF.hpp"
#include"Watch/ChannelOnchainState.hpp"
#include"Watch/MonitorLoop.hpp"
#include"Watch/Msg/ChainTip.hpp"
#include"Watch/Msg/IndexSynced.hpp"
#include"Watch/Msg/TxVerified.hpp"
#include"Watch/ResolverIF.hpp"
#include"Watch/SpendGraphInspector.hpp"
#include"Watch/isolate_failure.hpp"
#include"Watch/log.hpp"
#include"Watch/random_engine.hpp"
#include<algorithm>
#include<map>
#include<utility>
#include<vector>

namespace Watch {

class MonitorLoop::Impl {
private:
	S::Bus& bus;
	Watch::ChainIndexIF& index;
	Watch::ResolverIF& resolver;
	Watch::SpendGraphInspector& inspector;
	Watch::ChannelStatusTracker const& tracker;

	/* Address to funding outpoint.  */
	std::map<std::string, Bitcoin::OutPoint> channels;

	Ev::Semaphore sem;
	bool stopped;
	std::vector<S::Subscription> subs;

	typedef std::vector<std::pair<std::string, Bitcoin::OutPoint>> Order;

	Ev::Io<void> pass() {
		return Ev::lift().then([this]() {
			if (stopped)
				return Ev::lift();
			if (!index.is_connected())
				return Watch::log( bus, Info
						 , "MonitorLoop: synchronizer "
						   "not set yet."
						 );
			auto order = std::make_shared<Order>( channels.begin()
							    , channels.end()
							    );
			std::shuffle(order->begin(), order->end(), random_engine);
			return pass_loop(order, 0);
		});
	}
	Ev::Io<void> pass_loop(std::shared_ptr<Order> order, std::size_t i) {
		if (i >= order->size())
			return Ev::lift();
		auto address = (*order)[i].first;
		auto funding = (*order)[i].second;
		auto next = [this, order, i]() {
			return pass_loop(order, i + 1);
		};
		/* Untracked earlier in this pass?  */
		auto it = channels.find(address);
		if (it == channels.end() || it->second != funding)
			return Ev::lift().then(next);
		return isolate_failure( check_channel(address, funding)
				      , [this, funding](std::exception const& e) {
			return Watch::log( bus, Error
					 , "MonitorLoop: %s: %s"
					 , std::string(funding).c_str()
					 , e.what()
					 );
		}).then(next);
	}

	Ev::Io<void> check_channel( std::string const& address
				  , Bitcoin::OutPoint const& funding
				  ) {
		return index.is_mine(address).then([ this
						   , address
						   , funding
						   ](bool mine) {
			if (!mine)
				return Ev::lift();
			/* Addresses registered by the inspector are
			 * still being fetched.  */
			if (!index.is_up_to_date())
				return Ev::lift();
			return evaluate(address, funding);
		});
	}

	Ev::Io<void> evaluate( std::string const& address
			     , Bitcoin::OutPoint const& funding
			     ) {
		auto st = std::make_shared<ChannelOnchainState>();
		st->funding_outpoint = funding;
		st->funding_txid = funding.txid;
		return index.get_tx_height(funding.txid).then([ this
							      , st
							      ](TxMinedInfo info) {
			st->funding_height = info;
			return inspector.get_spender(st->funding_outpoint);
		}).then([this, st](Bitcoin::TxId closing) {
			st->closing_txid = closing;
			if (!closing)
				return Ev::lift(TxMinedInfo());
			return index.get_tx_height(closing);
		}).then([this, st](TxMinedInfo info) {
			st->closing_height = info;
			if (!st->closing_txid)
				return Ev::lift(true);
			return resolve(*st);
		}).then([this, st](bool keep_watching) {
			st->keep_watching = keep_watching;
			return resolver.persist_channel_state(*st);
		}).then([this, st, address]() {
			if (st->keep_watching)
				return Ev::lift();
			return unwatch(address, st->funding_outpoint);
		});
	}

	Ev::Io<bool> resolve(ChannelOnchainState const& st) {
		auto funding = st.funding_outpoint;
		auto closing = st.closing_txid;
		return index.get_transaction(closing).then([ this
							   , funding
							   , closing
							   ](std::unique_ptr<Bitcoin::Tx> ptx) {
			if (!ptx)
				return Watch::log( bus, Info
						 , "MonitorLoop: channel %s "
						   "closed by %s. still waiting "
						   "for tx itself..."
						 , std::string(funding).c_str()
						 , std::string(closing).c_str()
						 ).then([]() {
					return Ev::lift(true);
				});
			auto tx = std::shared_ptr<Bitcoin::Tx>(std::move(ptx));
			return resolver.resolve_closing_tx( funding
							  , *tx
							  ).then([tx](bool keep) {
				return Ev::lift(keep);
			});
		});
	}

	Ev::Io<void> unwatch( std::string const& address
			    , Bitcoin::OutPoint const& funding
			    ) {
		auto it = channels.find(address);
		if (it == channels.end() || it->second != funding)
			return Ev::lift();
		/* Stays tracked, and is retried next pass, if
		 * retirement fails.  */
		return resolver.retire(funding).then([this, address, funding]() {
			auto it = channels.find(address);
			if (it != channels.end() && it->second == funding)
				channels.erase(it);
			return Watch::log( bus, Info
					 , "MonitorLoop: unwatching %s"
					 , std::string(funding).c_str()
					 );
		});
	}

	S::Subscription subscribe_trigger_tip() {
		return bus.subscribe<Msg::ChainTip
				    >([this](Msg::ChainTip const& m) {
			if (m.index != &index || stopped)
				return Ev::lift();
			return resolver.on_chain_tip() + trigger();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Watch::ChainIndexIF& index_
	    , Watch::ResolverIF& resolver_
	    , Watch::SpendGraphInspector& inspector_
	    , Watch::ChannelStatusTracker const& tracker_
	    ) : bus(bus_), index(index_), resolver(resolver_)
	      , inspector(inspector_), tracker(tracker_)
	      , sem(1), stopped(false)
	      { }

	void start() {
		if (!subs.empty())
			return;
		stopped = false;
		subs.push_back(subscribe_trigger_tip());
		subs.push_back(bus.subscribe<Msg::TxVerified
					    >([this](Msg::TxVerified const& m) {
			if (m.index != &index || stopped)
				return Ev::lift();
			return trigger();
		}));
		subs.push_back(bus.subscribe<Msg::IndexSynced
					    >([this](Msg::IndexSynced const& m) {
			if (m.index != &index || stopped)
				return Ev::lift();
			return trigger();
		}));
	}

	Ev::Io<void> track( Bitcoin::OutPoint const& funding
			  , std::string const& address
			  ) {
		return Ev::lift().then([this, funding, address]() {
			auto it = channels.find(address);
			if (it == channels.end())
				channels.emplace(address, funding);
			else if (it->second != funding)
				it->second = funding;
			return index.add_address(address);
		});
	}
	bool is_tracked(std::string const& address) const {
		return channels.find(address) != channels.end();
	}
	std::size_t count_tracked() const {
		return channels.size();
	}

	ChannelStatus status(Bitcoin::OutPoint const& funding) const {
		return tracker.get(funding);
	}

	Ev::Io<void> trigger() {
		return sem.run(pass());
	}

	Ev::Io<void> stop() {
		return Ev::lift().then([this]() {
			stopped = true;
			for (auto& s : subs)
				s.cancel();
			subs.clear();
			/* Wait out any pass in progress.  */
			return sem.run(Ev::lift());
		});
	}
};

MonitorLoop::MonitorLoop(MonitorLoop&&) =default;
MonitorLoop::~MonitorLoop() =default;

MonitorLoop::MonitorLoop( S::Bus& bus
			, Watch::ChainIndexIF& index
			, Watch::ResolverIF& resolver
			, Watch::SpendGraphInspector& inspector
			, Watch::ChannelStatusTracker const& tracker
			) : pimpl(Util::make_unique<Impl>( bus, index, resolver
							 , inspector, tracker
							 ))
			  { }

void MonitorLoop::start() { pimpl->start(); }

Ev::Io<void> MonitorLoop::track( Bitcoin::OutPoint const& funding_outpoint
			       , std::string const& address
			       ) {
	return pimpl->track(funding_outpoint, address);
}
bool MonitorLoop::is_tracked(std::string const& address) const {
	return pimpl->is_tracked(address);
}
std::size_t MonitorLoop::count_tracked() const {
	return pimpl->count_tracked();
}
Watch::ChannelStatus
MonitorLoop::status(Bitcoin::OutPoint const& funding_outpoint) const {
	return pimpl->status(funding_outpoint);
}
Ev::Io<void> MonitorLoop::trigger() { return pimpl->trigger(); }
Ev::Io<void> MonitorLoop::stop() { return pimpl->stop(); }

}
