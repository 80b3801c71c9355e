#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Watch/BroadcasterIF.hpp"
#include"Watch/ChainIndexIF.hpp"
#include"Watch/MinedDepth.hpp"
#include"Watch/SpendGraphInspector.hpp"
#include"Watch/SweepStore.hpp"
#include"Watch/TowerListener.hpp"
#include"Watch/TowerSweeper.hpp"
#include"Watch/log.hpp"
#include<map>

namespace Watch {

class TowerSweeper::Impl {
private:
	S::Bus& bus;
	Watch::ChainIndexIF& index;
	Watch::BroadcasterIF& broadcaster;
	Watch::SweepStore& store;
	Watch::SpendGraphInspector& inspector;

	std::map<Bitcoin::OutPoint, TowerListener> listeners;

	struct Run {
		Bitcoin::OutPoint funding;
		SpenderMap spenders;
		bool keep_watching;
	};

	Ev::Io<void> leaves_loop( std::shared_ptr<Run> run
				, SpenderMap::const_iterator it
				) {
		if (it == run->spenders.end())
			return Ev::lift();
		auto next = it;
		++next;
		return leaf(run, it->first, it->second).then([this, run, next]() {
			return leaves_loop(run, next);
		});
	}

	Ev::Io<void> leaf( std::shared_ptr<Run> run
			 , Bitcoin::OutPoint const& prevout
			 , Bitcoin::TxId const& spender
			 ) {
		if (spender)
			return is_deeply_mined(index, spender).then([run](bool deep) {
				if (!deep)
					run->keep_watching = true;
				return Ev::lift();
			});
		return store.get_sweep_transactions( run->funding
						   , prevout
						   ).then([ this
							  , run
							  ](std::vector<Bitcoin::Tx> txs) {
			auto ptxs = std::make_shared<std::vector<Bitcoin::Tx>>(
				std::move(txs)
			);
			return broadcast_loop(run, ptxs, 0);
		});
	}

	Ev::Io<void>
	broadcast_loop( std::shared_ptr<Run> run
		      , std::shared_ptr<std::vector<Bitcoin::Tx>> txs
		      , std::size_t i
		      ) {
		if (i >= txs->size())
			return Ev::lift();
		run->keep_watching = true;
		return broadcast_or_log(run->funding, (*txs)[i]).then([ this
									, run
									, txs
									, i
									]() {
			return broadcast_loop(run, txs, i + 1);
		});
	}

public:
	Impl( S::Bus& bus_
	    , Watch::ChainIndexIF& index_
	    , Watch::BroadcasterIF& broadcaster_
	    , Watch::SweepStore& store_
	    , Watch::SpendGraphInspector& inspector_
	    ) : bus(bus_), index(index_), broadcaster(broadcaster_)
	      , store(store_), inspector(inspector_)
	      { }

	Ev::Io<bool>
	resolve_closing_tx(Bitcoin::OutPoint const& funding) {
		auto run = std::make_shared<Run>();
		run->funding = funding;
		run->keep_watching = false;
		return inspector.inspect(funding, 0).then([this, run
							  ](SpenderMap spenders) {
			run->spenders = std::move(spenders);
			return leaves_loop(run, run->spenders.begin());
		}).then([run]() {
			return Ev::lift(run->keep_watching);
		});
	}

	Ev::Io<void> retire(Bitcoin::OutPoint const& funding) {
		return store.retire(funding).then([this, funding]() {
			auto it = listeners.find(funding);
			if (it == listeners.end())
				return Ev::lift();
			auto done = it->second.done;
			listeners.erase(it);
			return done.set();
		});
	}

	Ev::Io<void> broadcast_or_log( Bitcoin::OutPoint const& funding
				     , Bitcoin::Tx const& tx
				     ) {
		auto ptx = std::make_shared<Bitcoin::Tx>(tx);
		auto txid = tx.get_txid();
		return index.get_tx_height(txid).then([ this
						      , funding
						      , ptx
						      , txid
						      ](TxMinedInfo info) {
			if (info.height != TxHeight::Local)
				return Ev::lift();
			return broadcaster.broadcast(*ptx).then([](Bitcoin::TxId) {
				return Ev::lift(true);
			}).catching<std::runtime_error>([ this
							, funding
							, txid
							](std::runtime_error const& e) {
				return Watch::log( bus, Info
						 , "broadcast failure: txid=%s, "
						   "funding_outpoint=%s: %s"
						 , std::string(txid).c_str()
						 , std::string(funding).c_str()
						 , e.what()
						 ).then([]() {
					return Ev::lift(false);
				});
			}).then([this, funding, ptx, txid](bool ok) {
				if (!ok)
					return Ev::lift();
				auto act = Watch::log( bus, Info
						     , "broadcast success: txid=%s, "
						       "funding_outpoint=%s"
						     , std::string(txid).c_str()
						     , std::string(funding).c_str()
						     );
				auto it = listeners.find(funding);
				if (it == listeners.end())
					return act;
				auto queue = it->second.broadcasts;
				return act + queue.put(*ptx);
			});
		});
	}

	TowerListener listen(Bitcoin::OutPoint const& funding) {
		return listeners[funding];
	}
};

TowerSweeper::TowerSweeper(TowerSweeper&&) =default;
TowerSweeper::~TowerSweeper() =default;

TowerSweeper::TowerSweeper( S::Bus& bus
			  , Watch::ChainIndexIF& index
			  , Watch::BroadcasterIF& broadcaster
			  , Watch::SweepStore& store
			  , Watch::SpendGraphInspector& inspector
			  ) : pimpl(Util::make_unique<Impl>( bus, index
							   , broadcaster
							   , store
							   , inspector
							   ))
			    { }

Ev::Io<bool>
TowerSweeper::resolve_closing_tx( Bitcoin::OutPoint const& funding_outpoint
				, Bitcoin::Tx const&
				) {
	return pimpl->resolve_closing_tx(funding_outpoint);
}
Ev::Io<void>
TowerSweeper::persist_channel_state(Watch::ChannelOnchainState const&) {
	return Ev::lift();
}
Ev::Io<void> TowerSweeper::retire(Bitcoin::OutPoint const& funding_outpoint) {
	return pimpl->retire(funding_outpoint);
}
Ev::Io<void> TowerSweeper::on_chain_tip() {
	return Ev::lift();
}
Ev::Io<void>
TowerSweeper::broadcast_or_log( Bitcoin::OutPoint const& funding_outpoint
			      , Bitcoin::Tx const& tx
			      ) {
	return pimpl->broadcast_or_log(funding_outpoint, tx);
}
Watch::TowerListener
TowerSweeper::listen(Bitcoin::OutPoint const& funding_outpoint) {
	return pimpl->listen(funding_outpoint);
}

}
