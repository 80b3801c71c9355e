#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Watch/BreachRemedy.hpp"
#include"Watch/ChainIndexIF.hpp"
#include"Watch/ChannelIF.hpp"
#include"Watch/ChannelOnchainState.hpp"
#include"Watch/LnWalletIF.hpp"
#include"Watch/MinedDepth.hpp"
#include"Watch/Msg/Option.hpp"
#include"Watch/SpendGraphInspector.hpp"
#include"Watch/SweepCandidate.hpp"
#include"Watch/isolate_failure.hpp"
#include"Watch/log.hpp"
#include"Watch/parse_options.hpp"

namespace Watch {

class BreachRemedy::Impl {
private:
	S::Bus& bus;
	Watch::ChainIndexIF& index;
	Watch::LnWalletIF& wallet;
	Watch::SpendGraphInspector& inspector;

	bool settle_onchain;

	void start() {
		bus.subscribe<Msg::Option
			     >([this](Msg::Option const& o) {
			if (o.name != "lnwatch-htlc-settle-onchain")
				return Ev::lift();
			settle_onchain = parse_flag(o);
			return Ev::lift();
		});
	}

	/* State of one resolve_closing_tx run.  */
	struct Run {
		std::shared_ptr<ChannelIF> chan;
		Bitcoin::Tx closing_tx;
		SweepCandidates candidates;
		bool keep_watching;
	};

	std::string name_of( Run const& run
			   , SweepCandidate const& cand
			   ) const {
		return cand.name + " " + run.chan->get_id_for_log();
	}

	Ev::Io<void> fold_not_deep( std::shared_ptr<Run> run
				  , Bitcoin::TxId const& txid
				  ) {
		return is_deeply_mined(index, txid).then([run](bool deep) {
			if (!deep)
				run->keep_watching = true;
			return Ev::lift();
		});
	}

	Ev::Io<void> candidates_loop( std::shared_ptr<Run> run
				    , SweepCandidates::const_iterator it
				    ) {
		if (it == run->candidates.end())
			return Ev::lift();
		auto next = it;
		++next;
		return candidate(run, it->first, it->second).then([this, run, next]() {
			return candidates_loop(run, next);
		});
	}

	Ev::Io<void> candidate( std::shared_ptr<Run> run
			      , Bitcoin::OutPoint const& prevout
			      , SweepCandidate const& cand
			      ) {
		return index.get_transaction(prevout.txid).then([ this
								, run
								, prevout
								, &cand
								](std::unique_ptr<Bitcoin::Tx> prev) {
			if (!prev) {
				run->keep_watching = true;
				return Watch::log( bus, Info
						 , "BreachRemedy: prevout does not "
						   "exist for %s: %s"
						 , name_of(*run, cand).c_str()
						 , std::string(prevout).c_str()
						 );
			}
			return inspector.get_spender(prevout).then([this
								   ](Bitcoin::TxId spender) {
				if (!spender)
					return Ev::lift(std::unique_ptr<Bitcoin::Tx>());
				return index.get_transaction(spender);
			}).then([ this
				, run
				, prevout
				, &cand
				](std::unique_ptr<Bitcoin::Tx> spender_tx) {
				if (!spender_tx) {
					run->keep_watching = true;
					return maybe_redeem(cand);
				}
				auto stx = std::shared_ptr<Bitcoin::Tx>(std::move(spender_tx));
				return spent_candidate(run, prevout, stx);
			});
		});
	}

	/* Someone, revoked or not, already spent the
	 * prevout.  */
	Ev::Io<void> spent_candidate( std::shared_ptr<Run> run
				    , Bitcoin::OutPoint const& prevout
				    , std::shared_ptr<Bitcoin::Tx> stx
				    ) {
		auto second = std::make_shared<SweepCandidates>(
			run->chan->maybe_sweep_htlcs(run->closing_tx, *stx)
		);
		return second_loop(run, second, second->begin())
		     + fold_not_deep(run, stx->get_txid())
		     + Ev::lift().then([run, prevout, stx]() {
			for (auto const& in : stx->inputs) {
				if (in.prevout() != prevout)
					continue;
				run->chan->extract_preimage_from_htlc_txin(in);
				break;
			}
			return Ev::lift();
		});
	}

	Ev::Io<void> second_loop( std::shared_ptr<Run> run
				, std::shared_ptr<SweepCandidates> second
				, SweepCandidates::const_iterator it
				) {
		if (it == second->end())
			return Ev::lift();
		auto next = it;
		++next;
		auto prevout = it->first;
		return inspector.get_spender(prevout).then([ this
							   , run
							   , it
							   ](Bitcoin::TxId spender) {
			if (spender)
				return fold_not_deep(run, spender);
			run->keep_watching = true;
			return maybe_redeem(it->second);
		}).then([this, run, second, next]() {
			return second_loop(run, second, next);
		});
	}

public:
	Impl( S::Bus& bus_
	    , Watch::ChainIndexIF& index_
	    , Watch::LnWalletIF& wallet_
	    , Watch::SpendGraphInspector& inspector_
	    ) : bus(bus_), index(index_), wallet(wallet_)
	      , inspector(inspector_)
	      , settle_onchain(false)
	      { start(); }

	Ev::Io<bool>
	resolve_closing_tx( Bitcoin::OutPoint const& funding
			  , Bitcoin::Tx const& closing_tx
			  ) {
		auto run = std::make_shared<Run>();
		run->closing_tx = closing_tx;
		auto act = Ev::lift().then([this, run, funding]() {
			run->chan = wallet.channel_by_txo(funding);
			if (!run->chan)
				return Ev::lift(false);

			run->candidates = run->chan->sweep_ctx(run->closing_tx);
			auto init = Ev::lift();
			if (run->candidates.empty())
				init = is_deeply_mined( index
						      , run->closing_tx.get_txid()
						      ).then([run](bool deep) {
					run->keep_watching = !deep;
					return Ev::lift();
				});
			else
				run->keep_watching = false;

			return init.then([this, run]() {
				return candidates_loop(run, run->candidates.begin());
			}).then([run]() {
				return Ev::lift(run->keep_watching);
			});
		});
		return isolate_failure(act, [this, funding](std::exception const& e) {
			return Watch::log( bus, Error
					 , "BreachRemedy: %s: %s"
					 , std::string(funding).c_str()
					 , e.what()
					 ).then([]() {
				return Ev::lift(true);
			});
		});
	}

	Ev::Io<void>
	persist_channel_state(ChannelOnchainState const& state) {
		auto act = Ev::lift().then([this, state]() {
			auto chan = wallet.channel_by_txo(state.funding_outpoint);
			if (!chan)
				return Ev::lift();
			chan->update_onchain_state(state);
			return wallet.handle_onchain_state(*chan).then([chan]() {
				return Ev::lift();
			});
		});
		return isolate_failure(act, [this, state](std::exception const& e) {
			return Watch::log( bus, Error
					 , "BreachRemedy: persist %s: %s"
					 , std::string(state.funding_outpoint).c_str()
					 , e.what()
					 );
		});
	}

	Ev::Io<void> retire(Bitcoin::OutPoint const& funding) {
		return Watch::log( bus, Info
				 , "BreachRemedy: %s settled."
				 , std::string(funding).c_str()
				 );
	}

	Ev::Io<void> on_chain_tip() {
		return Ev::lift().then([this]() {
			/* Revealed preimages and completed payments
			 * change what can be swept.  */
			for (auto const& chan : wallet.channels())
				chan->clear_sweep_cache();
			return Ev::lift();
		});
	}

	Ev::Io<void> maybe_redeem(SweepCandidate const& cand) {
		if (!cand.has_timelock() && !settle_onchain)
			return Watch::log( bus, Debug
					 , "BreachRemedy: not settling %s "
					   "onchain."
					 , cand.name.c_str()
					 );
		return wallet.add_sweep_info(cand);
	}
};

BreachRemedy::BreachRemedy(BreachRemedy&&) =default;
BreachRemedy::~BreachRemedy() =default;

BreachRemedy::BreachRemedy( S::Bus& bus
			  , Watch::ChainIndexIF& index
			  , Watch::LnWalletIF& wallet
			  , Watch::SpendGraphInspector& inspector
			  ) : pimpl(Util::make_unique<Impl>( bus, index, wallet
							   , inspector
							   ))
			    { }

Ev::Io<bool>
BreachRemedy::resolve_closing_tx( Bitcoin::OutPoint const& funding_outpoint
				, Bitcoin::Tx const& closing_tx
				) {
	return pimpl->resolve_closing_tx(funding_outpoint, closing_tx);
}
Ev::Io<void>
BreachRemedy::persist_channel_state(Watch::ChannelOnchainState const& state) {
	return pimpl->persist_channel_state(state);
}
Ev::Io<void> BreachRemedy::retire(Bitcoin::OutPoint const& funding_outpoint) {
	return pimpl->retire(funding_outpoint);
}
Ev::Io<void> BreachRemedy::on_chain_tip() {
	return pimpl->on_chain_tip();
}
Ev::Io<void> BreachRemedy::maybe_redeem(Watch::SweepCandidate const& candidate) {
	return pimpl->maybe_redeem(candidate);
}

}
