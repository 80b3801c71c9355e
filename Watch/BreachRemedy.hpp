#ifndef WATCH_BREACHREMEDY_HPP
#define WATCH_BREACHREMEDY_HPP

#include"Watch/ResolverIF.hpp"
#include<memory>

namespace S { class Bus; }
namespace Watch { class ChainIndexIF; }
namespace Watch { class LnWalletIF; }
namespace Watch { class SpendGraphInspector; }
namespace Watch { struct SweepCandidate; }

namespace Watch {

/** class Watch::BreachRemedy
 *
 * @brief resolves closes of channels we are a party to,
 * asking each channel for the sweeps its keys allow.
 *
 * @desc Sweeps are handed to the wallet's pending-sweep
 * queue, which does the actual fee-bumped broadcast.
 *
 * `resolve_closing_tx` logs any `std::runtime_error`
 * and keeps watching the channel; it lets
 * `Watch::ClassifierDefect` through.
 *
 * Handles the `lnwatch-htlc-settle-onchain` option.
 */
class BreachRemedy : public ResolverIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	BreachRemedy() =delete;
	BreachRemedy(BreachRemedy const&) =delete;

	BreachRemedy(BreachRemedy&&);
	~BreachRemedy();

	BreachRemedy( S::Bus& bus
		    , Watch::ChainIndexIF& index
		    , Watch::LnWalletIF& wallet
		    , Watch::SpendGraphInspector& inspector
		    );

	Ev::Io<bool>
	resolve_closing_tx( Bitcoin::OutPoint const& funding_outpoint
			  , Bitcoin::Tx const& closing_tx
			  ) override;
	Ev::Io<void>
	persist_channel_state(Watch::ChannelOnchainState const& state) override;
	Ev::Io<void> retire(Bitcoin::OutPoint const& funding_outpoint) override;
	Ev::Io<void> on_chain_tip() override;

	/* Candidates without any timelock settle HTLCs
	 * on-chain with no revocation window, and are
	 * dropped unless `lnwatch-htlc-settle-onchain` is
	 * set.  */
	Ev::Io<void> maybe_redeem(Watch::SweepCandidate const& candidate);
};

}

#endif /* !defined(WATCH_BREACHREMEDY_HPP) */
