#ifndef WATCH_RESOLVERIF_HPP
#define WATCH_RESOLVERIF_HPP

namespace Bitcoin { struct OutPoint; }
namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }
namespace Watch { struct ChannelOnchainState; }

namespace Watch {

/** class Watch::ResolverIF
 *
 * @brief decides what to do once a channel's funding
 * output has been spent.
 *
 * @desc `Watch::MonitorLoop` composes exactly one
 * resolver.
 * `Watch::BreachRemedy` resolves channels we are a
 * party to, using the channel's own keys;
 * `Watch::TowerSweeper` resolves channels on behalf of
 * others, replaying presigned sweeps.
 */
class ResolverIF {
public:
	virtual ~ResolverIF() { }

	/* Compute and hand off sweeps.
	 * Returns whether the channel still needs
	 * watching.  */
	virtual
	Ev::Io<bool>
	resolve_closing_tx( Bitcoin::OutPoint const& funding_outpoint
			  , Bitcoin::Tx const& closing_tx
			  ) =0;
	/* Record the result of one evaluation.  */
	virtual
	Ev::Io<void>
	persist_channel_state(Watch::ChannelOnchainState const& state) =0;
	/* Called once when the channel no longer needs
	 * watching.  */
	virtual
	Ev::Io<void> retire(Bitcoin::OutPoint const& funding_outpoint) =0;
	/* Called on every new chain tip, before the
	 * evaluation pass.  */
	virtual
	Ev::Io<void> on_chain_tip() =0;
};

}

#endif /* !defined(WATCH_RESOLVERIF_HPP) */
