#ifndef WATCH_TOWERSWEEPER_HPP
#define WATCH_TOWERSWEEPER_HPP

#include"Watch/ResolverIF.hpp"
#include<memory>

namespace S { class Bus; }
namespace Watch { class BroadcasterIF; }
namespace Watch { class ChainIndexIF; }
namespace Watch { class SpendGraphInspector; }
namespace Watch { class SweepStore; }
namespace Watch { struct TowerListener; }

namespace Watch {

/** class Watch::TowerSweeper
 *
 * @brief resolves closes of channels watched on behalf
 * of someone else, by replaying the sweeps they
 * delivered beforehand.
 *
 * @desc Holds no keys.
 * Every output the spend graph shows as still unspent
 * has its stored sweeps broadcast, unless the chain
 * index already knows them.
 * Broadcast failures are logged and retried on the
 * next chain event.
 */
class TowerSweeper : public ResolverIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	TowerSweeper() =delete;
	TowerSweeper(TowerSweeper const&) =delete;

	TowerSweeper(TowerSweeper&&);
	~TowerSweeper();

	TowerSweeper( S::Bus& bus
		    , Watch::ChainIndexIF& index
		    , Watch::BroadcasterIF& broadcaster
		    , Watch::SweepStore& store
		    , Watch::SpendGraphInspector& inspector
		    );

	Ev::Io<bool>
	resolve_closing_tx( Bitcoin::OutPoint const& funding_outpoint
			  , Bitcoin::Tx const& closing_tx
			  ) override;
	/* The tower keeps no channel state beyond the
	 * store.  */
	Ev::Io<void>
	persist_channel_state(Watch::ChannelOnchainState const& state) override;
	Ev::Io<void> retire(Bitcoin::OutPoint const& funding_outpoint) override;
	Ev::Io<void> on_chain_tip() override;

	/* Broadcast only if the chain index has never seen
	 * the transaction.  */
	Ev::Io<void> broadcast_or_log( Bitcoin::OutPoint const& funding_outpoint
				     , Bitcoin::Tx const& tx
				     );

	/* Get, creating if needed, the listener for a
	 * funding outpoint.  */
	Watch::TowerListener listen(Bitcoin::OutPoint const& funding_outpoint);
};

}

#endif /* !defined(WATCH_TOWERSWEEPER_HPP) */
