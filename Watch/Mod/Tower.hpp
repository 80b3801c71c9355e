#ifndef WATCH_MOD_TOWER_HPP
#define WATCH_MOD_TOWER_HPP

#include"Watch/ChannelStatus.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<set>
#include<string>
#include<utility>
#include<vector>

namespace Bitcoin { struct OutPoint; }
namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Watch { class BroadcasterIF; }
namespace Watch { class ChainIndexIF; }
namespace Watch { struct TowerListener; }

namespace Watch { namespace Mod {

/** class Watch::Mod::Tower
 *
 * @brief watchtower: watches channels on behalf of
 * their owners and broadcasts the sweeps they delivered
 * when a channel is closed.
 *
 * @desc Needs a `Watch::Msg::DbResource` on the bus
 * before its store-backed actions can complete.
 * Chain events are handled once `start_watching` has
 * run.
 */
class Tower {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Tower() =delete;
	Tower(Tower const&) =delete;

	Tower(Tower&&);
	~Tower();

	Tower( S::Bus& bus
	     , Watch::ChainIndexIF& index
	     , Watch::BroadcasterIF& broadcaster
	     );

	/* Track every channel in the store, in random
	 * order, and start reacting to chain events.  */
	Ev::Io<void> start_watching();

	/** Watch::Mod::Tower::get_turn_number
	 *
	 * @brief starts watching the channel if it is new,
	 * then returns the highest commitment number we
	 * hold sweeps for.
	 *
	 * @desc Channel owners call this before sending
	 * sweeps, to know which commitments they still
	 * need to send.
	 */
	Ev::Io<std::uint64_t>
	get_turn_number( Bitcoin::OutPoint const& funding_outpoint
		       , std::string const& address
		       );
	Ev::Io<void>
	add_sweep_transaction( Bitcoin::OutPoint const& funding_outpoint
			     , std::uint64_t ctn
			     , Bitcoin::OutPoint const& prevout
			     , Bitcoin::Tx const& tx
			     );

	Ev::Io<std::size_t>
	count_stored_sweeps(Bitcoin::OutPoint const& funding_outpoint);
	Ev::Io<std::set<Bitcoin::OutPoint>> list_stored_sweeps();
	Ev::Io<std::vector<std::pair<Bitcoin::OutPoint, std::string>>>
	list_channels();

	Watch::TowerListener listen(Bitcoin::OutPoint const& funding_outpoint);
	Watch::ChannelStatus status(Bitcoin::OutPoint const& funding_outpoint) const;
	bool is_watching(std::string const& address) const;

	/* Run a pass now.  */
	Ev::Io<void> trigger();
	Ev::Io<void> stop();
};

}}

#endif /* !defined(WATCH_MOD_TOWER_HPP) */
