#ifndef WATCH_SWEEPSTORE_HPP
#define WATCH_SWEEPSTORE_HPP

#include"Bitcoin/OutPoint.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<set>
#include<string>
#include<utility>
#include<vector>

namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Watch {

/** class Watch::SweepStore
 *
 * @brief persistent store of presigned sweep
 * transactions delivered to the watchtower, and of the
 * channels they belong to.
 *
 * @desc The database arrives via `Watch::Msg::DbResource`;
 * every action blocks until it has.
 *
 * Sweeps are keyed by funding outpoint and the prevout
 * they claim.
 * The same prevout can have several sweeps, one per
 * commitment number.
 */
class SweepStore {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	SweepStore() =delete;
	SweepStore(SweepStore const&) =delete;

	SweepStore(SweepStore&&);
	~SweepStore();

	explicit
	SweepStore(S::Bus& bus);

	/* Ordered by commitment number.  */
	Ev::Io<std::vector<Bitcoin::Tx>>
	get_sweep_transactions( Bitcoin::OutPoint const& funding
			      , Bitcoin::OutPoint const& prevout
			      );
	Ev::Io<void>
	add_sweep_transaction( Bitcoin::OutPoint const& funding
			     , std::uint64_t ctn
			     , Bitcoin::OutPoint const& prevout
			     , Bitcoin::Tx const& tx
			     );
	Ev::Io<void>
	remove_sweep_transactions(Bitcoin::OutPoint const& funding);

	/** Watch::SweepStore::get_turn_number
	 *
	 * @brief records the channel if it is not yet
	 * known, then returns the highest commitment number
	 * stored for it, or 0 if none.
	 */
	Ev::Io<std::uint64_t>
	get_turn_number( Bitcoin::OutPoint const& funding
		       , std::string const& address
		       );
	Ev::Io<std::size_t>
	count_sweep_transactions(Bitcoin::OutPoint const& funding);
	/* Funding outpoints with at least one sweep.  */
	Ev::Io<std::set<Bitcoin::OutPoint>> list_sweep_outpoints();

	Ev::Io<std::vector<std::pair<Bitcoin::OutPoint, std::string>>>
	list_channels();
	/* Empty string if the channel is unknown.  */
	Ev::Io<std::string> get_address(Bitcoin::OutPoint const& funding);
	Ev::Io<void> remove_channel(Bitcoin::OutPoint const& funding);

	/* Removes the sweeps and the channel in one
	 * database transaction.  */
	Ev::Io<void> retire(Bitcoin::OutPoint const& funding);
};

}

#endif /* !defined(WATCH_SWEEPSTORE_HPP) */
