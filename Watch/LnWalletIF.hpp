#ifndef WATCH_LNWALLETIF_HPP
#define WATCH_LNWALLETIF_HPP

#include<memory>
#include<vector>

namespace Bitcoin { struct OutPoint; }
namespace Ev { template<typename a> class Io; }
namespace Watch { class ChannelIF; }
namespace Watch { struct SweepCandidate; }

namespace Watch {

/** class Watch::LnWalletIF
 *
 * @brief the wallet that owns live channels and queues
 * sweeps for fee-bumped broadcast.
 */
class LnWalletIF {
public:
	virtual ~LnWalletIF() { }

	/* Null if no channel is funded by that outpoint.  */
	virtual
	std::shared_ptr<ChannelIF>
	channel_by_txo(Bitcoin::OutPoint const& funding_outpoint) =0;
	virtual
	std::vector<std::shared_ptr<ChannelIF>> channels() =0;

	/* Queue a sweep.  Queuing the same candidate again
	 * must be harmless.  */
	virtual
	Ev::Io<void> add_sweep_info(SweepCandidate const& candidate) =0;
	/* React to a channel's updated on-chain state.  */
	virtual
	Ev::Io<void> handle_onchain_state(ChannelIF& channel) =0;
};

}

#endif /* !defined(WATCH_LNWALLETIF_HPP) */
