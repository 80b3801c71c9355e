#ifndef WATCH_CHANNELIF_HPP
#define WATCH_CHANNELIF_HPP

#include"Watch/SweepCandidate.hpp"
#include<string>

namespace Bitcoin { struct Tx; }
namespace Bitcoin { struct TxIn; }
namespace Watch { struct ChannelOnchainState; }

namespace Watch {

/** class Watch::ChannelIF
 *
 * @brief a live channel that holds its own keys and can
 * construct sweeps for its outputs.
 *
 * @desc The watcher never signs anything; everything
 * key-dependent goes through this interface.
 * Member functions may throw `std::runtime_error`.
 */
class ChannelIF {
public:
	virtual ~ChannelIF() { }

	/* Short identifier for log lines.  */
	virtual
	std::string get_id_for_log() const =0;

	/* Claims this channel can make on the outputs of
	 * the given closing transaction, keyed by the
	 * claimed outpoint.  */
	virtual
	SweepCandidates sweep_ctx(Bitcoin::Tx const& closing_tx) =0;
	/* Second-stage claims on the outputs of a
	 * transaction that spent one of the closing
	 * transaction's HTLC outputs.  */
	virtual
	SweepCandidates maybe_sweep_htlcs( Bitcoin::Tx const& closing_tx
					 , Bitcoin::Tx const& spender_tx
					 ) =0;
	/* Learn a payment preimage, if the input revealed
	 * one.  */
	virtual
	void extract_preimage_from_htlc_txin(Bitcoin::TxIn const& txin) =0;

	virtual
	void update_onchain_state(Watch::ChannelOnchainState const& state) =0;
	/* Forget any cached sweep candidates.  */
	virtual
	void clear_sweep_cache() =0;
};

}

#endif /* !defined(WATCH_CHANNELIF_HPP) */
