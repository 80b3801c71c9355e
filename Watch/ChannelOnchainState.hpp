#ifndef WATCH_CHANNELONCHAINSTATE_HPP
#define WATCH_CHANNELONCHAINSTATE_HPP

#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/TxId.hpp"
#include"Watch/TxMinedInfo.hpp"

namespace Watch {

/** struct Watch::ChannelOnchainState
 *
 * @brief result of one evaluation of a channel, handed
 * to the resolver to persist.
 *
 * @desc `closing_txid` is null while the funding output
 * is unspent.
 */
struct ChannelOnchainState {
	Bitcoin::OutPoint funding_outpoint;
	Bitcoin::TxId funding_txid;
	TxMinedInfo funding_height;
	Bitcoin::TxId closing_txid;
	TxMinedInfo closing_height;
	bool keep_watching;

	ChannelOnchainState() : keep_watching(true) { }
};

}

#endif /* !defined(WATCH_CHANNELONCHAINSTATE_HPP) */
