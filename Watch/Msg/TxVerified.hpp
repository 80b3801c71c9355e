#ifndef WATCH_MSG_TXVERIFIED_HPP
#define WATCH_MSG_TXVERIFIED_HPP

#include"Bitcoin/TxId.hpp"

namespace Watch { class ChainIndexIF; }

namespace Watch { namespace Msg {

/** struct Watch::Msg::TxVerified
 *
 * @brief the given index has verified the inclusion
 * proof of a transaction it tracks.
 */
struct TxVerified {
	Watch::ChainIndexIF* index;
	Bitcoin::TxId txid;
};

}}

#endif /* !defined(WATCH_MSG_TXVERIFIED_HPP) */
