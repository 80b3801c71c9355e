#ifndef WATCH_MSG_CHAINTIP_HPP
#define WATCH_MSG_CHAINTIP_HPP

#include<cstdint>

namespace Watch { class ChainIndexIF; }

namespace Watch { namespace Msg {

/** struct Watch::Msg::ChainTip
 *
 * @brief the chain index has advanced its tip to a new
 * block.
 *
 * @desc raised by the chain index owner, once per new
 * tip.
 * While one ChainTip is being raised no other is, so
 * subscribers see heights monotonically increasing
 * (absent reorgs), though some heights may be skipped.
 */
struct ChainTip {
	Watch::ChainIndexIF* index;
	std::uint32_t height;
};

}}

#endif /* !defined(WATCH_MSG_CHAINTIP_HPP) */
