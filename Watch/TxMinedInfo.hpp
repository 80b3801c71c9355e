#ifndef WATCH_TXMINEDINFO_HPP
#define WATCH_TXMINEDINFO_HPP

#include<cstdint>

namespace Watch {

/* Sentinel heights.  Positive heights are block heights.  */
namespace TxHeight {
/* In the mempool, all parents confirmed.  */
auto constexpr Unconfirmed = std::int32_t(0);
/* In the mempool, some parent unconfirmed.  */
auto constexpr UnconfirmedParent = std::int32_t(-1);
/* Known only locally, never broadcast; also the answer
 * for transactions the index has never seen.  */
auto constexpr Local = std::int32_t(-2);
/* Not valid until a future block or time.  */
auto constexpr Future = std::int32_t(-3);
}

/** struct Watch::TxMinedInfo
 *
 * @brief where a transaction sits relative to the chain
 * tip, as the chain index currently reports it.
 */
struct TxMinedInfo {
	std::int32_t height;
	std::int32_t confirmations;

	TxMinedInfo() : height(TxHeight::Local), confirmations(0) { }
	TxMinedInfo( std::int32_t height_
		   , std::int32_t confirmations_
		   ) : height(height_), confirmations(confirmations_) { }
};

}

#endif /* !defined(WATCH_TXMINEDINFO_HPP) */
