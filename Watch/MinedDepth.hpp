#ifndef WATCH_MINEDDEPTH_HPP
#define WATCH_MINEDDEPTH_HPP

#include"Util/BacktraceException.hpp"
#include"Watch/TxMinedInfo.hpp"
#include<stdexcept>

namespace Bitcoin { class TxId; }
namespace Ev { template<typename a> class Io; }
namespace Watch { class ChainIndexIF; }

namespace Watch {

/* Ordered least-settled first.  */
enum MinedDepth {
	/* Local-only, not yet valid, or nonexistent.  */
	Free = 0,
	/* Broadcast, not yet confirmed.  */
	Mempool = 1,
	/* 1 to 100 confirmations.  */
	Shallow = 2,
	/* More than 100 confirmations.  */
	Deep = 3
};

/* Confirmations above which a transaction is Deep.  */
auto constexpr deep_confirmations = std::int32_t(100);

/** struct Watch::ClassifierDefect
 *
 * @brief thrown when the chain index reports a height
 * and confirmation count that are impossible together.
 *
 * @desc This is a `std::logic_error`, and no per-channel
 * handler catches it.
 */
struct ClassifierDefect : public Util::BacktraceException<std::logic_error> {
	ClassifierDefect(TxMinedInfo const& info);
};

/** Watch::classify_mined_depth
 *
 * @brief maps a chain position to a depth category.
 *
 * @desc Throws `Watch::ClassifierDefect` for any
 * combination the chain index should never report.
 */
MinedDepth classify_mined_depth(TxMinedInfo const& info);

/** Watch::get_mined_depth
 *
 * @brief looks up the transaction on the chain index
 * and classifies it.
 * A null txid is `Free` without consulting the index.
 */
Ev::Io<MinedDepth>
get_mined_depth(Watch::ChainIndexIF& index, Bitcoin::TxId const& txid);

Ev::Io<bool>
is_deeply_mined(Watch::ChainIndexIF& index, Bitcoin::TxId const& txid);

char const* mined_depth_name(MinedDepth d);

}

#endif /* !defined(WATCH_MINEDDEPTH_HPP) */
