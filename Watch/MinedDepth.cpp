#include"Bitcoin/TxId.hpp"
#include"Ev/Io.hpp"
#include"Util/Str.hpp"
#include"Watch/ChainIndexIF.hpp"
#include"Watch/MinedDepth.hpp"

namespace Watch {

ClassifierDefect::ClassifierDefect(TxMinedInfo const& info)
	: Util::BacktraceException<std::logic_error>(Util::Str::fmt(
		"Watch::classify_mined_depth: unexpected "
		"height=%d confirmations=%d",
		(int) info.height, (int) info.confirmations
	  )) { }

MinedDepth classify_mined_depth(TxMinedInfo const& info) {
	if (info.confirmations > deep_confirmations)
		return Deep;
	if (info.confirmations > 0)
		return Shallow;
	if ( info.height == TxHeight::Unconfirmed
	  || info.height == TxHeight::UnconfirmedParent
	   )
		return Mempool;
	if ( info.height == TxHeight::Local
	  || info.height == TxHeight::Future
	   )
		return Free;
	/* Claimed mined, confirmations not yet verified.  */
	if (info.height > 0 && info.confirmations == 0)
		return Mempool;
	throw ClassifierDefect(info);
}

Ev::Io<MinedDepth>
get_mined_depth(Watch::ChainIndexIF& index, Bitcoin::TxId const& txid) {
	if (!txid)
		return Ev::lift(Free);
	return index.get_tx_height(txid).then([](TxMinedInfo info) {
		return Ev::lift(classify_mined_depth(info));
	});
}

Ev::Io<bool>
is_deeply_mined(Watch::ChainIndexIF& index, Bitcoin::TxId const& txid) {
	return get_mined_depth(index, txid).then([](MinedDepth d) {
		return Ev::lift(d == Deep);
	});
}

char const* mined_depth_name(MinedDepth d) {
	switch (d) {
	case Free: return "free";
	case Mempool: return "mempool";
	case Shallow: return "shallow";
	case Deep: return "deep";
	}
	return "unknown";
}

}
