#ifndef WATCH_BROADCASTERIF_HPP
#define WATCH_BROADCASTERIF_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Bitcoin { class TxId; }
namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }

namespace Watch {

/** struct Watch::BroadcastError
 *
 * @brief the network or a node's policy rejected a
 * transaction.
 */
struct BroadcastError : public Util::BacktraceException<std::runtime_error> {
	BroadcastError(std::string const& reason)
		: Util::BacktraceException<std::runtime_error>(reason) { }
};

/** class Watch::BroadcasterIF
 *
 * @brief submits transactions to the network.
 */
class BroadcasterIF {
public:
	virtual ~BroadcasterIF() { }

	/* Throws Watch::BroadcastError on rejection.  */
	virtual
	Ev::Io<Bitcoin::TxId> broadcast(Bitcoin::Tx const& tx) =0;
};

}

#endif /* !defined(WATCH_BROADCASTERIF_HPP) */
