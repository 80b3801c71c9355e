#ifndef WATCH_SPENDGRAPHINSPECTOR_HPP
#define WATCH_SPENDGRAPHINSPECTOR_HPP

#include"Bitcoin/Network.hpp"
#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/TxId.hpp"
#include<map>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Watch { class ChainIndexIF; }
namespace Watch { class ChannelStatusTracker; }

namespace Watch {

/* Outpoint to its spender.  A null spender means the
 * outpoint is unspent.  */
typedef std::map<Bitcoin::OutPoint, Bitcoin::TxId> SpenderMap;

/** class Watch::SpendGraphInspector
 *
 * @brief walks the transactions spending a funding
 * outpoint, down to HTLC second-stage outputs.
 *
 * @desc Depth 0 is the funding outpoint, depth 1 the
 * outputs of the closing transaction, depth 2 the
 * outputs of an HTLC first-stage transaction.
 * Spenders the index reports as local-only or not yet
 * valid are treated as absent.
 *
 * Outputs whose address the index does not yet track
 * are registered with the index instead of being
 * recursed into; the next pass, after the index has
 * caught up, will recurse.
 *
 * Handles the `lnwatch-network` option, which selects
 * the address encoding.
 */
class SpendGraphInspector {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	SpendGraphInspector() =delete;
	SpendGraphInspector(SpendGraphInspector const&) =delete;

	SpendGraphInspector(SpendGraphInspector&&);
	~SpendGraphInspector();

	SpendGraphInspector( S::Bus& bus
			   , Watch::ChainIndexIF& index
			   , Watch::ChannelStatusTracker& tracker
			   );

	/* At depth 0 this also updates the status tracker
	 * for the outpoint.  */
	Ev::Io<SpenderMap> inspect( Bitcoin::OutPoint const& outpoint
				  , unsigned int depth = 0
				  );
	/* The spender of the outpoint, or a null txid.
	 * Registers unknown output addresses of the spender
	 * with the index.  */
	Ev::Io<Bitcoin::TxId> get_spender(Bitcoin::OutPoint const& outpoint);

	Bitcoin::Network network() const;
};

}

#endif /* !defined(WATCH_SPENDGRAPHINSPECTOR_HPP) */
