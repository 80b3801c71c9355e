#include"Bitcoin/Tx.hpp"
#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Ev/Io.hpp"
#include"Ln/htlc_script.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Watch/ChainIndexIF.hpp"
#include"Watch/ChannelStatus.hpp"
#include"Watch/MinedDepth.hpp"
#include"Watch/Msg/Option.hpp"
#include"Watch/SpendGraphInspector.hpp"
#include"Watch/log.hpp"

namespace Watch {

class SpendGraphInspector::Impl {
private:
	S::Bus& bus;
	Watch::ChainIndexIF& index;
	Watch::ChannelStatusTracker& tracker;

	Bitcoin::Network net;

	void start() {
		bus.subscribe<Msg::Option
			     >([this](Msg::Option const& o) {
			if (o.name != "lnwatch-network")
				return Ev::lift();
			net = Bitcoin::network_from_string(o.value);
			return Ev::lift();
		});
	}

	/* Spender, ignoring local-only and future ones.  */
	Ev::Io<Bitcoin::TxId>
	spender_of(Bitcoin::OutPoint const& outpoint) {
		return index.get_spent_outpoint(outpoint).then([this
							       ](Bitcoin::TxId spender) {
			if (!spender)
				return Ev::lift(spender);
			return index.get_tx_height(spender).then([spender
								 ](TxMinedInfo info) {
				if ( info.height == TxHeight::Local
				  || info.height == TxHeight::Future
				   )
					return Ev::lift(Bitcoin::TxId());
				return Ev::lift(spender);
			});
		});
	}

	Ev::Io<void> update_status( Bitcoin::OutPoint const& funding
				  , Bitcoin::TxId const& spender
				  ) {
		if (!spender) {
			tracker.set(funding, ChannelStatus::open());
			return Ev::lift();
		}
		return index.get_tx_height(spender).then([this, funding
							 ](TxMinedInfo info) {
			if (classify_mined_depth(info) == Deep)
				tracker.set(funding, ChannelStatus::closed_deep());
			else
				tracker.set( funding
					   , ChannelStatus::closed(info.confirmations)
					   );
			return Ev::lift();
		});
	}

	/* A first-stage HTLC transaction has a single input
	 * whose witness script is an HTLC script.
	 * TODO: anchor-output channels spend HTLC outputs
	 * with extra fee-paying inputs; accept those once
	 * the anchor HTLC scripts are also recognized.
	 */
	static
	bool is_first_stage_htlc(Bitcoin::Tx const& tx) {
		if (tx.inputs.size() != 1)
			return false;
		return Ln::spends_htlc_output(tx.inputs[0]);
	}

	Ev::Io<void>
	inspect_into( std::shared_ptr<SpenderMap> result
		    , Bitcoin::OutPoint const& outpoint
		    , unsigned int depth
		    ) {
		return spender_of(outpoint).then([ this
						 , result
						 , outpoint
						 , depth
						 ](Bitcoin::TxId spender) {
			(*result)[outpoint] = spender;
			auto act = Ev::lift();
			if (depth == 0)
				act += update_status(outpoint, spender);
			if (!spender)
				return act;
			return act.then([this, spender]() {
				return index.get_transaction(spender);
			}).then([ this
				, result
				, spender
				, depth
				](std::unique_ptr<Bitcoin::Tx> ptx) {
				if (!ptx)
					return Watch::log( bus, Debug
							 , "SpendGraphInspector: "
							   "spender %s not yet "
							   "available."
							 , std::string(spender)
								.c_str()
							 );
				auto tx = std::shared_ptr<Bitcoin::Tx>(std::move(ptx));
				if (depth == 1 && !is_first_stage_htlc(*tx))
					return Ev::lift();
				return outputs_loop( result, spender, tx
						   , 0, depth
						   );
			});
		});
	}

	Ev::Io<void>
	outputs_loop( std::shared_ptr<SpenderMap> result
		    , Bitcoin::TxId const& txid
		    , std::shared_ptr<Bitcoin::Tx> tx
		    , std::size_t i
		    , unsigned int depth
		    ) {
		if (i >= tx->outputs.size())
			return Ev::lift();
		auto address = Bitcoin::scriptPubKey_to_addr(
			tx->outputs[i].scriptPubKey, net
		);
		if (address == "")
			return outputs_loop(result, txid, tx, i + 1, depth);
		return index.is_mine(address).then([ this
						   , result
						   , txid
						   , address
						   , i
						   , depth
						   ](bool mine) {
			if (!mine)
				return index.add_address(address);
			if (depth >= 2)
				return Ev::lift();
			return inspect_into( result
					   , Bitcoin::OutPoint(txid, i)
					   , depth + 1
					   );
		}).then([this, result, txid, tx, i, depth]() {
			return outputs_loop(result, txid, tx, i + 1, depth);
		});
	}

	Ev::Io<void>
	register_addresses( std::shared_ptr<Bitcoin::Tx> tx
			  , std::size_t i
			  ) {
		if (i >= tx->outputs.size())
			return Ev::lift();
		auto address = Bitcoin::scriptPubKey_to_addr(
			tx->outputs[i].scriptPubKey, net
		);
		if (address == "")
			return register_addresses(tx, i + 1);
		return index.is_mine(address).then([this, address](bool mine) {
			if (mine)
				return Ev::lift();
			return index.add_address(address);
		}).then([this, tx, i]() {
			return register_addresses(tx, i + 1);
		});
	}

public:
	Impl( S::Bus& bus_
	    , Watch::ChainIndexIF& index_
	    , Watch::ChannelStatusTracker& tracker_
	    ) : bus(bus_), index(index_), tracker(tracker_)
	      , net(Bitcoin::Mainnet)
	      { start(); }

	Ev::Io<SpenderMap> inspect( Bitcoin::OutPoint const& outpoint
				  , unsigned int depth
				  ) {
		auto result = std::make_shared<SpenderMap>();
		return inspect_into(result, outpoint, depth).then([result]() {
			return Ev::lift(std::move(*result));
		});
	}

	Ev::Io<Bitcoin::TxId> get_spender(Bitcoin::OutPoint const& outpoint) {
		return spender_of(outpoint).then([this](Bitcoin::TxId spender) {
			if (!spender)
				return Ev::lift(spender);
			return index.get_transaction(spender).then([ this
								   , spender
								   ](std::unique_ptr<Bitcoin::Tx> ptx) {
				if (!ptx)
					return Ev::lift(spender);
				auto tx = std::shared_ptr<Bitcoin::Tx>(std::move(ptx));
				return register_addresses(tx, 0).then([spender]() {
					return Ev::lift(spender);
				});
			});
		});
	}

	Bitcoin::Network network() const { return net; }
};

SpendGraphInspector::SpendGraphInspector(SpendGraphInspector&&) =default;
SpendGraphInspector::~SpendGraphInspector() =default;

SpendGraphInspector::SpendGraphInspector( S::Bus& bus
					, Watch::ChainIndexIF& index
					, Watch::ChannelStatusTracker& tracker
					) : pimpl(Util::make_unique<Impl>(bus, index, tracker))
					  { }

Ev::Io<SpenderMap>
SpendGraphInspector::inspect( Bitcoin::OutPoint const& outpoint
			    , unsigned int depth
			    ) {
	return pimpl->inspect(outpoint, depth);
}
Ev::Io<Bitcoin::TxId>
SpendGraphInspector::get_spender(Bitcoin::OutPoint const& outpoint) {
	return pimpl->get_spender(outpoint);
}
Bitcoin::Network SpendGraphInspector::network() const {
	return pimpl->network();
}

}
