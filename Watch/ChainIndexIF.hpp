#ifndef WATCH_CHAININDEXIF_HPP
#define WATCH_CHAININDEXIF_HPP

#include"Watch/TxMinedInfo.hpp"
#include<memory>
#include<string>

namespace Bitcoin { class TxId; }
namespace Bitcoin { struct OutPoint; }
namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }

namespace Watch {

/** class Watch::ChainIndexIF
 *
 * @brief the blockchain index/synchronizer the watcher
 * queries.
 *
 * @desc Implementations raise `Watch::Msg::ChainTip`,
 * `Watch::Msg::TxVerified` and `Watch::Msg::IndexSynced`
 * on the bus the watcher is attached to, naming
 * themselves as the `index`.
 *
 * Any action may throw `std::runtime_error` when the
 * index is unreachable.
 */
class ChainIndexIF {
public:
	virtual ~ChainIndexIF() { }

	/* Unknown transactions report TxHeight::Local.  */
	virtual
	Ev::Io<TxMinedInfo> get_tx_height(Bitcoin::TxId const& txid) =0;
	/* Null txid if the outpoint is unspent, as far as
	 * the index knows.  */
	virtual
	Ev::Io<Bitcoin::TxId>
	get_spent_outpoint(Bitcoin::OutPoint const& outpoint) =0;
	/* Null pointer if the index does not have the
	 * transaction.  */
	virtual
	Ev::Io<std::unique_ptr<Bitcoin::Tx>>
	get_transaction(Bitcoin::TxId const& txid) =0;

	virtual
	Ev::Io<bool> is_mine(std::string const& address) =0;
	/* Start tracking transactions touching the
	 * address.  Repeating it is harmless.  */
	virtual
	Ev::Io<void> add_address(std::string const& address) =0;

	virtual
	bool is_up_to_date() =0;
	/* Whether a synchronizer is attached at all.  */
	virtual
	bool is_connected() =0;
};

}

#endif /* !defined(WATCH_CHAININDEXIF_HPP) */
