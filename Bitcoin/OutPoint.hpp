#ifndef BITCOIN_OUTPOINT_HPP
#define BITCOIN_OUTPOINT_HPP

#include"Bitcoin/TxId.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Bitcoin {

/** struct Bitcoin::OutPoint
 *
 * @brief identifies one output of one transaction.
 *
 * @desc Textual form is `<txid>:<index>`, with the
 * txid in displayed (reversed) hex order.
 */
struct OutPoint {
	Bitcoin::TxId txid;
	std::uint32_t index;

	OutPoint() : index(0) { }
	OutPoint(Bitcoin::TxId txid_, std::uint32_t index_)
		: txid(std::move(txid_)), index(index_) { }

	static
	bool valid_string(std::string const&);
	/* Throws Bitcoin::BadOutPoint.  */
	explicit
	OutPoint(std::string const&);
	explicit
	operator std::string() const;

	bool operator==(OutPoint const& o) const {
		return txid == o.txid && index == o.index;
	}
	bool operator!=(OutPoint const& o) const {
		return !(*this == o);
	}
	bool operator<(OutPoint const& o) const {
		if (txid != o.txid)
			return txid < o.txid;
		return index < o.index;
	}
};

struct BadOutPoint : public Util::BacktraceException<std::invalid_argument> {
	BadOutPoint(std::string const& s)
		: Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::OutPoint: invalid: " + s
		  ) { }
};

}

/* NOTE: This outputs the textual form.  */
inline
std::ostream& operator<<(std::ostream& os, Bitcoin::OutPoint const& o) {
	return os << std::string(o);
}

#endif /* !defined(BITCOIN_OUTPOINT_HPP) */
