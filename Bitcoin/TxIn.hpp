#ifndef BITCOIN_TXIN_HPP
#define BITCOIN_TXIN_HPP

#include<cstdint>
#include<iostream>
#include<vector>
#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/WitnessField.hpp"

namespace Bitcoin {

/** struct Bitcoin::TxIn
 *
 * @brief represents a Bitcoin transaction input.
 *
 * @desc The serialization of a `TxIn` does ***not***
 * include its `witness`, which the enclosing `Tx`
 * (de)serializes separately.
 */
struct TxIn {
	Bitcoin::TxId prevTxid;
	std::uint32_t prevOut;
	std::vector<std::uint8_t> scriptSig;
	std::uint32_t nSequence;
	Bitcoin::WitnessField witness;

	TxIn() : prevOut(0xFFFFFFFF), nSequence(0xFFFFFFFF) { }

	Bitcoin::OutPoint prevout() const {
		return Bitcoin::OutPoint(prevTxid, prevOut);
	}

	bool operator==(TxIn const& o) const {
		return prevTxid == o.prevTxid
		    && prevOut == o.prevOut
		    && scriptSig == o.scriptSig
		    && nSequence == o.nSequence
		    && witness == o.witness
		     ;
	}
	bool operator!=(TxIn const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Bitcoin::TxIn const&);
std::istream& operator>>(std::istream&, Bitcoin::TxIn&);

#endif /* !defined(BITCOIN_TXIN_HPP) */
