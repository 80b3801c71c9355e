#ifndef BITCOIN_WITNESSFIELD_HPP
#define BITCOIN_WITNESSFIELD_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin {

/** struct Bitcoin::WitnessField
 *
 * @brief the witness stack of one `TxIn`.
 *
 * @desc Index [0] is the stack bottom and the last
 * item is the stack top.
 * For a P2WSH spend the stack top is the witness
 * script, and the rest of the stack is its input.
 *
 * If every input of a transaction has an empty
 * witness, the transaction serializes without the
 * segwit marker.
 */
struct WitnessField {
	std::vector<std::vector<std::uint8_t>> witnesses;

	bool empty() const {
		return witnesses.empty();
	}
	bool operator==(WitnessField const& o) const {
		return witnesses == o.witnesses;
	}
	bool operator!=(WitnessField const& o) const {
		return !(*this == o);
	}
};

}

std::ostream& operator<<(std::ostream&, Bitcoin::WitnessField const&);
std::istream& operator>>(std::istream&, Bitcoin::WitnessField&);

#endif /* !defined(BITCOIN_WITNESSFIELD_HPP) */
