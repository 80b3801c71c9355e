#ifndef LN_AMOUNT_HPP
#define LN_AMOUNT_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Ln {

/** class Ln::Amount
 *
 * @brief represents some amount of Bitcoins.
 *
 * @desc Stored in millisatoshi; on-chain outputs only
 * ever carry whole satoshis.
 */
class Amount {
private:
	std::uint64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;
	~Amount() =default;

	explicit
	operator std::string() const;

	static
	Amount sat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v * 1000;
		return ret;
	}
	static
	Amount msat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}
	std::uint64_t to_sat() const { return v / 1000; }
	std::uint64_t to_msat() const { return v; }

	/* Saturates.  */
	Amount& operator+=(Amount const& i) {
		v += i.v;
		if (v < i.v)
			v = UINT64_MAX;
		return *this;
	}
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}

	bool operator<(Amount const& o) const {
		return v < o.v;
	}
	bool operator==(Amount const& o) const {
		return v == o.v;
	}
	bool operator!=(Amount const& o) const {
		return !(*this == o);
	}
};

inline
std::ostream& operator<<(std::ostream& os, Amount const& v) {
	return os << std::string(v);
}

}

#endif /* !defined(LN_AMOUNT_HPP) */
