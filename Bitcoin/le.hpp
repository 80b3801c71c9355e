#ifndef BITCOIN_LE_HPP
#define BITCOIN_LE_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<iostream>

namespace Bitcoin { namespace Detail {

/* Value wrapper for writing.  */
template<typename T>
class LeConst {
private:
	T v;

public:
	explicit
	LeConst(T v_) : v(v_) { }

	friend
	std::ostream& operator<<(std::ostream& os, LeConst o) {
		for (auto i = std::size_t(0); i < sizeof(T); ++i)
			os.put(char((o.v >> (8 * i)) & 0xFF));
		return os;
	}
};

/* Reference wrapper for reading an unsigned integer of
 * type T in little-endian order, or writing its current
 * value.  */
template<typename T>
class Le {
private:
	T& v;

public:
	explicit
	Le(T& v_) : v(v_) { }

	friend
	std::istream& operator>>(std::istream& is, Le o) {
		auto tmp = T(0);
		for (auto i = std::size_t(0); i < sizeof(T); ++i) {
			auto c = char();
			is.get(c);
			tmp |= T(std::uint8_t(c)) << (8 * i);
		}
		o.v = tmp;
		return is;
	}
	friend
	std::ostream& operator<<(std::ostream& os, Le o) {
		return os << LeConst<T>(o.v);
	}
};
class LeAmount {
private:
	Ln::Amount& v;

public:
	explicit
	LeAmount(Ln::Amount& v_) : v(v_) { }

	friend
	std::istream& operator>>(std::istream& is, LeAmount o) {
		auto sats = std::uint64_t();
		is >> Le<std::uint64_t>(sats);
		o.v = Ln::Amount::sat(sats);
		return is;
	}
	friend
	std::ostream& operator<<(std::ostream& os, LeAmount o) {
		return os << LeConst<std::uint64_t>(o.v.to_sat());
	}
};

}}

namespace Bitcoin {

/** Bitcoin::le
 *
 * @brief wraps a uint32, uint64, or `Ln::Amount`
 * so it is encoded in little-endian form.
 *
 * @desc intended use is:
 *
 *     os << Bitcoin::le(expr);
 *     is >> Bitcoin::le(var);
 */
inline
Detail::Le<std::uint32_t> le(std::uint32_t& v) {
	return Detail::Le<std::uint32_t>(v);
}
inline
Detail::LeConst<std::uint32_t> le(std::uint32_t const& v) {
	return Detail::LeConst<std::uint32_t>(v);
}
inline
Detail::Le<std::uint64_t> le(std::uint64_t& v) {
	return Detail::Le<std::uint64_t>(v);
}
inline
Detail::LeConst<std::uint64_t> le(std::uint64_t const& v) {
	return Detail::LeConst<std::uint64_t>(v);
}
inline
Detail::LeAmount le(Ln::Amount& v) {
	return Detail::LeAmount(v);
}
/* Amounts are serialized in whole satoshis.  */
inline
Detail::LeConst<std::uint64_t> le(Ln::Amount const& v) {
	return Detail::LeConst<std::uint64_t>(v.to_sat());
}

}

#endif /* !defined(BITCOIN_LE_HPP) */
