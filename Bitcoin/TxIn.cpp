#include"Bitcoin/TxIn.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

std::ostream& operator<<(std::ostream& os, Bitcoin::TxIn const& v) {
	os << v.prevTxid
	   << Bitcoin::le(v.prevOut)
	   << Bitcoin::varint(std::uint64_t(v.scriptSig.size()))
	    ;
	os.write((char const*) v.scriptSig.data(), v.scriptSig.size());
	os << Bitcoin::le(v.nSequence);
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::TxIn& v) {
	auto len = std::uint64_t();
	is >> v.prevTxid
	   >> Bitcoin::le(v.prevOut)
	   >> Bitcoin::varint(len)
	    ;
	v.scriptSig.clear();
	for (auto i = std::uint64_t(0); i < len && is.good(); ++i)
		v.scriptSig.push_back(std::uint8_t(is.get()));
	is >> Bitcoin::le(v.nSequence);
	return is;
}
