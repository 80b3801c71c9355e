#include"Bitcoin/TxOut.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

std::ostream& operator<<(std::ostream& os, Bitcoin::TxOut const& v) {
	os << Bitcoin::le(v.amount)
	   << Bitcoin::varint(std::uint64_t(v.scriptPubKey.size()))
	    ;
	os.write((char const*) v.scriptPubKey.data(), v.scriptPubKey.size());
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::TxOut& v) {
	auto len = std::uint64_t();
	is >> Bitcoin::le(v.amount)
	   >> Bitcoin::varint(len)
	    ;
	v.scriptPubKey.clear();
	for (auto i = std::uint64_t(0); i < len && is.good(); ++i)
		v.scriptPubKey.push_back(std::uint8_t(is.get()));
	return is;
}
