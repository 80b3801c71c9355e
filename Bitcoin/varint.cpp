#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"

namespace Bitcoin {

Detail::VarInt varint(std::uint64_t& v) {
	return Detail::VarInt(v);
}
Detail::VarIntConst varint(std::uint64_t const& v) {
	return Detail::VarIntConst(v);
}

}

std::ostream& operator<<(std::ostream& os, Bitcoin::Detail::VarIntConst o) {
	if (o.v < 0xFD) {
		os.put(char(o.v));
	} else if (o.v <= 0xFFFF) {
		os.put(char(0xFD));
		os.put(char(o.v & 0xFF));
		os.put(char((o.v >> 8) & 0xFF));
	} else if (o.v <= 0xFFFFFFFF) {
		os.put(char(0xFE));
		os << Bitcoin::le(std::uint32_t(o.v));
	} else {
		os.put(char(0xFF));
		os << Bitcoin::le(std::uint64_t(o.v));
	}
	return os;
}

std::istream& operator>>(std::istream& is, Bitcoin::Detail::VarInt o) {
	auto t = char();
	is.get(t);
	auto tag = std::uint8_t(t);

	if (tag < 0xFD) {
		o.v = tag;
	} else if (tag == 0xFD) {
		char c[2];
		is.get(c[0]).get(c[1]);
		o.v = (std::uint64_t(std::uint8_t(c[0])) << 0)
		    | (std::uint64_t(std::uint8_t(c[1])) << 8)
		    ;
	} else if (tag == 0xFE) {
		auto v32 = std::uint32_t();
		is >> Bitcoin::le(v32);
		o.v = v32;
	} else {
		is >> Bitcoin::le(o.v);
	}
	return is;
}
