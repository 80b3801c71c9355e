#include"Bitcoin/WitnessField.hpp"
#include"Bitcoin/varint.hpp"

std::ostream& operator<<(std::ostream& os, Bitcoin::WitnessField const& v) {
	os << Bitcoin::varint(std::uint64_t(v.witnesses.size()));
	for (auto const& w : v.witnesses) {
		os << Bitcoin::varint(std::uint64_t(w.size()));
		os.write((char const*) w.data(), w.size());
	}
	return os;
}
std::istream& operator>>(std::istream& is, Bitcoin::WitnessField& v) {
	auto len = std::uint64_t();
	is >> Bitcoin::varint(len);
	v.witnesses.clear();
	for (auto i = std::uint64_t(0); i < len && is.good(); ++i) {
		auto wlen = std::uint64_t();
		is >> Bitcoin::varint(wlen);
		auto w = std::vector<std::uint8_t>();
		for (auto j = std::uint64_t(0); j < wlen && is.good(); ++j)
			w.push_back(std::uint8_t(is.get()));
		v.witnesses.push_back(std::move(w));
	}
	return is;
}
