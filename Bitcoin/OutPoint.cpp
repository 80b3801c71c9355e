#include"Bitcoin/OutPoint.hpp"
#include<algorithm>
#include<sstream>

namespace Bitcoin {

bool OutPoint::valid_string(std::string const& s) {
	auto colon = s.find(':');
	if (colon == std::string::npos)
		return false;
	if (!Sha256::Hash::valid_string(s.substr(0, colon)))
		return false;
	auto num = s.substr(colon + 1);
	if (num.empty() || num.size() > 10)
		return false;
	if (!std::all_of(num.begin(), num.end(), [](char c) {
		return '0' <= c && c <= '9';
	}))
		return false;
	return std::stoull(num) <= 0xFFFFFFFFull;
}

OutPoint::OutPoint(std::string const& s) {
	if (!valid_string(s))
		throw BadOutPoint(s);
	auto colon = s.find(':');
	txid = Bitcoin::TxId(s.substr(0, colon));
	index = std::uint32_t(std::stoull(s.substr(colon + 1)));
}

OutPoint::operator std::string() const {
	auto os = std::ostringstream();
	os << std::string(txid) << ":" << index;
	return os.str();
}

}
