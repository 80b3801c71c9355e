#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"
#include"Sha256/HasherStream.hpp"
#include"Sha256/fun.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sstream>
#include<stdexcept>

std::ostream& operator<<(std::ostream& os, Bitcoin::Tx const& v) {
	os << Bitcoin::le(v.nVersion);

	auto segwit = std::any_of
		( v.inputs.begin(), v.inputs.end()
		, [](Bitcoin::TxIn const& i) { return !i.witness.empty(); }
		);

	if (segwit) {
		/* Marker and flag.  */
		os.put(0x00);
		os.put(0x01);
	}

	os << Bitcoin::varint(std::uint64_t(v.inputs.size()));
	for (auto const& i : v.inputs)
		os << i;

	os << Bitcoin::varint(std::uint64_t(v.outputs.size()));
	for (auto const& o : v.outputs)
		os << o;

	if (segwit)
		for (auto const& i : v.inputs)
			os << i.witness;

	os << Bitcoin::le(v.nLockTime);

	return os;
}

std::istream& operator>>(std::istream& is, Bitcoin::Tx& v) {
	auto len = std::uint64_t();

	is >> Bitcoin::le(v.nVersion)
	   >> Bitcoin::varint(len)
	    ;
	auto segwit = (len == 0);

	if (segwit) {
		if (is.get() != 0x01) {
			is.setstate(std::ios_base::failbit);
			return is;
		}
		is >> Bitcoin::varint(len);
	}
	v.inputs.clear();
	for (auto i = std::uint64_t(0); i < len && is.good(); ++i) {
		v.inputs.emplace_back();
		is >> v.inputs.back();
	}

	is >> Bitcoin::varint(len);
	v.outputs.clear();
	for (auto i = std::uint64_t(0); i < len && is.good(); ++i) {
		v.outputs.emplace_back();
		is >> v.outputs.back();
	}

	if (segwit)
		for (auto& i : v.inputs)
			is >> i.witness;
	else
		for (auto& i : v.inputs)
			i.witness.witnesses.clear();

	is >> Bitcoin::le(v.nLockTime);

	return is;
}

namespace {

void parse_whole(Bitcoin::Tx& tx, std::string str) {
	auto is = std::istringstream(std::move(str));
	is >> tx;
	if (!is.good())
		throw Util::BacktraceException<std::invalid_argument>("Bitcoin::Tx: truncated or invalid input.");
	if (is.get() != std::char_traits<char>::eof())
		throw Util::BacktraceException<std::invalid_argument>("Bitcoin::Tx: input too long.");
}

}

namespace Bitcoin {

Tx::Tx(std::string const& s) {
	if (!Util::Str::ishex(s))
		throw Util::BacktraceException<std::invalid_argument>("Bitcoin::Tx: not hex.");
	auto buf = Util::Str::hexread(s);
	parse_whole(*this, std::string(buf.begin(), buf.end()));
}
Tx::Tx(std::vector<std::uint8_t> const& buf) {
	parse_whole(*this, std::string(buf.begin(), buf.end()));
}

Bitcoin::TxId Tx::get_txid() const {
	/* Hash the copy without witnesses.  */
	auto tmp = *this;
	for (auto& i : tmp.inputs)
		i.witness.witnesses.clear();

	Sha256::HasherStream hasher;
	hasher << tmp;

	return Bitcoin::TxId(
		Sha256::fun(std::move(hasher).finalize())
	);
}

std::vector<std::uint8_t> Tx::to_bytes() const {
	auto os = std::ostringstream();
	os << *this;
	auto str = os.str();
	return std::vector<std::uint8_t>(str.begin(), str.end());
}
Tx::operator std::string() const {
	auto bytes = to_bytes();
	return Util::Str::hexdump(bytes.data(), bytes.size());
}

}
