#include"Util/Bech32.hpp"

namespace {

auto const bech32_chars = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	static std::uint32_t const gen[5] =
	{ 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = chk >> 25;
		chk = ((chk & 0x1ffffff) << 5) ^ v;
		for (auto i = 0; i < 5; ++i)
			if ((top >> i) & 1)
				chk ^= gen[i];
	}
	return chk;
}

std::vector<std::uint8_t> hrp_expand(std::string const& hrp) {
	auto ret = std::vector<std::uint8_t>();
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) >> 5);
	ret.push_back(0);
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) & 31);
	return ret;
}

}

namespace Util { namespace Bech32 {

std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& data
		  , Variant variant
		  ) {
	auto const constant = (variant == Bech32m) ? std::uint32_t(0x2bc830a3)
						   : std::uint32_t(1)
						   ;
	auto values = hrp_expand(hrp);
	values.insert(values.end(), data.begin(), data.end());
	values.insert(values.end(), 6, 0);
	auto mod = polymod(values) ^ constant;

	auto ret = hrp + "1";
	for (auto d : data)
		ret.push_back(bech32_chars[d & 31]);
	for (auto i = 0; i < 6; ++i)
		ret.push_back(bech32_chars[(mod >> (5 * (5 - i))) & 31]);
	return ret;
}

std::vector<std::uint8_t>
to_5bit(std::vector<std::uint8_t> const& bytes) {
	auto ret = std::vector<std::uint8_t>();
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto b : bytes) {
		acc = (acc << 8) | b;
		bits += 8;
		while (bits >= 5) {
			bits -= 5;
			ret.push_back((acc >> bits) & 31);
		}
	}
	if (bits > 0)
		ret.push_back((acc << (5 - bits)) & 31);
	return ret;
}

}}
