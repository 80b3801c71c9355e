#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Sha256/fun.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>

namespace {

auto const base58_chars = std::string(
	"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"
);

std::string base58check(std::uint8_t version, std::uint8_t const* p) {
	auto payload = std::vector<std::uint8_t>();
	payload.push_back(version);
	payload.insert(payload.end(), p, p + 20);

	std::uint8_t check[32];
	Sha256::fun(Sha256::fun(payload.data(), payload.size()))
		.to_buffer(check);
	payload.insert(payload.end(), check, check + 4);

	/* Repeated division of the big-endian number by 58.  */
	auto digits = std::vector<std::uint8_t>();
	for (auto b : payload) {
		auto carry = std::uint32_t(b);
		for (auto& d : digits) {
			carry += std::uint32_t(d) << 8;
			d = std::uint8_t(carry % 58);
			carry /= 58;
		}
		while (carry > 0) {
			digits.push_back(std::uint8_t(carry % 58));
			carry /= 58;
		}
	}

	auto ret = std::string();
	for (auto b : payload) {
		if (b != 0)
			break;
		ret.push_back('1');
	}
	for (auto it = digits.rbegin(); it != digits.rend(); ++it)
		ret.push_back(base58_chars[*it]);
	return ret;
}

char const* hrp(Bitcoin::Network network) {
	switch (network) {
	case Bitcoin::Mainnet: return "bc";
	case Bitcoin::Testnet: return "tb";
	case Bitcoin::Signet: return "tb";
	case Bitcoin::Regtest: return "bcrt";
	}
	return "bc";
}
std::uint8_t p2pkh_version(Bitcoin::Network network) {
	return network == Bitcoin::Mainnet ? 0x00 : 0x6f;
}
std::uint8_t p2sh_version(Bitcoin::Network network) {
	return network == Bitcoin::Mainnet ? 0x05 : 0xc4;
}

}

namespace Bitcoin {

std::string
scriptPubKey_to_addr( std::vector<std::uint8_t> const& spk
		    , Bitcoin::Network network
		    ) {
	/* OP_DUP OP_HASH160 <20> OP_EQUALVERIFY OP_CHECKSIG */
	if ( spk.size() == 25
	  && spk[0] == 0x76 && spk[1] == 0xa9 && spk[2] == 0x14
	  && spk[23] == 0x88 && spk[24] == 0xac
	   )
		return base58check(p2pkh_version(network), &spk[3]);
	/* OP_HASH160 <20> OP_EQUAL */
	if ( spk.size() == 23
	  && spk[0] == 0xa9 && spk[1] == 0x14 && spk[22] == 0x87
	   )
		return base58check(p2sh_version(network), &spk[2]);

	/* OP_n <2 to 40 bytes> */
	if (spk.size() < 4 || spk.size() > 42)
		return "";
	auto version = int();
	if (spk[0] == 0x00)
		version = 0;
	else if (0x51 <= spk[0] && spk[0] <= 0x60)
		version = spk[0] - 0x50;
	else
		return "";
	if (std::size_t(spk[1]) + 2 != spk.size())
		return "";
	if (version == 0 && spk[1] != 20 && spk[1] != 32)
		return "";

	auto program = std::vector<std::uint8_t>(spk.begin() + 2, spk.end());
	auto data = Util::Bech32::to_5bit(program);
	data.insert(data.begin(), std::uint8_t(version));
	return Util::Bech32::encode( hrp(network)
				   , data
				   , version == 0 ? Util::Bech32::Bech32
						  : Util::Bech32::Bech32m
				   );
}

}
