#include"Bitcoin/Network.hpp"

namespace Bitcoin {

Network network_from_string(std::string const& s) {
	if (s == "bitcoin" || s == "mainnet")
		return Mainnet;
	if (s == "testnet")
		return Testnet;
	if (s == "signet")
		return Signet;
	if (s == "regtest")
		return Regtest;
	throw UnknownNetwork(s);
}

char const* network_to_string(Network n) {
	switch (n) {
	case Mainnet: return "bitcoin";
	case Testnet: return "testnet";
	case Signet: return "signet";
	case Regtest: return "regtest";
	}
	return "bitcoin";
}

}
