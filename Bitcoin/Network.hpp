#ifndef BITCOIN_NETWORK_HPP
#define BITCOIN_NETWORK_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Bitcoin {

enum Network {
	Mainnet,
	Testnet,
	Signet,
	Regtest
};

struct UnknownNetwork : public Util::BacktraceException<std::invalid_argument> {
	UnknownNetwork(std::string const& name)
		: Util::BacktraceException<std::invalid_argument>(
			"Bitcoin::Network: unknown: " + name
		  ) { }
};

/* Accepts the names bitcoind uses: bitcoin, testnet,
 * signet, regtest.  */
Network network_from_string(std::string const&);
char const* network_to_string(Network);

}

#endif /* !defined(BITCOIN_NETWORK_HPP) */
