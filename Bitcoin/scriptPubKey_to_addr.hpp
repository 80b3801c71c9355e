#ifndef BITCOIN_SCRIPTPUBKEY_TO_ADDR_HPP
#define BITCOIN_SCRIPTPUBKEY_TO_ADDR_HPP

#include"Bitcoin/Network.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Bitcoin {

/** Bitcoin::scriptPubKey_to_addr
 *
 * @brief given an output script, returns the address
 * that pays to it on the given network.
 *
 * @desc Recognizes P2PKH and P2SH (base58check) and
 * segwit outputs of any version (bech32 for v0,
 * bech32m for v1 and up).
 * Returns an empty string for any other script,
 * such as bare multisig or OP_RETURN.
 */
std::string
scriptPubKey_to_addr( std::vector<std::uint8_t> const& scriptPubKey
		    , Bitcoin::Network network
		    );

}

#endif /* !defined(BITCOIN_SCRIPTPUBKEY_TO_ADDR_HPP) */
