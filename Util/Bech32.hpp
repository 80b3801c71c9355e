#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/* BIP173 bech32, or BIP350 bech32m.  */
enum Variant {
	Bech32,
	Bech32m
};

/** Util::Bech32::encode
 *
 * @brief encode a human-readable part and 5-bit data
 * values, appending the checksum of the given variant.
 *
 * @desc Every element of `data` must be below 32.
 */
std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& data
		  , Variant variant
		  );

/** Util::Bech32::to_5bit
 *
 * @brief regroup 8-bit bytes into 5-bit values, padding
 * the final group with zero bits.
 */
std::vector<std::uint8_t>
to_5bit(std::vector<std::uint8_t> const& bytes);

}}

#endif /* !defined(UTIL_BECH32_HPP) */
