#ifndef LN_HTLC_SCRIPT_HPP
#define LN_HTLC_SCRIPT_HPP

#include<cstdint>
#include<vector>

namespace Bitcoin { struct TxIn; }
namespace Ln { class Preimage; }

namespace Ln {

enum HtlcScriptType {
	NotHtlc,
	/* Offered by the commitment holder.  */
	OfferedHtlc,
	/* Received by the commitment holder.  */
	ReceivedHtlc
};

/** Ln::classify_htlc_script
 *
 * @brief matches a witness script against the offered
 * and received HTLC output templates of non-anchor
 * commitment transactions.
 *
 * @desc Keys and hashes are matched as any data push,
 * except the preimage size constant which must be a
 * single-byte push.
 * Scripts with truncated pushes match nothing.
 */
HtlcScriptType classify_htlc_script(std::vector<std::uint8_t> const& script);

/** Ln::spends_htlc_output
 *
 * @brief true if the witness of this input ends with a
 * script matching either HTLC template.
 */
bool spends_htlc_output(Bitcoin::TxIn const& txin);

/** Ln::extract_htlc_preimage
 *
 * @brief if this input spends an HTLC output along the
 * payment-preimage path, return the preimage.
 *
 * @desc The preimage is the 32-byte witness element just
 * below the witness script.
 * Returns a null preimage if the input does not spend
 * an HTLC output or took the timeout or revocation path.
 */
Ln::Preimage extract_htlc_preimage(Bitcoin::TxIn const& txin);

}

#endif /* !defined(LN_HTLC_SCRIPT_HPP) */
