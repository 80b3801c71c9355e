#ifndef WATCH_SWEEPCANDIDATE_HPP
#define WATCH_SWEEPCANDIDATE_HPP

#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/Tx.hpp"
#include<cstdint>
#include<map>
#include<string>

namespace Watch {

/** struct Watch::SweepCandidate
 *
 * @brief a proposed transaction claiming one output of a
 * channel close.
 *
 * @desc `name` is the role of the claimed output, such
 * as "to_local", "to_remote", "offered-htlc",
 * "received-htlc" or "second-stage-htlc", and is only
 * used for logging.
 * A zero `cltv_abs` or `csv_delay` means the claim has
 * no such timelock.
 */
struct SweepCandidate {
	std::string name;
	Bitcoin::OutPoint prevout;
	Bitcoin::Tx tx;
	std::uint32_t cltv_abs;
	std::uint32_t csv_delay;

	SweepCandidate() : cltv_abs(0), csv_delay(0) { }

	bool has_timelock() const {
		return cltv_abs != 0 || csv_delay != 0;
	}
};

typedef std::map<Bitcoin::OutPoint, SweepCandidate> SweepCandidates;

}

#endif /* !defined(WATCH_SWEEPCANDIDATE_HPP) */
