#ifndef WATCH_CHANNELSTATUS_HPP
#define WATCH_CHANNELSTATUS_HPP

#include"Bitcoin/OutPoint.hpp"
#include<cstdint>
#include<map>
#include<string>

namespace Watch {

/** struct Watch::ChannelStatus
 *
 * @brief human-facing on-chain status of a channel.
 *
 * @desc `confirmations` is meaningful only for
 * `Closed`.
 */
struct ChannelStatus {
	enum Kind {
		Unknown,
		Open,
		Closed,
		ClosedDeep
	};
	Kind kind;
	std::int32_t confirmations;

	ChannelStatus() : kind(Unknown), confirmations(0) { }

	static ChannelStatus open() {
		return ChannelStatus(Open, 0);
	}
	static ChannelStatus closed(std::int32_t confirmations) {
		return ChannelStatus(Closed, confirmations);
	}
	static ChannelStatus closed_deep() {
		return ChannelStatus(ClosedDeep, 0);
	}

	/* "unknown", "open", "closed (N)", "closed (deep)" */
	explicit
	operator std::string() const;

	bool operator==(ChannelStatus const& o) const {
		return kind == o.kind
		    && (kind != Closed || confirmations == o.confirmations)
		     ;
	}
	bool operator!=(ChannelStatus const& o) const {
		return !(*this == o);
	}

private:
	ChannelStatus(Kind kind_, std::int32_t confirmations_)
		: kind(kind_), confirmations(confirmations_) { }
};

/** class Watch::ChannelStatusTracker
 *
 * @brief per-funding-outpoint status table.
 *
 * @desc Written only by the spend graph inspector when
 * it examines a funding outpoint.
 */
class ChannelStatusTracker {
private:
	std::map<Bitcoin::OutPoint, ChannelStatus> table;

public:
	void set(Bitcoin::OutPoint const& funding, ChannelStatus status) {
		table[funding] = status;
	}
	/* Unknown for outpoints never examined.  */
	ChannelStatus get(Bitcoin::OutPoint const& funding) const;
	void erase(Bitcoin::OutPoint const& funding) {
		table.erase(funding);
	}
};

}

#endif /* !defined(WATCH_CHANNELSTATUS_HPP) */
