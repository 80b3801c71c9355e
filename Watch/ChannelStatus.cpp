#include"Watch/ChannelStatus.hpp"
#include<sstream>

namespace Watch {

ChannelStatus::operator std::string() const {
	switch (kind) {
	case Unknown: return "unknown";
	case Open: return "open";
	case ClosedDeep: return "closed (deep)";
	case Closed: break;
	}
	auto os = std::ostringstream();
	os << "closed (" << confirmations << ")";
	return os.str();
}

ChannelStatus ChannelStatusTracker::get(Bitcoin::OutPoint const& funding) const {
	auto it = table.find(funding);
	if (it == table.end())
		return ChannelStatus();
	return it->second;
}

}
