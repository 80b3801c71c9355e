#include"Bitcoin/OutPoint.hpp"
#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include"Watch/BreachRemedy.hpp"
#include"Watch/Mod/WalletWatcher.hpp"
#include"Watch/MonitorLoop.hpp"
#include"Watch/SpendGraphInspector.hpp"

namespace Watch { namespace Mod {

class WalletWatcher::Impl {
public:
	ChannelStatusTracker tracker;
	SpendGraphInspector inspector;
	BreachRemedy remedy;
	MonitorLoop loop;

	Impl( S::Bus& bus
	    , Watch::ChainIndexIF& index
	    , Watch::LnWalletIF& wallet
	    ) : tracker()
	      , inspector(bus, index, tracker)
	      , remedy(bus, index, wallet, inspector)
	      , loop(bus, index, remedy, inspector, tracker)
	      {
		loop.start();
	}
};

WalletWatcher::WalletWatcher(WalletWatcher&&) =default;
WalletWatcher::~WalletWatcher() =default;

WalletWatcher::WalletWatcher( S::Bus& bus
			    , Watch::ChainIndexIF& index
			    , Watch::LnWalletIF& wallet
			    ) : pimpl(Util::make_unique<Impl>(bus, index, wallet))
			      { }

Ev::Io<void>
WalletWatcher::track( Bitcoin::OutPoint const& funding_outpoint
		    , std::string const& address
		    ) {
	return pimpl->loop.track(funding_outpoint, address);
}
bool WalletWatcher::is_watching(std::string const& address) const {
	return pimpl->loop.is_tracked(address);
}
Watch::ChannelStatus
WalletWatcher::status(Bitcoin::OutPoint const& funding_outpoint) const {
	return pimpl->loop.status(funding_outpoint);
}
Ev::Io<void>
WalletWatcher::maybe_redeem(Watch::SweepCandidate const& candidate) {
	return pimpl->remedy.maybe_redeem(candidate);
}
Ev::Io<void> WalletWatcher::trigger() {
	return pimpl->loop.trigger();
}
Ev::Io<void> WalletWatcher::stop() {
	return pimpl->loop.stop();
}

}}
