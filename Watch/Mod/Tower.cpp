#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Watch/Mod/Tower.hpp"
#include"Watch/MonitorLoop.hpp"
#include"Watch/SpendGraphInspector.hpp"
#include"Watch/SweepStore.hpp"
#include"Watch/TowerListener.hpp"
#include"Watch/TowerSweeper.hpp"
#include"Watch/log.hpp"
#include"Watch/random_engine.hpp"
#include<algorithm>

namespace Watch { namespace Mod {

class Tower::Impl {
private:
	S::Bus& bus;

public:
	ChannelStatusTracker tracker;
	SweepStore store;
	SpendGraphInspector inspector;
	TowerSweeper sweeper;
	MonitorLoop loop;

	Impl( S::Bus& bus_
	    , Watch::ChainIndexIF& index
	    , Watch::BroadcasterIF& broadcaster
	    ) : bus(bus_)
	      , tracker()
	      , store(bus)
	      , inspector(bus, index, tracker)
	      , sweeper(bus, index, broadcaster, store, inspector)
	      , loop(bus, index, sweeper, inspector, tracker)
	      { }

	Ev::Io<void> start_watching() {
		return store.list_channels().then([this
						  ](std::vector<std::pair<Bitcoin::OutPoint, std::string>> lst) {
			std::shuffle(lst.begin(), lst.end(), random_engine);
			auto act = Ev::lift();
			for (auto const& c : lst)
				act += loop.track(c.first, c.second);
			loop.start();
			return act;
		});
	}

	Ev::Io<std::uint64_t>
	get_turn_number( Bitcoin::OutPoint const& funding
		       , std::string const& address
		       ) {
		return Ev::lift().then([this, funding, address]() {
			if (loop.is_tracked(address))
				return Ev::lift();
			return Watch::log( bus, Info
					 , "Tower: watching new channel: %s %s"
					 , std::string(funding).c_str()
					 , address.c_str()
					 )
			     + loop.track(funding, address)
			     ;
		}).then([this, funding, address]() {
			return store.get_turn_number(funding, address);
		});
	}
};

Tower::Tower(Tower&&) =default;
Tower::~Tower() =default;

Tower::Tower( S::Bus& bus
	    , Watch::ChainIndexIF& index
	    , Watch::BroadcasterIF& broadcaster
	    ) : pimpl(Util::make_unique<Impl>(bus, index, broadcaster)) { }

Ev::Io<void> Tower::start_watching() {
	return pimpl->start_watching();
}
Ev::Io<std::uint64_t>
Tower::get_turn_number( Bitcoin::OutPoint const& funding_outpoint
		      , std::string const& address
		      ) {
	return pimpl->get_turn_number(funding_outpoint, address);
}
Ev::Io<void>
Tower::add_sweep_transaction( Bitcoin::OutPoint const& funding_outpoint
			    , std::uint64_t ctn
			    , Bitcoin::OutPoint const& prevout
			    , Bitcoin::Tx const& tx
			    ) {
	return pimpl->store.add_sweep_transaction( funding_outpoint, ctn
						 , prevout, tx
						 );
}
Ev::Io<std::size_t>
Tower::count_stored_sweeps(Bitcoin::OutPoint const& funding_outpoint) {
	return pimpl->store.count_sweep_transactions(funding_outpoint);
}
Ev::Io<std::set<Bitcoin::OutPoint>> Tower::list_stored_sweeps() {
	return pimpl->store.list_sweep_outpoints();
}
Ev::Io<std::vector<std::pair<Bitcoin::OutPoint, std::string>>>
Tower::list_channels() {
	return pimpl->store.list_channels();
}
Watch::TowerListener
Tower::listen(Bitcoin::OutPoint const& funding_outpoint) {
	return pimpl->sweeper.listen(funding_outpoint);
}
Watch::ChannelStatus
Tower::status(Bitcoin::OutPoint const& funding_outpoint) const {
	return pimpl->loop.status(funding_outpoint);
}
bool Tower::is_watching(std::string const& address) const {
	return pimpl->loop.is_tracked(address);
}
Ev::Io<void> Tower::trigger() {
	return pimpl->loop.trigger();
}
Ev::Io<void> Tower::stop() {
	return pimpl->loop.stop();
}

}}
