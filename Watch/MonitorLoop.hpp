#ifndef WATCH_MONITORLOOP_HPP
#define WATCH_MONITORLOOP_HPP

#include"Watch/ChannelStatus.hpp"
#include<cstddef>
#include<memory>
#include<string>

namespace Bitcoin { struct OutPoint; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Watch { class ChainIndexIF; }
namespace Watch { class ResolverIF; }
namespace Watch { class SpendGraphInspector; }

namespace Watch {

/** class Watch::MonitorLoop
 *
 * @brief re-evaluates every tracked channel whenever the
 * chain index reports progress.
 *
 * @desc Nothing is evaluated before `start`.
 * After `start`, each `Watch::Msg::ChainTip`,
 * `Watch::Msg::TxVerified` and `Watch::Msg::IndexSynced`
 * from our own chain index triggers one pass over all
 * tracked channels, in random order.
 * Passes never overlap.
 *
 * A channel whose resolver says it no longer needs
 * watching is untracked and retired, exactly once.
 *
 * A `std::runtime_error` while evaluating one channel
 * is logged and the pass moves on to the next channel.
 * Any other exception aborts the pass and propagates to
 * whoever raised the chain event.
 */
class MonitorLoop {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	MonitorLoop() =delete;
	MonitorLoop(MonitorLoop const&) =delete;

	MonitorLoop(MonitorLoop&&);
	~MonitorLoop();

	MonitorLoop( S::Bus& bus
		   , Watch::ChainIndexIF& index
		   , Watch::ResolverIF& resolver
		   , Watch::SpendGraphInspector& inspector
		   , Watch::ChannelStatusTracker const& tracker
		   );

	void start();

	/* Tracking an address again replaces the funding
	 * outpoint it maps to; the channel is still
	 * evaluated once per pass.  */
	Ev::Io<void> track( Bitcoin::OutPoint const& funding_outpoint
			  , std::string const& address
			  );
	bool is_tracked(std::string const& address) const;
	std::size_t count_tracked() const;

	Watch::ChannelStatus status(Bitcoin::OutPoint const& funding_outpoint) const;

	/* Run one pass now, after any pass in progress.  */
	Ev::Io<void> trigger();

	/* Stop reacting to chain events.
	 * Completes once any pass in progress has.  */
	Ev::Io<void> stop();
};

}

#endif /* !defined(WATCH_MONITORLOOP_HPP) */
