#ifndef WATCH_MOD_WALLETWATCHER_HPP
#define WATCH_MOD_WALLETWATCHER_HPP

#include"Watch/ChannelStatus.hpp"
#include<memory>
#include<string>

namespace Bitcoin { struct OutPoint; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Watch { class ChainIndexIF; }
namespace Watch { class LnWalletIF; }
namespace Watch { struct SweepCandidate; }

namespace Watch { namespace Mod {

/** class Watch::Mod::WalletWatcher
 *
 * @brief watches the channels of our own wallet, and
 * queues sweeps with the wallet when they close.
 *
 * @desc Starts reacting to chain events on
 * construction.
 */
class WalletWatcher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	WalletWatcher() =delete;
	WalletWatcher(WalletWatcher const&) =delete;

	WalletWatcher(WalletWatcher&&);
	~WalletWatcher();

	WalletWatcher( S::Bus& bus
		     , Watch::ChainIndexIF& index
		     , Watch::LnWalletIF& wallet
		     );

	Ev::Io<void> track( Bitcoin::OutPoint const& funding_outpoint
			  , std::string const& address
			  );
	bool is_watching(std::string const& address) const;
	Watch::ChannelStatus status(Bitcoin::OutPoint const& funding_outpoint) const;

	Ev::Io<void> maybe_redeem(Watch::SweepCandidate const& candidate);

	Ev::Io<void> trigger();
	Ev::Io<void> stop();
};

}}

#endif /* !defined(WATCH_MOD_WALLETWATCHER_HPP) */
