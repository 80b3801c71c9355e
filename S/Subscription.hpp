#ifndef S_SUBSCRIPTION_HPP
#define S_SUBSCRIPTION_HPP

#include<functional>

namespace S {

/** class S::Subscription
 *
 * @brief handle to a single subscriber on an S::Bus.
 *
 * @desc Cancelling detaches the subscriber: later raises
 * no longer call it.
 * A raise that is already running the subscriber is not
 * interrupted.
 * Destroying the handle does *not* cancel.
 */
class Subscription {
private:
	std::function<void()> canceller;

public:
	Subscription() : canceller(nullptr) { }
	explicit
	Subscription(std::function<void()> canceller_)
		: canceller(std::move(canceller_)) { }

	void cancel();
	bool active() const { return bool(canceller); }
};

}

#endif /* !defined(S_SUBSCRIPTION_HPP) */
