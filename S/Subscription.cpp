#include"S/Subscription.hpp"

namespace S {

void Subscription::cancel() {
	if (!canceller)
		return;
	auto f = std::move(canceller);
	canceller = nullptr;
	f();
}

}
