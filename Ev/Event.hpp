#ifndef EV_EVENT_HPP
#define EV_EVENT_HPP

#include<memory>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** class Ev::Event
 *
 * @brief one-shot signal that greenthreads can wait on.
 *
 * @desc Once `set`, every waiter (present and future)
 * resumes.
 * Setting an already-set event does nothing.
 * Copies share the same underlying state.
 */
class Event {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

public:
	Event();

	Ev::Io<void> set();
	Ev::Io<void> wait();
	bool is_set() const;
};

}

#endif /* !defined(EV_EVENT_HPP) */
