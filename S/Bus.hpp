#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include"S/Subscription.hpp"
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief signal bus for broadcasting messages and
 * subscribing to broadcasts.
 *
 * @desc Messages are keyed by their C++ type.
 * The bus must outlive every subscriber that captured
 * a reference to it.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Bus();
	Bus(Bus&&);
	~Bus();

private:
	/* If the given type has no Signal object yet, the
	 * make function creates one.  */
	S::Detail::SignalBase&
	get_signal( std::type_index type
		  , std::function< std::unique_ptr<S::Detail::SignalBase>()
				 > make
		  );
	template<typename a>
	S::Detail::Signal<a>& get_signal_ex() {
		using Signal = S::Detail::Signal<a>;
		auto& sbase = get_signal( std::type_index(typeid(Signal))
					, []() -> std::unique_ptr<S::Detail::SignalBase> {
			return Util::make_unique<Signal>();
		});
		return static_cast<Signal&>(sbase);
	}

public:
	template<typename a>
	S::Subscription
	subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		return get_signal_ex<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return get_signal_ex<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
