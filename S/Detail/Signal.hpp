#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include"S/Subscription.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<memory>

namespace S { namespace Detail {

/* Registers callbacks for a particular type a, and
 * broadcasts to all callbacks.  */
template<typename a>
class Signal : public SignalBase {
private:
	/* Singly-linked list, so that a raise in progress can
	 * keep walking while new subscribers are appended.
	 * Cancelled nodes stay in the list with an empty
	 * callback.
	 */
	struct Node {
		std::function<Ev::Io<void>(a const&)> callback;
		std::shared_ptr<Node> next;
	};
	std::shared_ptr<Node> first;
	Node* last;

	struct RaiseData {
		std::unique_ptr<a> value;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
		std::exception_ptr exc;
		bool starting;
		std::size_t running;

		explicit
		RaiseData(a value_) : value(Util::make_unique<a>(std::move(value_)))
				    , pass(nullptr)
				    , fail(nullptr)
				    , exc(nullptr)
				    , starting(true)
				    , running(0)
				    { }
		void finish_startup() {
			starting = false;
			if (running == 0)
				trigger();
		}
		void finish_one() {
			--running;
			if (!starting && running == 0)
				trigger();
		}
		void trigger() {
			value = nullptr;
			if (exc) {
				pass = nullptr;
				fail(exc);
			} else {
				fail = nullptr;
				pass();
			}
		}
	};

	static
	Ev::Io<void> raise_loop( std::shared_ptr<RaiseData> pdata
			       , std::shared_ptr<Node> it
			       ) {
		if (!it)
			return Ev::Io<void>([pdata]( std::function<void()> pass
						   , std::function<void(std::exception_ptr)> fail
						   ) {
				pdata->pass = std::move(pass);
				pdata->fail = std::move(fail);
				pdata->finish_startup();
			}) + Ev::yield();

		if (!it->callback)
			return raise_loop(std::move(pdata), it->next);

		auto callback = it->callback;
		return Ev::yield().then([pdata, callback]() {
			++pdata->running;
			auto action = Ev::Io<void>([ pdata, callback
						   ]( std::function<void()> pass
						    , std::function<void(std::exception_ptr)>
						    ) {
				/* A callback that throws instead of
				 * returning an action still counts as
				 * finished.  */
				auto act = Ev::lift().then([pdata, callback]() {
					return callback(*pdata->value);
				});
				act.run([pdata, pass]() {
					pass();
					pdata->finish_one();
				}, [pdata, pass](std::exception_ptr e) {
					pass();
					pdata->exc = e;
					pdata->finish_one();
				});
			});
			return Ev::concurrent(action);
		}).then([pdata, it]() {
			return raise_loop(pdata, it->next);
		});
	}

public:
	Signal() : first(), last(nullptr) { }

	/* Runs every subscriber concurrently and completes
	 * once all of them have.
	 * If any subscriber throws, the raise throws one of
	 * the exceptions after all have completed.
	 */
	Ev::Io<void> raise(a value) {
		auto pdata = std::make_shared<RaiseData>(std::move(value));
		return raise_loop(std::move(pdata), first);
	}

	S::Subscription
	subscribe(std::function<Ev::Io<void>(a const&)> callback) {
		if (!callback)
			return S::Subscription();
		auto nnode = std::make_shared<Node>();
		nnode->callback = std::move(callback);
		auto weak = std::weak_ptr<Node>(nnode);
		if (last) {
			last->next = std::move(nnode);
			last = last->next.get();
		} else {
			first = std::move(nnode);
			last = first.get();
		}
		return S::Subscription([weak]() {
			auto node = weak.lock();
			if (node)
				node->callback = nullptr;
		});
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
