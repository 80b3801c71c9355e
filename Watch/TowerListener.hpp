#ifndef WATCH_TOWERLISTENER_HPP
#define WATCH_TOWERLISTENER_HPP

#include"Bitcoin/Tx.hpp"
#include"Ev/Event.hpp"
#include"Ev/Queue.hpp"

namespace Watch {

/** struct Watch::TowerListener
 *
 * @brief lets an observer follow the watchtower's work
 * on one funding outpoint.
 *
 * @desc `broadcasts` receives every sweep successfully
 * broadcast for the channel; `done` is set once the
 * channel is retired.
 * Copies share the same event and queue.
 */
struct TowerListener {
	Ev::Event done;
	Ev::Queue<Bitcoin::Tx> broadcasts;
};

}

#endif /* !defined(WATCH_TOWERLISTENER_HPP) */
