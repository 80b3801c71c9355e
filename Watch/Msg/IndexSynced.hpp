#ifndef WATCH_MSG_INDEXSYNCED_HPP
#define WATCH_MSG_INDEXSYNCED_HPP

namespace Watch { class ChainIndexIF; }

namespace Watch { namespace Msg {

/** struct Watch::Msg::IndexSynced
 *
 * @brief the given index has finished a synchronization
 * pass and is now up to date.
 */
struct IndexSynced {
	Watch::ChainIndexIF* index;
};

}}

#endif /* !defined(WATCH_MSG_INDEXSYNCED_HPP) */
