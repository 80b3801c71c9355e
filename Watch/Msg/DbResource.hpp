#ifndef WATCH_MSG_DBRESOURCE_HPP
#define WATCH_MSG_DBRESOURCE_HPP

#include"Sqlite3/Db.hpp"

namespace Watch { namespace Msg {

/** struct Watch::Msg::DbResource
 *
 * @brief provides access to the database holding the
 * watchtower's sweep transactions and channel list.
 *
 * @desc raised once at startup, before any chain event.
 */
struct DbResource {
	Sqlite3::Db db;
};

}}

#endif /* !defined(WATCH_MSG_DBRESOURCE_HPP) */
