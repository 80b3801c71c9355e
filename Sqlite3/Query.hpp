#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Detail/binds.hpp"
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement waiting for its
 * parameters to be bound, then executed once.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	void* get_stmt() const;
	int get_location(char const*) const;

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	/** Sqlite3::Query::bind
	 *
	 * @brief binds a named parameter of the form :VVV.
	 * Throws std::runtime_error for an unknown name.
	 */
	template<typename a>
	Query& bind(char const* field, a value) {
		Detail::Bind<a>::bind( get_stmt(), get_location(field)
				     , std::move(value)
				     );
		return *this;
	}

	/** Sqlite3::Query::execute
	 *
	 * @brief runs the statement up to its first row.
	 * Unbound parameters are NULL.
	 * The query is invalid afterwards.
	 */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
