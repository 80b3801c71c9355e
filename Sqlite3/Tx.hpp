#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief Represents an ongoing database transaction.
 * Writes will only be committed when the tx is
 * committed.
 *
 * @desc This object is movable but not copyable.
 * A valid transaction that is destroyed without
 * `commit()` is rolled back.
 *
 * The default constructor creates an unusable, invalid
 * transaction; real ones come from
 * `Sqlite3::Db::transact`.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;

	explicit
	Tx(Sqlite3::Db const&);

public:
	Tx();
	Tx(Tx&&);
	~Tx();

	Tx& operator=(Tx&&);

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const& q);

	/** Sqlite3::Tx::query_execute
	 *
	 * @brief Executes one or more statements without
	 * parameters or results, e.g. table creation.
	 */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Pre-condition: the transaction is valid.
	 * Post-condition: the transaction is invalid.
	 * commit() throws std::runtime_error if COMMIT
	 * fails, after rolling back.
	 */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
