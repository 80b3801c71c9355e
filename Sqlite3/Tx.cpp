#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<stdexcept>
#include<sqlite3.h>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool finished;

	sqlite3* connection() const {
		return (sqlite3*) db.get_connection();
	}
	[[noreturn]]
	void throw_sqlite3(char const* src) {
		auto err = std::string(sqlite3_errmsg(connection()));
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Tx: ") + src + ": " + err
		);
	}
	void finish(char const* cmd) {
		finished = true;
		auto res = sqlite3_exec(connection(), cmd, nullptr, nullptr, nullptr);
		if (res != SQLITE_OK && std::string(cmd) == "COMMIT") {
			auto err = std::string(sqlite3_errmsg(connection()));
			sqlite3_exec(connection(), "ROLLBACK", nullptr, nullptr, nullptr);
			db.transaction_finish();
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Tx: COMMIT: " + err
			);
		}
		db.transaction_finish();
	}

public:
	explicit
	Impl(Sqlite3::Db const& db_) : db(db_), finished(false) {
		auto res = sqlite3_exec(connection(), "BEGIN", nullptr, nullptr, nullptr);
		if (res != SQLITE_OK) {
			finished = true;
			db.transaction_finish();
			throw_sqlite3("BEGIN");
		}
	}
	~Impl() {
		if (!finished)
			finish("ROLLBACK");
	}

	void commit() { finish("COMMIT"); }
	void rollback() { finish("ROLLBACK"); }

	void query_execute(char const* q) {
		auto res = sqlite3_exec(connection(), q, nullptr, nullptr, nullptr);
		if (res != SQLITE_OK)
			throw_sqlite3(q);
	}

	Query query(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2( connection(), sql, -1
					     , &stmt, nullptr
					     );
		if (res != SQLITE_OK)
			throw_sqlite3(sql);
		return Query(db, stmt);
	}
};

Tx::Tx(Sqlite3::Db const& db)
		: pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() : pimpl(nullptr) { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	auto impl = std::move(pimpl);
	impl->commit();
}
void Tx::rollback() {
	auto impl = std::move(pimpl);
	impl->rollback();
}

Query Tx::query(char const* sql) {
	return pimpl->query(sql);
}
Query Tx::query(std::string const& sql) {
	return query(sql.c_str());
}

void Tx::query_execute(char const* q) {
	pimpl->query_execute(q);
}

}
