#include"Sqlite3/Db.hpp"
#include"Sqlite3/Result.hpp"
#include"Util/BacktraceException.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

Result::Result(Sqlite3::Db const& db_, void* stmt_
	      ) : db(db_), stmt(stmt_) {
	advance();
}
Result::Result(Result&& o) : db(std::move(o.db)), stmt(o.stmt) {
	o.stmt = nullptr;
}
Result::~Result() {
	if (stmt)
		sqlite3_finalize((sqlite3_stmt*) stmt);
}

bool Result::advance() {
	auto res = sqlite3_step((sqlite3_stmt*) stmt);
	if (res == SQLITE_ROW)
		return true;

	sqlite3_finalize((sqlite3_stmt*) stmt);
	stmt = nullptr;
	if (res == SQLITE_DONE)
		return false;

	auto err = std::string(sqlite3_errmsg((sqlite3*) db.get_connection()));
	throw Util::BacktraceException<std::runtime_error>(
		std::string("Sqlite3::Result: ") + err
	);
}

bool Row::is_null(int c) {
	return sqlite3_column_type((sqlite3_stmt*) r->stmt, c) == SQLITE_NULL;
}

}
