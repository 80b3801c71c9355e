#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Util/BacktraceException.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include<stdexcept>
#include<queue>
#include<sqlite3.h>

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;

	bool in_transaction;
	/* Greenthreads blocked on transact().  */
	std::queue<std::function<void()>> blocked;

	void fail(char const* what) {
		auto msg = std::string("Not enough memory");
		if (connection) {
			msg = sqlite3_errmsg(connection);
			sqlite3_close_v2(connection);
			connection = nullptr;
		}
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Db: ") + what + ": " + msg
		);
	}

public:
	explicit
	Impl(std::string const& filename) : connection(nullptr)
					  , in_transaction(false)
					  {
		if (sqlite3_open(filename.c_str(), &connection) != SQLITE_OK)
			fail("sqlite3_open");
		if (sqlite3_extended_result_codes(connection, 1) != SQLITE_OK)
			fail("sqlite3_extended_result_codes");
		if (sqlite3_exec( connection, "PRAGMA foreign_keys = ON;"
				, nullptr, nullptr, nullptr
				) != SQLITE_OK)
			fail("PRAGMA foreign_keys = ON");
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	Ev::Io<void> acquire() {
		return Ev::Io<void>([this]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)>
					  ) {
			if (in_transaction)
				blocked.emplace(std::move(pass));
			else {
				in_transaction = true;
				pass();
			}
		});
	}
	void* get_connection() const { return connection; }
	void transaction_finish() {
		if (blocked.empty()) {
			in_transaction = false;
			return;
		}
		/* Hand the transaction slot directly to the next
		 * waiter.  */
		auto pass = std::move(blocked.front());
		blocked.pop();
		pass();
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	pimpl->transaction_finish();
}
Ev::Io<Sqlite3::Tx> Db::transact() {
	auto db = *this;
	return pimpl->acquire().then([]() {
		return Ev::yield();
	}).then([db]() {
		return Ev::lift(Sqlite3::Tx(db));
	});
}

Db::Db( std::string const& filename
      ) : pimpl(std::make_shared<Impl>(filename)) { }

}
