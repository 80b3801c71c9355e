#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Sqlite3/Tx.hpp"
#include<assert.h>
#include<cstdint>
#include<string>
#include<vector>

namespace {

std::size_t count_rows(Sqlite3::Tx& tx) {
	auto table = std::string("sweeps");
	auto res = tx.query("SELECT COUNT(*) FROM " + table + ";").execute();
	auto n = std::size_t(0);
	for (auto& r : res)
		n = r.get<std::size_t>(0);
	return n;
}

}

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto blob = std::vector<std::uint8_t>{0x02, 0x00, 0x00, 0xff, 0x00, 0x7f};

	auto empty_transaction = [&]() {
		return db.transact().then([&](Sqlite3::Tx tx) {
			tx.commit();
			return Ev::lift();
		});
	};

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.rollback();
		assert(!tx);

		/* Transactions from several greenthreads queue
		 * up instead of nesting.  */
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::yield(3);
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE sweeps (outpoint TEXT NOT NULL, ctn INTEGER, tx BLOB);
		CREATE INDEX idx_sweeps ON sweeps (outpoint);
		)QRY");
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query("INSERT INTO sweeps VALUES(:o, :ctn, :tx)")
			.bind(":o", "aa:0")
			.bind(":ctn", std::uint64_t(7))
			.bind(":tx", blob)
			.execute()
			;
		for (auto& r : res) {
			(void) r;
			/* INSERT yields no rows.  */
			assert(false);
		}
		tx.query("INSERT INTO sweeps VALUES(:o, NULL, NULL)")
			.bind(":o", std::string("bb:1"))
			.execute()
			;
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query(R"QRY(
		SELECT ctn, tx FROM sweeps WHERE outpoint = :o;
		)QRY")
			.bind(":o", "aa:0")
			.execute()
			;
		auto flag = false;
		for (auto& r : res) {
			assert(!flag);
			flag = true;
			assert(r.get<std::uint64_t>(0) == 7);
			/* Embedded NUL bytes survive.  */
			assert(r.get<std::vector<std::uint8_t>>(1) == blob);
		}
		assert(flag);

		auto res2 = tx.query(R"QRY(
		SELECT ctn, tx FROM sweeps WHERE outpoint = 'bb:1';
		)QRY").execute();
		flag = false;
		for (auto& r : res2) {
			flag = true;
			assert(r.is_null(0));
			assert(r.is_null(1));
		}
		assert(flag);
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query("DELETE FROM sweeps;").execute();
		assert(count_rows(tx) == 0);
		/* Dropped without commit: the delete is rolled
		 * back.  */
		return Ev::lift();
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(count_rows(tx) == 2);
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto threw = false;
		try {
			tx.query("SELECT * FROM sweeps WHERE outpoint = :o")
				.bind(":nonexistent", 1)
				;
		} catch (std::runtime_error const&) {
			threw = true;
		}
		assert(threw);
		tx.commit();

		return Ev::lift(0);
	});

	return Ev::start(code);
}
