#include"Bitcoin/Tx.hpp"
#include"Ev/Event.hpp"
#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/make_unique.hpp"
#include"Watch/Msg/DbResource.hpp"
#include"Watch/SweepStore.hpp"

namespace Watch {

class SweepStore::Impl {
private:
	S::Bus& bus;
	Sqlite3::Db db;
	Ev::Event ready;

	void start() {
		bus.subscribe<Msg::DbResource
			     >([this](Msg::DbResource const& r) {
			db = r.db;
			return init() + ready.set();
		});
	}

	Ev::Io<void> init() {
		return db.transact().then([](Sqlite3::Tx tx) {
			tx.query_execute(R"QRY(
			CREATE TABLE IF NOT EXISTS channel_info
			     ( outpoint VARCHAR(34) NOT NULL
			     , address VARCHAR(32)
			     , PRIMARY KEY (outpoint)
			     );
			CREATE TABLE IF NOT EXISTS sweep_txs
			     ( funding_outpoint VARCHAR(34) NOT NULL
			     , ctn INTEGER NOT NULL
			     , prevout VARCHAR(34)
			     , tx BLOB
			     );
			CREATE INDEX IF NOT EXISTS
			    idx_sweep_txs_funding_prevout
			    ON sweep_txs (funding_outpoint, prevout);
			)QRY");
			tx.commit();
			return Ev::lift();
		});
	}

public:
	static
	void ensure_channel( Sqlite3::Tx& tx
			   , Bitcoin::OutPoint const& funding
			   , std::string const& address
			   ) {
		tx.query(R"QRY(
		INSERT OR IGNORE
		  INTO channel_info (outpoint, address)
		VALUES (:outpoint, :address);
		)QRY")
			.bind(":outpoint", std::string(funding))
			.bind(":address", address)
			.execute()
			;
	}
	static
	void delete_sweeps(Sqlite3::Tx& tx, Bitcoin::OutPoint const& funding) {
		tx.query(R"QRY(
		DELETE FROM sweep_txs
		 WHERE funding_outpoint = :funding;
		)QRY")
			.bind(":funding", std::string(funding))
			.execute()
			;
	}
	static
	void delete_channel(Sqlite3::Tx& tx, Bitcoin::OutPoint const& funding) {
		tx.query(R"QRY(
		DELETE FROM channel_info
		 WHERE outpoint = :funding;
		)QRY")
			.bind(":funding", std::string(funding))
			.execute()
			;
	}

	explicit
	Impl(S::Bus& bus_) : bus(bus_) { start(); }

	Ev::Io<Sqlite3::Tx> transact() {
		return ready.wait().then([this]() {
			return db.transact();
		});
	}
};

SweepStore::SweepStore(SweepStore&&) =default;
SweepStore::~SweepStore() =default;

SweepStore::SweepStore(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }

Ev::Io<std::vector<Bitcoin::Tx>>
SweepStore::get_sweep_transactions( Bitcoin::OutPoint const& funding
				  , Bitcoin::OutPoint const& prevout
				  ) {
	return pimpl->transact().then([funding, prevout](Sqlite3::Tx tx) {
		auto fetch = tx.query(R"QRY(
		SELECT tx FROM sweep_txs
		 WHERE funding_outpoint = :funding
		   AND prevout = :prevout
		 ORDER BY ctn;
		)QRY")
			.bind(":funding", std::string(funding))
			.bind(":prevout", std::string(prevout))
			.execute()
			;
		auto ret = std::vector<Bitcoin::Tx>();
		for (auto& r : fetch)
			ret.emplace_back(r.get<std::vector<std::uint8_t>>(0));
		tx.commit();
		return Ev::lift(std::move(ret));
	});
}

Ev::Io<void>
SweepStore::add_sweep_transaction( Bitcoin::OutPoint const& funding
				 , std::uint64_t ctn
				 , Bitcoin::OutPoint const& prevout
				 , Bitcoin::Tx const& sweep
				 ) {
	auto raw = sweep.to_bytes();
	return pimpl->transact().then([funding, ctn, prevout, raw
				      ](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		INSERT INTO sweep_txs (funding_outpoint, ctn, prevout, tx)
		VALUES (:funding, :ctn, :prevout, :tx);
		)QRY")
			.bind(":funding", std::string(funding))
			.bind(":ctn", ctn)
			.bind(":prevout", std::string(prevout))
			.bind(":tx", raw)
			.execute()
			;
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<void>
SweepStore::remove_sweep_transactions(Bitcoin::OutPoint const& funding) {
	return pimpl->transact().then([funding](Sqlite3::Tx tx) {
		Impl::delete_sweeps(tx, funding);
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<std::uint64_t>
SweepStore::get_turn_number( Bitcoin::OutPoint const& funding
			   , std::string const& address
			   ) {
	return pimpl->transact().then([funding, address](Sqlite3::Tx tx) {
		Impl::ensure_channel(tx, funding, address);
		auto fetch = tx.query(R"QRY(
		SELECT COALESCE(MAX(ctn), 0) FROM sweep_txs
		 WHERE funding_outpoint = :funding;
		)QRY")
			.bind(":funding", std::string(funding))
			.execute()
			;
		auto ret = std::uint64_t(0);
		for (auto& r : fetch)
			ret = r.get<std::uint64_t>(0);
		tx.commit();
		return Ev::lift(ret);
	});
}

Ev::Io<std::size_t>
SweepStore::count_sweep_transactions(Bitcoin::OutPoint const& funding) {
	return pimpl->transact().then([funding](Sqlite3::Tx tx) {
		auto fetch = tx.query(R"QRY(
		SELECT COUNT(*) FROM sweep_txs
		 WHERE funding_outpoint = :funding;
		)QRY")
			.bind(":funding", std::string(funding))
			.execute()
			;
		auto ret = std::size_t(0);
		for (auto& r : fetch)
			ret = r.get<std::size_t>(0);
		tx.commit();
		return Ev::lift(ret);
	});
}

Ev::Io<std::set<Bitcoin::OutPoint>>
SweepStore::list_sweep_outpoints() {
	return pimpl->transact().then([](Sqlite3::Tx tx) {
		auto fetch = tx.query(R"QRY(
		SELECT DISTINCT funding_outpoint FROM sweep_txs;
		)QRY").execute();
		auto ret = std::set<Bitcoin::OutPoint>();
		for (auto& r : fetch)
			ret.insert(Bitcoin::OutPoint(r.get<std::string>(0)));
		tx.commit();
		return Ev::lift(std::move(ret));
	});
}

Ev::Io<std::vector<std::pair<Bitcoin::OutPoint, std::string>>>
SweepStore::list_channels() {
	return pimpl->transact().then([](Sqlite3::Tx tx) {
		auto fetch = tx.query(R"QRY(
		SELECT outpoint, address FROM channel_info;
		)QRY").execute();
		auto ret = std::vector<std::pair<Bitcoin::OutPoint, std::string>>();
		for (auto& r : fetch) {
			auto address = r.is_null(1) ? std::string()
						    : r.get<std::string>(1)
						    ;
			ret.emplace_back( Bitcoin::OutPoint(r.get<std::string>(0))
					, std::move(address)
					);
		}
		tx.commit();
		return Ev::lift(std::move(ret));
	});
}

Ev::Io<std::string>
SweepStore::get_address(Bitcoin::OutPoint const& funding) {
	return pimpl->transact().then([funding](Sqlite3::Tx tx) {
		auto fetch = tx.query(R"QRY(
		SELECT address FROM channel_info
		 WHERE outpoint = :funding;
		)QRY")
			.bind(":funding", std::string(funding))
			.execute()
			;
		auto ret = std::string();
		for (auto& r : fetch)
			if (!r.is_null(0))
				ret = r.get<std::string>(0);
		tx.commit();
		return Ev::lift(std::move(ret));
	});
}

Ev::Io<void> SweepStore::remove_channel(Bitcoin::OutPoint const& funding) {
	return pimpl->transact().then([funding](Sqlite3::Tx tx) {
		Impl::delete_channel(tx, funding);
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<void> SweepStore::retire(Bitcoin::OutPoint const& funding) {
	return pimpl->transact().then([funding](Sqlite3::Tx tx) {
		Impl::delete_sweeps(tx, funding);
		Impl::delete_channel(tx, funding);
		tx.commit();
		return Ev::lift();
	});
}

}
