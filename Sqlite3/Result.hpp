#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include"Sqlite3/Detail/columns.hpp"
#include<iterator>

namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Result; }

namespace Sqlite3 {

/** class Sqlite3::Row
 *
 * @brief the current row of a result.
 */
class Row {
private:
	Result* r;

	friend class Sqlite3::Result;
	explicit
	Row(Result& r_) : r(&r_) { }
	Row() : r(nullptr) { }

public:
	Row(Row const&) =delete;

	template<typename a>
	a get(int c);
	/* True if the column is SQL NULL.  */
	bool is_null(int c);
};

/** class Sqlite3::Result
 *
 * @brief sequence of rows emitted by a query.
 *
 * @desc A `Sqlite3::Result` can only be traversed
 * once.
 */
class Result {
private:
	Sqlite3::Db db;
	void* stmt;

	friend class Sqlite3::Query;
	friend class Sqlite3::Row;

	Result(Sqlite3::Db const& db_, void* stmt_);

	/* Return false at end of result.  */
	bool advance();

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	/** Sqlite3::Result::iterator
	 *
	 * @brief input iterator over the remaining rows.
	 */
	class iterator : Row {
	private:
		friend class Sqlite3::Result;
		explicit
		iterator(Result& r_) : Row(r_) {
			if (!r->stmt)
				r = nullptr;
		}

	public:
		iterator() : Row() { }
		iterator(iterator const& o) : Row() {
			r = o.r;
		}

		bool operator==(iterator const& o) const {
			return o.r == r;
		}
		bool operator!=(iterator const& o) const {
			return o.r != r;
		}

		iterator& operator++() {
			if (r && !r->advance())
				r = nullptr;
			return *this;
		}

		typedef std::input_iterator_tag iterator_category;
		typedef Row* pointer;
		typedef Row& reference;
		typedef Row value_type;
		typedef std::ptrdiff_t difference_type;

		Row& operator*() {
			return *this;
		}
	};
	iterator begin() {
		return iterator(*this);
	}
	iterator end() {
		return iterator();
	}
};

template<typename a>
a Row::get(int c) {
	return Detail::Column<a>::column(r->stmt, c);
}

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
