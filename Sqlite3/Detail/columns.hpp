#ifndef SQLITE3_DETAIL_COLUMNS_HPP
#define SQLITE3_DETAIL_COLUMNS_HPP

#include<cstdint>
#include<string>
#include<type_traits>
#include<vector>

namespace Sqlite3 { namespace Detail {

double column_d(void* stmt, int c);
std::int64_t column_i(void* stmt, int c);
std::string column_s(void* stmt, int c);
std::vector<std::uint8_t> column_b(void* stmt, int c);

template<typename a, typename = void>
struct Column;

/* Integers of every width, and bool.  */
template<typename a>
struct Column<a, typename std::enable_if<std::is_integral<a>::value>::type> {
	static
	a column(void* stmt, int c) {
		return a(column_i(stmt, c));
	}
};
template<typename a>
struct Column<a, typename std::enable_if<std::is_floating_point<a>::value>::type> {
	static
	a column(void* stmt, int c) {
		return a(column_d(stmt, c));
	}
};

template<>
struct Column<std::string> {
	static
	std::string column(void* stmt, int c) {
		return column_s(stmt, c);
	}
};
template<>
struct Column<std::vector<std::uint8_t>> {
	static
	std::vector<std::uint8_t> column(void* stmt, int c) {
		return column_b(stmt, c);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_COLUMNS_HPP) */
