#ifndef SQLITE3_DETAIL_BINDS_HPP
#define SQLITE3_DETAIL_BINDS_HPP

#include<cstddef>
#include<cstdint>
#include<string>
#include<type_traits>
#include<vector>

namespace Sqlite3 { namespace Detail {

void bind_d(void* stmt, int l, double);
void bind_i(void* stmt, int l, std::int64_t);
void bind_s(void* stmt, int l, std::string const&);
void bind_b(void* stmt, int l, std::vector<std::uint8_t> const&);
void bind_null(void* stmt, int l);

/* Integers of every width bind as int64, bool as 0/1.  */
template<typename a, typename = void>
struct Bind;

template<typename a>
struct Bind<a, typename std::enable_if<std::is_integral<a>::value>::type> {
	static void bind(void* stmt, int l, a v) {
		bind_i(stmt, l, std::int64_t(v));
	}
};
template<typename a>
struct Bind<a, typename std::enable_if<std::is_floating_point<a>::value>::type> {
	static void bind(void* stmt, int l, a v) {
		bind_d(stmt, l, double(v));
	}
};

template<>
struct Bind<char const*> {
	static void bind(void* stmt, int l, char const* v) {
		bind_s(stmt, l, v);
	}
};
template<>
struct Bind<std::string> {
	static void bind(void* stmt, int l, std::string const& v) {
		bind_s(stmt, l, v);
	}
};
/* Raw bytes bind as a BLOB.  */
template<>
struct Bind<std::vector<std::uint8_t>> {
	static void bind(void* stmt, int l, std::vector<std::uint8_t> const& v) {
		bind_b(stmt, l, v);
	}
};

template<>
struct Bind<std::nullptr_t> {
	static void bind(void* stmt, int l, std::nullptr_t) {
		bind_null(stmt, l);
	}
};

}}

#endif /* !defined(SQLITE3_DETAIL_BINDS_HPP) */
