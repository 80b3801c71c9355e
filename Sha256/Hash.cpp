#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sodium/utils.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[32] = { 0 };

}

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}
Hash::Hash(std::string const& s) {
	auto bytes = Util::Str::hexread(s);
	if (bytes.size() != 32)
		throw Util::BacktraceException<std::invalid_argument>("Hashes must be 32 bytes.");
	pimpl = std::make_shared<Impl>();
	std::copy(bytes.begin(), bytes.end(), pimpl->d);
}

Hash::operator std::string() const {
	return Util::Str::hexdump(pimpl ? pimpl->d : zero, 32);
}
Hash::operator bool() const {
	if (!pimpl)
		return false;
	return 0 != sodium_memcmp(zero, pimpl->d, 32);
}
bool Hash::operator==(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return 0 == sodium_memcmp(a, b, 32);
}
bool Hash::operator<(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return std::lexicographical_compare(a, a + 32, b, b + 32);
}

}
