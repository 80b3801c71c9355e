#include"Ln/Preimage.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[32] = { 0 };

}

namespace Ln {

bool Preimage::valid_string(std::string const& s) {
	return s.size() == 64
	    && Util::Str::ishex(s)
	     ;
}
Preimage::Preimage(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>("Ln::Preimage: wrong size.");
	auto buf = Util::Str::hexread(s);
	from_buffer(&buf[0]);
}

Preimage::operator std::string() const {
	return Util::Str::hexdump(pimpl ? pimpl->data : zero, 32);
}

bool Preimage::operator==(Preimage const& o) const {
	if (!pimpl || !o.pimpl)
		return !pimpl && !o.pimpl;
	return 0 == sodium_memcmp(pimpl->data, o.pimpl->data, 32);
}

Sha256::Hash Preimage::sha256() const {
	return Sha256::fun(pimpl ? pimpl->data : zero, 32);
}

}
