#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Sha256/HasherStream.hpp"
#include"Util/make_unique.hpp"

namespace Sha256 { namespace Detail {

class HasherStreamBuf::Impl {
public:
	Sha256::Hasher hasher;
	char buf[64];
};

HasherStreamBuf::HasherStreamBuf() : pimpl(Util::make_unique<Impl>()) {
	Base::setp(pimpl->buf, pimpl->buf + sizeof(pimpl->buf));
}
HasherStreamBuf::~HasherStreamBuf() =default;

HasherStreamBuf::int_type
HasherStreamBuf::overflow(HasherStreamBuf::int_type ch) {
	pimpl->hasher.feed(pbase(), pptr() - pbase());
	Base::setp(pimpl->buf, pimpl->buf + sizeof(pimpl->buf));
	if (ch != std::char_traits<char>::eof()) {
		*pbase() = (char_type) ch;
		pbump(1);
	}
	return ch;
}

Hash HasherStreamBuf::finalize()&& {
	overflow(std::char_traits<char>::eof());
	return std::move(pimpl->hasher).finalize();
}

HasherStreamBase::HasherStreamBase()
	: buf(Util::make_unique<HasherStreamBuf>()) { }

}

Hash HasherStream::finalize()&& {
	flush();
	return std::move(*buf).finalize();
}

}
