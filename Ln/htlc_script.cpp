#include"Bitcoin/TxIn.hpp"
#include"Ln/Preimage.hpp"
#include"Ln/htlc_script.hpp"

namespace {

/* Thrown by below if eof or unmatched.  */
struct Error { };

auto constexpr OP_PUSHDATA1 = std::uint8_t(0x4c);
auto constexpr OP_PUSHDATA2 = std::uint8_t(0x4d);
auto constexpr OP_PUSHDATA4 = std::uint8_t(0x4e);
auto constexpr OP_2 = std::uint8_t(0x52);
auto constexpr OP_IF = std::uint8_t(0x63);
auto constexpr OP_NOTIF = std::uint8_t(0x64);
auto constexpr OP_ELSE = std::uint8_t(0x67);
auto constexpr OP_ENDIF = std::uint8_t(0x68);
auto constexpr OP_DROP = std::uint8_t(0x75);
auto constexpr OP_DUP = std::uint8_t(0x76);
auto constexpr OP_SWAP = std::uint8_t(0x7c);
auto constexpr OP_SIZE = std::uint8_t(0x82);
auto constexpr OP_EQUAL = std::uint8_t(0x87);
auto constexpr OP_EQUALVERIFY = std::uint8_t(0x88);
auto constexpr OP_HASH160 = std::uint8_t(0xa9);
auto constexpr OP_CHECKSIG = std::uint8_t(0xac);
auto constexpr OP_CHECKMULTISIG = std::uint8_t(0xae);
auto constexpr OP_CHECKLOCKTIMEVERIFY = std::uint8_t(0xb1);

/* Walks a script one operation at a time.  */
class Reader {
private:
	std::vector<std::uint8_t> const& s;
	std::size_t i;

	std::uint8_t byte() {
		if (i >= s.size())
			throw Error();
		return s[i++];
	}
	/* Consume one op; for pushes, return the data length
	 * in `len`.  */
	std::uint8_t next(std::size_t& len) {
		auto op = byte();
		len = 0;
		if (op < OP_PUSHDATA1)
			len = op;
		else if (op == OP_PUSHDATA1)
			len = byte();
		else if (op == OP_PUSHDATA2) {
			len = byte();
			len |= std::size_t(byte()) << 8;
		} else if (op == OP_PUSHDATA4) {
			len = byte();
			len |= std::size_t(byte()) << 8;
			len |= std::size_t(byte()) << 16;
			len |= std::size_t(byte()) << 24;
		}
		if (op <= OP_PUSHDATA4) {
			if (s.size() - i < len)
				throw Error();
			i += len;
		}
		return op;
	}

public:
	explicit
	Reader(std::vector<std::uint8_t> const& s_) : s(s_), i(0) { }

	void expect(std::uint8_t op) {
		auto len = std::size_t();
		if (next(len) != op)
			throw Error();
	}
	void expect_push() {
		auto len = std::size_t();
		if (next(len) > OP_PUSHDATA4)
			throw Error();
	}
	void expect_push_of_size(std::size_t size) {
		auto len = std::size_t();
		if (next(len) > OP_PUSHDATA4 || len != size)
			throw Error();
	}
	void expect_end() {
		if (i != s.size())
			throw Error();
	}
};

/* The part common to both templates, up to the
 * preimage-size check.  */
void match_prefix(Reader& r) {
	r.expect(OP_DUP);
	r.expect(OP_HASH160);
	r.expect_push(); /* RIPEMD160(SHA256(revocationpubkey)) */
	r.expect(OP_EQUAL);
	r.expect(OP_IF);
	r.expect(OP_CHECKSIG);
	r.expect(OP_ELSE);
	r.expect_push(); /* remote_htlcpubkey */
	r.expect(OP_SWAP);
	r.expect(OP_SIZE);
	r.expect_push_of_size(1); /* 32 */
	r.expect(OP_EQUAL);
}

bool match_offered(std::vector<std::uint8_t> const& script) {
	auto r = Reader(script);
	try {
		match_prefix(r);
		r.expect(OP_NOTIF);
		r.expect(OP_DROP);
		r.expect(OP_2);
		r.expect(OP_SWAP);
		r.expect_push(); /* local_htlcpubkey */
		r.expect(OP_2);
		r.expect(OP_CHECKMULTISIG);
		r.expect(OP_ELSE);
		r.expect(OP_HASH160);
		r.expect_push(); /* RIPEMD160(payment_hash) */
		r.expect(OP_EQUALVERIFY);
		r.expect(OP_CHECKSIG);
		r.expect(OP_ENDIF);
		r.expect(OP_ENDIF);
		r.expect_end();
		return true;
	} catch (Error const&) {
		return false;
	}
}

bool match_received(std::vector<std::uint8_t> const& script) {
	auto r = Reader(script);
	try {
		match_prefix(r);
		r.expect(OP_IF);
		r.expect(OP_HASH160);
		r.expect_push(); /* RIPEMD160(payment_hash) */
		r.expect(OP_EQUALVERIFY);
		r.expect(OP_2);
		r.expect(OP_SWAP);
		r.expect_push(); /* local_htlcpubkey */
		r.expect(OP_2);
		r.expect(OP_CHECKMULTISIG);
		r.expect(OP_ELSE);
		r.expect(OP_DROP);
		r.expect_push(); /* cltv_expiry */
		r.expect(OP_CHECKLOCKTIMEVERIFY);
		r.expect(OP_DROP);
		r.expect(OP_CHECKSIG);
		r.expect(OP_ENDIF);
		r.expect(OP_ENDIF);
		r.expect_end();
		return true;
	} catch (Error const&) {
		return false;
	}
}

}

namespace Ln {

HtlcScriptType classify_htlc_script(std::vector<std::uint8_t> const& script) {
	if (match_offered(script))
		return OfferedHtlc;
	if (match_received(script))
		return ReceivedHtlc;
	return NotHtlc;
}

bool spends_htlc_output(Bitcoin::TxIn const& txin) {
	auto const& stack = txin.witness.witnesses;
	if (stack.empty())
		return false;
	return classify_htlc_script(stack.back()) != NotHtlc;
}

Ln::Preimage extract_htlc_preimage(Bitcoin::TxIn const& txin) {
	auto const& stack = txin.witness.witnesses;
	if (stack.size() < 2 || !spends_htlc_output(txin))
		return Ln::Preimage();
	auto const& candidate = stack[stack.size() - 2];
	if (candidate.size() != 32)
		return Ln::Preimage();
	auto ret = Ln::Preimage();
	ret.from_buffer(&candidate[0]);
	return ret;
}

}
