#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>
#include<utility>

namespace Sha256 { class Hasher; }

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte SHA256 digest.
 *
 * @desc A default-constructed hash is the all-zeroes
 * value and tests false.
 * Copies share storage, the bytes are never mutated
 * in place after construction except via from_buffer.
 */
class Hash {
private:
	struct Impl {
		std::uint8_t d[32];
	};
	std::shared_ptr<Impl> pimpl;

	explicit
	Hash(std::uint8_t const d[32]) {
		pimpl = std::make_shared<Impl>();
		for (auto i = std::size_t(0); i < 32; ++i)
			pimpl->d[i] = d[i];
	}

	friend class Sha256::Hasher;

public:
	Hash() =default;
	Hash(Hash const&) =default;
	Hash(Hash&&) =default;
	Hash& operator=(Hash const&) =default;
	Hash& operator=(Hash&&) =default;
	~Hash() =default;

	static
	bool valid_string(std::string const&);
	explicit
	Hash(std::string const&);

	explicit
	operator std::string() const;

	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& i) const {
		return !(*this == i);
	}
	/* Bytewise order, for use as a map key.  */
	bool operator<(Hash const&) const;

	void to_buffer(std::uint8_t d[32]) const {
		if (pimpl)
			for (auto i = std::size_t(0); i < 32; ++i)
				d[i] = pimpl->d[i];
		else
			for (auto i = std::size_t(0); i < 32; ++i)
				d[i] = 0;
	}
	void from_buffer(std::uint8_t const d[32]) {
		pimpl = std::make_shared<Impl>();
		for (auto i = std::size_t(0); i < 32; ++i)
			pimpl->d[i] = d[i];
	}
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& i) {
	return os << std::string(i);
}

}

#endif /* !defined(SHA256_HASH_HPP) */
