#ifndef LN_PREIMAGE_HPP
#define LN_PREIMAGE_HPP

#include<cstdint>
#include<memory>
#include<string>

namespace Sha256 { class Hash; }

namespace Ln {

/** class Ln::Preimage
 *
 * @brief a 32-byte payment preimage, whose SHA256 is
 * the payment hash an HTLC is locked to.
 */
class Preimage {
private:
	struct Impl {
		std::uint8_t data[32];
	};
	std::shared_ptr<Impl> pimpl;

public:
	Preimage() =default;
	Preimage(Preimage const&) =default;
	Preimage(Preimage&&) =default;
	Preimage& operator=(Preimage const&) =default;
	Preimage& operator=(Preimage&&) =default;
	~Preimage() =default;

	static
	bool valid_string(std::string const&);
	explicit
	Preimage(std::string const&);

	explicit
	operator std::string() const;

	bool operator==(Preimage const&) const;
	bool operator!=(Preimage const& o) const {
		return !(*this == o);
	}

	/* False for the default-constructed preimage.  */
	explicit
	operator bool() const {
		return !!pimpl;
	}
	bool operator!() const {
		return !pimpl;
	}

	void from_buffer(std::uint8_t const data[32]) {
		pimpl = std::make_shared<Impl>();
		for (auto i = std::size_t(0); i < 32; ++i)
			pimpl->data[i] = data[i];
	}

	Sha256::Hash sha256() const;
};

}

#endif /* !defined(LN_PREIMAGE_HPP) */
