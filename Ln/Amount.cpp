#include"Ln/Amount.hpp"
#include<sstream>

namespace Ln {

Amount::operator std::string() const {
	auto os = std::ostringstream();
	if (v % 1000 == 0)
		os << (v / 1000) << "sat";
	else
		os << v << "msat";
	return os.str();
}

}
