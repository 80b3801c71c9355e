#include"Util/BacktraceException.hpp"
#include"Watch/random_engine.hpp"
#include<errno.h>
#include<fcntl.h>
#include<stdexcept>
#include<string.h>
#include<unistd.h>

namespace {

std::default_random_engine initialize_random_engine() {
	auto seed = std::default_random_engine::result_type(0);

	auto fd = int(-1);
	do {
		fd = open("/dev/urandom", O_RDONLY);
	} while (fd < 0 && errno == EINTR);
	if (fd < 0)
		throw Util::BacktraceException<std::runtime_error>(
			std::string("open /dev/urandom: ") +
			strerror(errno)
		);

	auto res = read(fd, &seed, sizeof(seed));
	close(fd);
	if (res < 0)
		throw Util::BacktraceException<std::runtime_error>(
			std::string("read /dev/urandom: ") +
			strerror(errno)
		);

	return std::default_random_engine(seed);
}

}

namespace Watch {

std::default_random_engine random_engine = initialize_random_engine();

}
