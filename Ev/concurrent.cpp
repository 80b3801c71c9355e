#include<ev.h>
#include<iostream>
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"

namespace {

void concurrent_idle_handler(EV_P_ ev_idle *raw_idler, int) {
	auto idler = std::unique_ptr<ev_idle>(raw_idler);
	ev_idle_stop(EV_A_ idler.get());

	auto io_ptr = std::unique_ptr<Ev::Io<void>>(
		(Ev::Io<void>*) idler->data
	);

	io_ptr->run([]() { }, [](std::exception_ptr e) {
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& e) {
			std::cerr << "lnwatch: unhandled exception in "
				  << "concurrent task: "
				  << e.what()
				  << std::endl;
		} catch (...) {
			std::cerr << "lnwatch: unhandled exception of unknown "
				  << "type in concurrent task"
				  << std::endl;
		}
	});
}

}

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		auto io_ptr = Util::make_unique<Ev::Io<void>>(io);
		auto idler = Util::make_unique<ev_idle>();
		ev_idle_init(idler.get(), &concurrent_idle_handler);
		/* libev owns both from here.  */
		idler->data = (void*) io_ptr.release();
		ev_idle_start(EV_DEFAULT_ idler.release());
		pass();
	});
}

}
