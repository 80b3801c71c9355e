#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action as the main greenthread
 * on the libev default loop, until the loop has nothing
 * left to do.
 *
 * @return the exit code the action yielded, 254 if the
 * action threw, or 255 if the loop could not start.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
