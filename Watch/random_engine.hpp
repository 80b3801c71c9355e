#ifndef WATCH_RANDOM_ENGINE_HPP
#define WATCH_RANDOM_ENGINE_HPP

#include<random>

namespace Watch {

/* Seeded from the system entropy source at startup.  */
extern std::default_random_engine random_engine;

}

#endif /* !defined(WATCH_RANDOM_ENGINE_HPP) */
