#ifndef WATCH_STORE_COMMAND_HPP
#define WATCH_STORE_COMMAND_HPP

#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Watch { class SweepStore; }

namespace Watch {

/** Watch::store_command
 *
 * @brief runs one operator command against the tower
 * store and writes its output to `out`.
 *
 * @desc `args[0]` is the command:
 *
 * - `list-channels`: `<outpoint> <address>` per channel.
 * - `list-sweeps`: funding outpoints with sweeps.
 * - `count-sweeps <outpoint>`: sweeps stored for it.
 * - `forget <outpoint>`: drops the channel and its
 *   sweeps.
 *
 * Yields 0 on success and 2 for an unknown command.
 * Throws `Watch::BadOption` if a command is missing
 * its outpoint, and `Bitcoin::BadOutPoint` if the
 * outpoint does not parse.
 */
Ev::Io<int> store_command( Watch::SweepStore& store
			 , std::vector<std::string> const& args
			 , std::ostream& out
			 );

}

#endif /* !defined(WATCH_STORE_COMMAND_HPP) */
