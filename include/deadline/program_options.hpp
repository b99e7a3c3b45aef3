#pragma once
#include "deadline/runner.hpp"

#include <boost/program_options/options_description.hpp>

#include <optional>

namespace deadline
{

// =================================================================================================

/**
 * Adds the common options (--help, --debug, --threads, --trace) to \p desc and parses the command
 * line into \p options and any program specific options in \p desc.
 *
 * Returns an exit code if the program should terminate immediately, e.g. after printing the help
 * message or on invalid arguments.
 */
std::optional<int> parse_command_line(int argc, char* argv[],
                                      boost::program_options::options_description& desc,
                                      RunOptions& options);

// =================================================================================================

} // namespace deadline
