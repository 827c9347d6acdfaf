#pragma once

#include <map>
#include <string>
#include <vector>

namespace rcs::process
{

using EnvironmentMap = std::map<std::string, std::string>;

// Merges environment layers in order. A key present in a later layer
// replaces the value from every earlier one:
//   base < overrides < forced
EnvironmentMap layer_environment(EnvironmentMap const &base,
                                 EnvironmentMap const &overrides,
                                 EnvironmentMap const &forced);

// Snapshot of the calling process environment.
EnvironmentMap current_environment();

// "KEY=VALUE" strings in key order, the shape execve() and posix_spawn()
// expect once each entry's c_str() is collected.
std::vector<std::string> to_envp_entries(EnvironmentMap const &environment);

} // namespace rcs::process
