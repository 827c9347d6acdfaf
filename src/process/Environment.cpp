#include "process/Environment.hpp"

#include <string_view>

#if defined(_WIN32)
#include <cstdlib>
#else
extern char **environ;
#endif

namespace rcs::process
{

EnvironmentMap layer_environment(EnvironmentMap const &base,
                                 EnvironmentMap const &overrides,
                                 EnvironmentMap const &forced)
{
    EnvironmentMap merged = base;
    for (auto const *layer : {&overrides, &forced})
    {
        for (auto const &[key, value] : *layer)
        {
            merged.insert_or_assign(key, value);
        }
    }
    return merged;
}

EnvironmentMap current_environment()
{
    EnvironmentMap result;
#if defined(_WIN32)
    char **entries = _environ;
#else
    char **entries = environ;
#endif
    if (entries == nullptr)
    {
        return result;
    }
    for (; *entries != nullptr; ++entries)
    {
        std::string_view entry(*entries);
        // Windows keeps per-drive entries like "=C:=C:\\" that start with '='.
        auto separator = entry.find('=', 1);
        if (separator == std::string_view::npos)
        {
            continue;
        }
        result.emplace(std::string(entry.substr(0, separator)),
                       std::string(entry.substr(separator + 1)));
    }
    return result;
}

std::vector<std::string> to_envp_entries(EnvironmentMap const &environment)
{
    std::vector<std::string> entries;
    entries.reserve(environment.size());
    for (auto const &[key, value] : environment)
    {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

} // namespace rcs::process
