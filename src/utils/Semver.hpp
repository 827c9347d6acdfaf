#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rcs::utils
{

// major.minor.patch[-prerelease][+build], ordered per semver 2.0.0.
// Build metadata is kept but never takes part in comparisons.
struct SemanticVersion
{
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> prerelease;
    std::vector<std::string> build;

    // Canonical form without build metadata, e.g. "1.60.0-beta.1".
    std::string to_string() const;
};

std::optional<SemanticVersion> parse_semver(std::string_view text);

// Accepts surrounding whitespace and a leading "v" or "=" ("v1.60.0").
std::optional<std::string> clean_semver(std::string_view text);

int compare_semver(SemanticVersion const &lhs, SemanticVersion const &rhs);

inline std::strong_ordering operator<=>(SemanticVersion const &lhs,
                                        SemanticVersion const &rhs)
{
    return compare_semver(lhs, rhs) <=> 0;
}

inline bool operator==(SemanticVersion const &lhs, SemanticVersion const &rhs)
{
    return compare_semver(lhs, rhs) == 0;
}

} // namespace rcs::utils
