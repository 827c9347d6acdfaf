#include "utils/Semver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace rcs::utils
{

namespace
{

bool is_numeric(std::string_view value)
{
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char ch)
                       { return std::isdigit(ch) != 0; });
}

bool is_identifier(std::string_view value)
{
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char ch)
                       { return std::isalnum(ch) != 0 || ch == '-'; });
}

std::optional<std::uint64_t> parse_number(std::string_view value)
{
    if (!is_numeric(value) || (value.size() > 1 && value.front() == '0'))
    {
        return std::nullopt;
    }
    std::uint64_t result = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size())
    {
        return std::nullopt;
    }
    return result;
}

std::optional<std::vector<std::string>> split_identifiers(
    std::string_view value, bool reject_leading_zero)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true)
    {
        auto dot = value.find('.', start);
        auto part = value.substr(start, dot == std::string_view::npos
                                            ? std::string_view::npos
                                            : dot - start);
        if (!is_identifier(part))
        {
            return std::nullopt;
        }
        if (reject_leading_zero && is_numeric(part) && part.size() > 1 &&
            part.front() == '0')
        {
            return std::nullopt;
        }
        parts.emplace_back(part);
        if (dot == std::string_view::npos)
        {
            break;
        }
        start = dot + 1;
    }
    return parts;
}

int compare_identifier(std::string const &lhs, std::string const &rhs)
{
    bool const lhs_numeric = is_numeric(lhs);
    bool const rhs_numeric = is_numeric(rhs);
    if (lhs_numeric && rhs_numeric)
    {
        if (lhs.size() != rhs.size())
        {
            return lhs.size() < rhs.size() ? -1 : 1;
        }
        return lhs.compare(rhs) < 0 ? -1 : (lhs == rhs ? 0 : 1);
    }
    // Numeric identifiers always have lower precedence than alphanumeric ones.
    if (lhs_numeric != rhs_numeric)
    {
        return lhs_numeric ? -1 : 1;
    }
    auto const result = lhs.compare(rhs);
    return result < 0 ? -1 : (result == 0 ? 0 : 1);
}

} // namespace

std::string SemanticVersion::to_string() const
{
    std::string result = std::to_string(major) + "." + std::to_string(minor) +
                         "." + std::to_string(patch);
    for (std::size_t i = 0; i < prerelease.size(); ++i)
    {
        result += i == 0 ? '-' : '.';
        result += prerelease[i];
    }
    return result;
}

std::optional<SemanticVersion> parse_semver(std::string_view text)
{
    SemanticVersion version;

    auto plus = text.find('+');
    if (plus != std::string_view::npos)
    {
        auto build = split_identifiers(text.substr(plus + 1), false);
        if (!build)
        {
            return std::nullopt;
        }
        version.build = std::move(*build);
        text = text.substr(0, plus);
    }

    auto dash = text.find('-');
    if (dash != std::string_view::npos)
    {
        auto prerelease = split_identifiers(text.substr(dash + 1), true);
        if (!prerelease)
        {
            return std::nullopt;
        }
        version.prerelease = std::move(*prerelease);
        text = text.substr(0, dash);
    }

    auto first_dot = text.find('.');
    if (first_dot == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto second_dot = text.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto major = parse_number(text.substr(0, first_dot));
    auto minor =
        parse_number(text.substr(first_dot + 1, second_dot - first_dot - 1));
    auto patch = parse_number(text.substr(second_dot + 1));
    if (!major || !minor || !patch)
    {
        return std::nullopt;
    }
    version.major = *major;
    version.minor = *minor;
    version.patch = *patch;
    return version;
}

std::optional<std::string> clean_semver(std::string_view text)
{
    std::string_view view = text;
    auto const begin = view.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return std::nullopt;
    }
    view = view.substr(begin, view.find_last_not_of(" \t\r\n") - begin + 1);
    while (!view.empty() && (view.front() == '=' || view.front() == 'v' ||
                             view.front() == 'V'))
    {
        view.remove_prefix(1);
    }
    auto parsed = parse_semver(view);
    if (!parsed)
    {
        return std::nullopt;
    }
    return parsed->to_string();
}

int compare_semver(SemanticVersion const &lhs, SemanticVersion const &rhs)
{
    if (lhs.major != rhs.major)
    {
        return lhs.major < rhs.major ? -1 : 1;
    }
    if (lhs.minor != rhs.minor)
    {
        return lhs.minor < rhs.minor ? -1 : 1;
    }
    if (lhs.patch != rhs.patch)
    {
        return lhs.patch < rhs.patch ? -1 : 1;
    }
    // A release ranks above any of its pre-releases.
    if (lhs.prerelease.empty() || rhs.prerelease.empty())
    {
        if (lhs.prerelease.empty() && rhs.prerelease.empty())
        {
            return 0;
        }
        return lhs.prerelease.empty() ? 1 : -1;
    }
    auto const common = std::min(lhs.prerelease.size(), rhs.prerelease.size());
    for (std::size_t i = 0; i < common; ++i)
    {
        if (auto result = compare_identifier(lhs.prerelease[i], rhs.prerelease[i]);
            result != 0)
        {
            return result;
        }
    }
    if (lhs.prerelease.size() == rhs.prerelease.size())
    {
        return 0;
    }
    return lhs.prerelease.size() < rhs.prerelease.size() ? -1 : 1;
}

} // namespace rcs::utils
