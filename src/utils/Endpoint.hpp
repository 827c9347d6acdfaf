#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace rcs::net
{

struct HostPort
{
    std::string host;
    std::string port;
    bool bracketed = false;
};

inline HostPort parse_host_port(std::string_view input)
{
    HostPort result;
    if (input.empty())
    {
        return result;
    }
    if (input.front() == '[')
    {
        auto closing = input.find(']');
        if (closing == std::string_view::npos)
        {
            result.host = std::string(input);
            return result;
        }
        result.host = std::string(input.substr(1, closing - 1));
        result.bracketed = true;
        if (closing + 1 < input.size() && input[closing + 1] == ':')
        {
            result.port = std::string(input.substr(closing + 2));
        }
        return result;
    }
    auto colon = input.find_last_of(':');
    if (colon == std::string_view::npos)
    {
        result.host = std::string(input);
        return result;
    }
    result.host = std::string(input.substr(0, colon));
    result.port = std::string(input.substr(colon + 1));
    return result;
}

constexpr std::array<std::string_view, 5> kLoopbackHosts = {
    "127.0.0.1", "localhost", "[::1]", "::1", "0:0:0:0:0:0:0:1"};

inline std::string trim_whitespace(std::string_view value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

inline bool is_loopback_host(std::string_view host)
{
    if (host.empty())
    {
        return false;
    }
    std::string normalized(trim_whitespace(host));
    if (normalized.size() >= 2 && normalized.front() == '[' &&
        normalized.back() == ']')
    {
        normalized = normalized.substr(1, normalized.size() - 2);
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    for (auto candidate : kLoopbackHosts)
    {
        if (normalized == candidate)
        {
            return true;
        }
    }
    return false;
}

// Splits "http://host:port/path" into host and port. Missing parts come back
// empty.
inline std::pair<std::string, std::string> parse_url_host_port(
    std::string_view value)
{
    if (value.empty())
    {
        return {std::string(), std::string()};
    }
    auto scheme = value.find("://");
    auto host_start = (scheme == std::string_view::npos) ? 0 : scheme + 3;
    auto host_end = value.find('/', host_start);
    std::string_view host_port;
    if (host_end == std::string_view::npos)
    {
        host_port = value.substr(host_start);
    }
    else
    {
        host_port = value.substr(host_start, host_end - host_start);
    }
    if (host_port.empty())
    {
        return {std::string(), std::string()};
    }
    auto parts = parse_host_port(host_port);
    return {parts.host, parts.port};
}

// "host:port" for an HTTP Host header; IPv6 literals are bracketed again.
inline std::string host_header_for_url(std::string_view url)
{
    auto [host, port] = parse_url_host_port(url);
    if (host.find(':') != std::string::npos)
    {
        host = "[" + host + "]";
    }
    if (!port.empty())
    {
        host += ":" + port;
    }
    return host;
}

} // namespace rcs::net
