#include "regular.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

static int defaultPort(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws")
        return 80;
    if (scheme == "https" || scheme == "wss")
        return 443;
    return 0;
}

std::string Regular::UrlParts::origin() const { return scheme + "://" + host + ":" + std::to_string(port); }

std::optional<Regular::UrlParts> Regular::parseUrl(const std::string& url) {
    std::regex  urlRegex(R"xx(^([A-Za-z][A-Za-z0-9+.-]*)://([^/:?#\[\]]+|\[[0-9A-Fa-f:.]+\])(?::([0-9]{1,5}))?([/?][^#]*)?(#.*)?$)xx");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = match[1].str();
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parts.host = match[2].str();

    if (match[3].matched) {
        parts.port = std::stoi(match[3].str());
        if (parts.port <= 0 || parts.port > 65535)
            return std::nullopt;
    } else {
        parts.port = defaultPort(parts.scheme);
        if (parts.port == 0)
            return std::nullopt;
    }

    parts.target = match[4].matched ? match[4].str() : "/";
    if (parts.target.front() == '?')
        parts.target.insert(parts.target.begin(), '/');
    return parts;
}
