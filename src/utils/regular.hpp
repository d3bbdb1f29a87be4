#pragma once
#include <optional>
#include <string>

#include "xblchat_export.hpp"

namespace Regular {

struct UrlParts {
    std::string scheme; // http / https / ws / wss，统一小写
    std::string host;
    int         port = 0; // 未显式给出时按 scheme 取默认端口
    std::string target;   // 路径加查询串，至少为 "/"

    /// @brief scheme://host:port，作为 HTTP 客户端的基地址
    std::string origin() const;
};

/// @brief 解析绝对 URL，例如 ws://localhost:8080/chat，格式不合法时返回 nullopt
XBLCHAT_API std::optional<UrlParts> parseUrl(const std::string& url);

} // namespace Regular
