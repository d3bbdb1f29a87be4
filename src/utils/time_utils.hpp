#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "xblchat_export.hpp"

namespace time_utils {
    // 返回当前 Unix 时间戳（秒）
    XBLCHAT_API int64_t unix_now();

    // 解析 ISO8601 UTC 时间字符串，例如 "2025-11-26T08:32:10.5118384Z"
    // 成功返回 time_point，失败返回 nullopt
    XBLCHAT_API std::optional<std::chrono::system_clock::time_point> parse_iso8601_utc(const std::string& s);

    // 同上，直接换算成 Unix 秒
    XBLCHAT_API std::optional<int64_t> parse_iso8601_unix(const std::string& s);
}  // namespace time_utils

// 可注入的时钟，测试用固定时间替换
using UnixClock = std::function<int64_t()>;
