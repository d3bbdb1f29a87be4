#include "time_utils.hpp"

#include <cctype>
#include <cstdio>

namespace time_utils {
    int64_t unix_now() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    }

    std::optional<std::chrono::system_clock::time_point> parse_iso8601_utc(const std::string& s) {
        int  year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        int  consumed = 0;
        if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
            return std::nullopt;
        }

        // 小数秒被截断，只接受以 Z 结尾的 UTC 时间
        std::size_t pos = static_cast<std::size_t>(consumed);
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        }
        if (pos + 1 != s.size() || (s[pos] != 'Z' && s[pos] != 'z')) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok()) {
            return std::nullopt;
        }

        return std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second};
    }

    std::optional<int64_t> parse_iso8601_unix(const std::string& s) {
        auto tp = parse_iso8601_utc(s);
        if (!tp) return std::nullopt;
        return std::chrono::duration_cast<std::chrono::seconds>(tp->time_since_epoch()).count();
    }
}  // namespace time_utils
