#pragma once
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "xblchat_export.hpp"

struct AuthConfig {
    std::string authority                   = "https://login.microsoftonline.com";
    std::string tenant                      = "consumers";
    std::string client_id                   = "93819583-abf7-4a5e-8b53-9526cf7e7ba9";
    std::string scopes                      = "XboxLive.signin XboxLive.offline_access offline_access";
    std::string user_auth_url               = "https://user.auth.xboxlive.com/user/authenticate";
    std::string xsts_auth_url               = "https://xsts.auth.xboxlive.com/xsts/authorize";
    std::string user_relying_party          = "http://auth.xboxlive.com";
    std::string xsts_relying_party          = "rp://api.minecraftservices.com/";
    std::string scheme                      = "XBL3.0";
    bool        interactive                 = true;
    int64_t     primary_default_ttl_seconds = 3600;
    int64_t     final_ttl_seconds           = 82800; // 23 小时
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(AuthConfig,
                                                authority,
                                                tenant,
                                                client_id,
                                                scopes,
                                                user_auth_url,
                                                xsts_auth_url,
                                                user_relying_party,
                                                xsts_relying_party,
                                                scheme,
                                                interactive,
                                                primary_default_ttl_seconds,
                                                final_ttl_seconds)
};

struct CacheConfig {
    std::string file_name = "xbl3_token_cache.json";
    std::string directory; // 为空时按运行目录、程序目录、临时目录的顺序查找
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(CacheConfig, file_name, directory)
};

struct RelayConfig {
    std::string url           = "ws://localhost:8080/chat";
    int         max_attempts  = 5;
    int64_t     base_delay_ms = 2000;
    int64_t     grace_ms      = 1000;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(RelayConfig, url, max_attempts, base_delay_ms, grace_ms)
};

struct HttpConfig {
    int64_t     connect_timeout_seconds = 10;
    int64_t     read_timeout_seconds    = 30;
    std::string user_agent              = "xblchat/1.0";
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(HttpConfig, connect_timeout_seconds, read_timeout_seconds, user_agent)
};

struct AppConfig {
    AuthConfig  auth;
    CacheConfig cache;
    RelayConfig relay;
    HttpConfig  http;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(AppConfig, auth, cache, relay, http)
};

// 文件不存在时返回默认配置；内容不合法时抛出 std::runtime_error
XBLCHAT_API AppConfig loadConfig(const std::filesystem::path& path);

// 把默认配置写到 path，便于用户修改
XBLCHAT_API void saveConfig(const std::filesystem::path& path, const AppConfig& config);
