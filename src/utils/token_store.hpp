#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "xblchat_export.hpp"

// ===== 缓存记录：每个阶段一条，按 stage_id 唯一 =====
struct XBLCHAT_API CredentialRecord {
    std::string            stage_id;
    std::string            secret;
    std::optional<int64_t> expires_at; // Unix 秒，没有则表示不随时间失效（如 refresh token）

    // expires_at 必须严格大于 now，等于 now 视为已过期
    bool isValidAt(int64_t now) const;
    bool isExpired(int64_t now) const { return !isValidAt(now); }

    bool operator==(const CredentialRecord& other) const = default;
};

// stage_id 是缓存文档里的键，不写入记录本身
XBLCHAT_API void to_json(nlohmann::json& j, const CredentialRecord& record);
XBLCHAT_API void from_json(const nlohmann::json& j, CredentialRecord& record);

// ===== 设备码登录 (oauth2/v2.0/devicecode 响应) =====
struct MsaDeviceCode {
    std::string device_code;
    std::string user_code;
    std::string verification_uri;
    int64_t     expires_in = 0;
    int64_t     interval   = 0;
    std::string message;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(MsaDeviceCode, device_code, user_code, verification_uri, expires_in, interval, message)
};

// ===== 用户令牌 (Microsoft 账户 OAuth 令牌) =====
struct MsaOAuth2Token {
    std::string token_type;
    std::string scope;
    int64_t     expires_in = 0;
    std::string access_token;
    std::string refresh_token;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(MsaOAuth2Token, token_type, scope, expires_in, access_token, refresh_token)
};

// ===== 身份提供方错误响应 (HTTP 400 等) =====
struct MsaOAuth2Error {
    std::string error;
    std::string error_description;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(MsaOAuth2Error, error, error_description)
};

// ===== user/authenticate 与 xsts/authorize 共用的响应结构 =====
struct XBLCHAT_API XstsToken {
    struct DisplayClaimsType {
        struct Xui {
            std::string gtg;
            std::string xid;
            std::string uhs;
            NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Xui, gtg, xid, uhs)
        };
        std::vector<Xui> xui;
        NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(DisplayClaimsType, xui)
    };

    std::string       IssueInstant;
    std::string       NotAfter;
    std::string       Token;
    DisplayClaimsType DisplayClaims;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(XstsToken, IssueInstant, NotAfter, Token, DisplayClaims)

    // 第一个 xui 声明中的 uhs，没有则为空串
    std::string            userHash() const;
    std::optional<int64_t> notAfterUnix() const;
};

// ===== XSTS 拒绝时的响应 (HTTP 401) =====
struct XstsError {
    std::string Identity;
    uint64_t    XErr = 0;
    std::string Message;
    std::string Redirect;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(XstsError, Identity, XErr, Message, Redirect)
};
