#pragma once
#include <optional>
#include <string>

#include "config/app_config.hpp"
#include "net/http_transport.hpp"
#include "utils/result.hpp"
#include "xblchat_export.hpp"

struct DelegatedToken {
    std::string            token;
    std::string            user_hash;
    std::optional<int64_t> not_after; // NotAfter 换算成的 Unix 秒，缺失或无法解析时为空
};

/**
 * Xbox Live 的两次委托交换。只做请求与响应的转换，不缓存也不重试，
 * 缓存与重试策略由 CredentialPipeline 决定。
 */
class XBLCHAT_API XstsExchanger {
public:
    XstsExchanger(const AuthConfig& config, HttpTransport& transport);

    // MSA access token -> Xbox Live user token (user.auth.xboxlive.com)
    Result<DelegatedToken> exchangePrimaryToIntermediate(const std::string& primary_token);

    // user token -> XSTS token，RelyingParty 指向目标服务
    Result<DelegatedToken> exchangeIntermediateToFinal(const std::string& intermediate_token);

private:
    Result<DelegatedToken> postTokenRequest(const std::string& stage, const std::string& url, const std::string& body);

private:
    AuthConfig     mConfig;
    HttpTransport& mTransport;
};
