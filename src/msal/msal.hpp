#pragma once
#include <chrono>
#include <functional>
#include <string>

#include "cache/credential_cache.hpp"
#include "config/app_config.hpp"
#include "net/http_transport.hpp"
#include "utils/result.hpp"
#include "utils/time_utils.hpp"
#include "utils/token_store.hpp"
#include "xblchat_export.hpp"

// 向用户展示设备码提示；调用返回后开始轮询
using DeviceCodePrompt = std::function<void(const MsaDeviceCode& device_code)>;
// 设备码轮询之间的等待，测试中替换为不阻塞的实现
using PollSleeper = std::function<void(std::chrono::seconds)>;

/**
 * 第一阶段：Microsoft 账户 OAuth2 access token。
 * 顺序为 缓存 -> refresh token 静默刷新 -> 设备码交互登录，任何一步成功都写回缓存。
 */
class XBLCHAT_API MSAL {
public:
    static constexpr const char* kAccessStage  = "msa";
    static constexpr const char* kRefreshStage = "msa_refresh";

    MSAL(const AuthConfig& config, CredentialCache& cache, HttpTransport& transport, UnixClock clock = time_utils::unix_now);

    void setDeviceCodePrompt(DeviceCodePrompt prompt) { mPrompt = std::move(prompt); }
    void setPollSleeper(PollSleeper sleeper) { mSleeper = std::move(sleeper); }

    Result<std::string> getOAuth2Token();

private:
    Result<MsaOAuth2Token> refreshOAuth2Token(const std::string& refresh_token);
    Result<MsaOAuth2Token> deviceCodeLogin();
    Result<MsaDeviceCode>  doDeviceCodeAuth();
    Result<MsaOAuth2Token> doPollForDeviceCodeAuth(const MsaDeviceCode& device_code);

    Result<HttpResponse> postForm(const std::string& endpoint, const std::multimap<std::string, std::string>& params);
    void                 storeToken(const MsaOAuth2Token& token);
    std::string          endpointUrl(const std::string& endpoint) const;

private:
    AuthConfig       mConfig;
    CredentialCache& mCache;
    HttpTransport&   mTransport;
    UnixClock        mClock;
    DeviceCodePrompt mPrompt;
    PollSleeper      mSleeper;
};
