#pragma once
#include <string>

#include "cache/credential_cache.hpp"
#include "config/app_config.hpp"
#include "msal/msal.hpp"
#include "utils/result.hpp"
#include "utils/time_utils.hpp"
#include "xbl/xsts_exchanger.hpp"
#include "xblchat_export.hpp"

// "<scheme> x=<uhs>;<secret>"，例如 "XBL3.0 x=abc123;tokval"
XBLCHAT_API std::string composeCredential(const std::string& scheme, const std::string& user_hash, const std::string& secret);

/**
 * MSA -> XBL -> XSTS 的线性流水线。任何一步失败都直接返回错误，
 * 本次运行不会写入最终阶段的缓存。
 */
class XBLCHAT_API CredentialPipeline {
public:
    static constexpr const char* kFinalStage = "xbl3";

    CredentialPipeline(const AuthConfig& config,
                       CredentialCache&  cache,
                       MSAL&             msal,
                       XstsExchanger&    exchanger,
                       UnixClock         clock = time_utils::unix_now);

    Result<std::string> getCompositeCredential();

private:
    AuthConfig       mConfig;
    CredentialCache& mCache;
    MSAL&            mMsal;
    XstsExchanger&   mExchanger;
    UnixClock        mClock;
};
