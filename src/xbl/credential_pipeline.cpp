#include "credential_pipeline.hpp"

#include <algorithm>

#include "utils/logger.hpp"

std::string composeCredential(const std::string& scheme, const std::string& user_hash, const std::string& secret) {
    return scheme + " x=" + user_hash + ";" + secret;
}

CredentialPipeline::CredentialPipeline(const AuthConfig& config, CredentialCache& cache, MSAL& msal, XstsExchanger& exchanger, UnixClock clock)
    : mConfig(config),
      mCache(cache),
      mMsal(msal),
      mExchanger(exchanger),
      mClock(std::move(clock)) {}

Result<std::string> CredentialPipeline::getCompositeCredential() {
    auto cached = mCache.get(kFinalStage);
    if (cached && cached->isValidAt(mClock())) {
        LOG_INFO("Using cached " + mConfig.scheme + " token");
        return cached->secret;
    }

    LOG_INFO("Fetching new " + mConfig.scheme + " token...");

    auto msa_token = mMsal.getOAuth2Token();
    if (!msa_token) {
        LOG_ERROR("Failed to get MSA token: " + msa_token.error().describe());
        return msa_token.error();
    }

    auto xbl_token = mExchanger.exchangePrimaryToIntermediate(msa_token.value());
    if (!xbl_token) {
        LOG_ERROR("Failed to get XBL token: " + xbl_token.error().describe());
        return xbl_token.error();
    }

    auto xsts_token = mExchanger.exchangeIntermediateToFinal(xbl_token.value().token);
    if (!xsts_token) {
        LOG_ERROR("Failed to get XSTS token: " + xsts_token.error().describe());
        return xsts_token.error();
    }

    // XSTS 阶段的 uhs 才是最终凭据使用的用户标识
    const auto& final_token = xsts_token.value();
    std::string credential  = composeCredential(mConfig.scheme, final_token.user_hash, final_token.token);

    int64_t expires_at = mClock() + mConfig.final_ttl_seconds;
    if (final_token.not_after) {
        expires_at = std::min(expires_at, *final_token.not_after);
    }

    auto status = mCache.put(kFinalStage, CredentialRecord{kFinalStage, credential, expires_at});
    if (!status) {
        LOG_DEBUG(mConfig.scheme + " token kept in memory only: " + status.error().message);
    }

    LOG_INFO(mConfig.scheme + " token generated successfully (UHS: " + final_token.user_hash + ")");
    return credential;
}
