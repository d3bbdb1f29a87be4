#include "msal.hpp"

#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>

#include "utils/logger.hpp"

static constexpr int64_t kDefaultPollInterval = 5;
static constexpr int64_t kDefaultDeviceCodeLifetime = 900;
static constexpr int64_t kSlowDownIncrement = 5;

MSAL::MSAL(const AuthConfig& config, CredentialCache& cache, HttpTransport& transport, UnixClock clock)
    : mConfig(config),
      mCache(cache),
      mTransport(transport),
      mClock(std::move(clock)) {
    // 不经过 Logger：没有安装日志回调时用户也必须看到设备码
    mPrompt = [](const MsaDeviceCode& device_code) {
        std::cerr << "\n" << std::string(70, '*') << "\n" << device_code.message << "\n" << std::string(70, '*') << "\n" << std::endl;
    };
    mSleeper = [](std::chrono::seconds delay) { std::this_thread::sleep_for(delay); };
}

Result<std::string> MSAL::getOAuth2Token() {
    auto now = mClock();

    auto cached = mCache.get(kAccessStage);
    if (cached && cached->isValidAt(now)) {
        LOG_DEBUG("Using cached MSA access token");
        return cached->secret;
    }

    auto refresh = mCache.get(kRefreshStage);
    if (refresh && !refresh->secret.empty()) {
        LOG_INFO("Found cached refresh token, attempting silent token refresh");
        auto refreshed = refreshOAuth2Token(refresh->secret);
        if (refreshed) {
            storeToken(refreshed.value());
            LOG_INFO("MSA token refreshed successfully");
            return refreshed.value().access_token;
        }
        LOG_WARNING("Silent token refresh failed, initiating new auth flow: " + refreshed.error().describe());
    }

    if (!mConfig.interactive) {
        return Error{ErrorKind::AuthRequired, "no valid cached MSA token and interactive sign-in is disabled"};
    }

    auto token = deviceCodeLogin();
    if (!token) {
        return token.error();
    }
    storeToken(token.value());
    LOG_INFO("Authentication successful");
    return token.value().access_token;
}

Result<MsaOAuth2Token> MSAL::refreshOAuth2Token(const std::string& refresh_token) {
    auto res = postForm("token",
                        {
                            {"client_id", mConfig.client_id},
                            {"scope", mConfig.scopes},
                            {"grant_type", "refresh_token"},
                            {"refresh_token", refresh_token},
                        });
    if (!res) {
        return res.error();
    }

    const auto& response = res.value();
    if (response.status != 200) {
        MsaOAuth2Error error;
        try {
            error = nlohmann::json::parse(response.body).get<MsaOAuth2Error>();
        } catch (const nlohmann::json::exception&) {
            return Error{ErrorKind::NetworkFailure, "token refresh returned HTTP " + std::to_string(response.status)};
        }
        return Error{ErrorKind::AuthRequired, error.error + ": " + error.error_description};
    }

    try {
        auto token = nlohmann::json::parse(response.body).get<MsaOAuth2Token>();
        if (token.access_token.empty()) {
            return Error{ErrorKind::ProtocolError, "refresh response has no access_token"};
        }
        return token;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorKind::ProtocolError, std::string("malformed refresh response: ") + e.what()};
    }
}

Result<MsaOAuth2Token> MSAL::deviceCodeLogin() {
    LOG_INFO("Starting device code authentication flow");

    auto device_code = doDeviceCodeAuth();
    if (!device_code) {
        return device_code.error();
    }

    mPrompt(device_code.value());
    return doPollForDeviceCodeAuth(device_code.value());
}

Result<MsaDeviceCode> MSAL::doDeviceCodeAuth() {
    auto res = postForm("devicecode",
                        {
                            {"client_id", mConfig.client_id},
                            {"scope", mConfig.scopes},
                        });
    if (!res) {
        return res.error();
    }

    const auto& response = res.value();
    try {
        auto body = nlohmann::json::parse(response.body);
        if (response.status != 200) {
            auto error = body.get<MsaOAuth2Error>();
            return Error{ErrorKind::ProtocolError, "failed to initiate device flow: " + error.error + ": " + error.error_description};
        }
        auto device_code = body.get<MsaDeviceCode>();
        if (device_code.user_code.empty() || device_code.device_code.empty()) {
            return Error{ErrorKind::ProtocolError, "device code response has no user_code"};
        }
        return device_code;
    } catch (const nlohmann::json::exception& e) {
        if (response.status != 200) {
            return Error{ErrorKind::NetworkFailure, "device code request returned HTTP " + std::to_string(response.status)};
        }
        return Error{ErrorKind::ProtocolError, std::string("malformed device code response: ") + e.what()};
    }
}

Result<MsaOAuth2Token> MSAL::doPollForDeviceCodeAuth(const MsaDeviceCode& device_code) {
    int64_t interval = device_code.interval > 0 ? device_code.interval : kDefaultPollInterval;
    int64_t lifetime = device_code.expires_in > 0 ? device_code.expires_in : kDefaultDeviceCodeLifetime;

    for (int64_t waited = 0; waited < lifetime; waited += interval) {
        mSleeper(std::chrono::seconds(interval));

        auto res = postForm("token",
                            {
                                {"grant_type", "urn:ietf:params:oauth:grant-type:device_code"},
                                {"client_id", mConfig.client_id},
                                {"device_code", device_code.device_code},
                            });
        if (!res) {
            return res.error();
        }

        const auto& response = res.value();
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::exception& e) {
            if (response.status != 200) {
                return Error{ErrorKind::NetworkFailure, "device code poll returned HTTP " + std::to_string(response.status)};
            }
            return Error{ErrorKind::ProtocolError, std::string("malformed token response: ") + e.what()};
        }

        try {
            if (response.status == 200) {
                auto token = body.get<MsaOAuth2Token>();
                if (token.access_token.empty()) {
                    return Error{ErrorKind::ProtocolError, "token response has no access_token"};
                }
                return token;
            }

            auto error = body.get<MsaOAuth2Error>();
            if (error.error == "authorization_pending") {
                LOG_DEBUG("Waiting for the user to complete device sign-in...");
                continue;
            }
            if (error.error == "slow_down") {
                interval += kSlowDownIncrement;
                continue;
            }
            if (error.error == "authorization_declined" || error.error == "expired_token" || error.error == "bad_verification_code") {
                return Error{ErrorKind::AuthDeclinedOrExpired, error.error + ": " + error.error_description};
            }
            return Error{ErrorKind::ProtocolError, error.error + ": " + error.error_description};
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorKind::ProtocolError, std::string("unexpected token response: ") + e.what()};
        }
    }

    return Error{ErrorKind::AuthDeclinedOrExpired, "device code expired before sign-in was completed"};
}

Result<HttpResponse> MSAL::postForm(const std::string& endpoint, const std::multimap<std::string, std::string>& params) {
    httplib::Params payload(params.begin(), params.end());
    HttpHeaders     headers = {{"Cache-Control", "no-store, must-revalidate, no-cache"}, {"Accept", "application/json"}};
    return mTransport.post(endpointUrl(endpoint), headers, httplib::detail::params_to_query_str(payload), "application/x-www-form-urlencoded");
}

void MSAL::storeToken(const MsaOAuth2Token& token) {
    auto    now = mClock();
    int64_t ttl = token.expires_in > 0 ? token.expires_in : mConfig.primary_default_ttl_seconds;

    auto status = mCache.put(kAccessStage, CredentialRecord{kAccessStage, token.access_token, now + ttl});
    if (!status) {
        LOG_DEBUG("MSA access token kept in memory only: " + status.error().message);
    }

    if (!token.refresh_token.empty()) {
        status = mCache.put(kRefreshStage, CredentialRecord{kRefreshStage, token.refresh_token, std::nullopt});
        if (!status) {
            LOG_DEBUG("MSA refresh token kept in memory only: " + status.error().message);
        }
    }
}

std::string MSAL::endpointUrl(const std::string& endpoint) const {
    return mConfig.authority + "/" + mConfig.tenant + "/oauth2/v2.0/" + endpoint;
}
