#include "xsts_exchanger.hpp"

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"
#include "utils/token_store.hpp"

XstsExchanger::XstsExchanger(const AuthConfig& config, HttpTransport& transport)
    : mConfig(config),
      mTransport(transport) {}

Result<DelegatedToken> XstsExchanger::exchangePrimaryToIntermediate(const std::string& primary_token) {
    nlohmann::json body = {
        {"RelyingParty", mConfig.user_relying_party},
        {"TokenType", "JWT"},
        {"Properties", {{"AuthMethod", "RPS"}, {"SiteName", "user.auth.xboxlive.com"}, {"RpsTicket", "d=" + primary_token}}},
    };
    return postTokenRequest("XBL", mConfig.user_auth_url, body.dump());
}

Result<DelegatedToken> XstsExchanger::exchangeIntermediateToFinal(const std::string& intermediate_token) {
    nlohmann::json body = {
        {"RelyingParty", mConfig.xsts_relying_party},
        {"TokenType", "JWT"},
        {"Properties", {{"SandboxId", "RETAIL"}, {"UserTokens", nlohmann::json::array({intermediate_token})}}},
    };
    return postTokenRequest("XSTS", mConfig.xsts_auth_url, body.dump());
}

Result<DelegatedToken> XstsExchanger::postTokenRequest(const std::string& stage, const std::string& url, const std::string& body) {
    HttpHeaders headers = {{"x-xbl-contract-version", "1"}, {"Accept", "application/json"}};

    auto res = mTransport.post(url, headers, body, "application/json");
    if (!res) {
        return res.error();
    }

    const auto& response = res.value();
    if (response.status != 200) {
        std::string detail = "HTTP " + std::to_string(response.status);
        // XSTS 拒绝时会带 XErr，例如 2148916233 表示账户没有 Xbox 档案
        try {
            auto error = nlohmann::json::parse(response.body).get<XstsError>();
            if (error.XErr != 0) {
                detail += ", XErr " + std::to_string(error.XErr);
            }
            if (!error.Message.empty()) {
                detail += ", " + error.Message;
            }
        } catch (const nlohmann::json::exception&) {
            LOG_DEBUG(stage + " error response is not JSON");
        }
        return Error{ErrorKind::NetworkFailure, stage + " token request failed: " + detail};
    }

    XstsToken token;
    try {
        token = nlohmann::json::parse(response.body).get<XstsToken>();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorKind::ProtocolError, "malformed " + stage + " token response: " + e.what()};
    }

    if (token.Token.empty()) {
        return Error{ErrorKind::ProtocolError, stage + " token response has no Token"};
    }
    if (token.userHash().empty()) {
        return Error{ErrorKind::ProtocolError, stage + " token response has no DisplayClaims.xui[0].uhs"};
    }

    LOG_INFO(stage + " token obtained");
    return DelegatedToken{token.Token, token.userHash(), token.notAfterUnix()};
}
