#include "token_store.hpp"

#include "time_utils.hpp"

bool CredentialRecord::isValidAt(int64_t now) const { return expires_at.has_value() && *expires_at > now; }

void to_json(nlohmann::json& j, const CredentialRecord& record) {
    j = nlohmann::json{{"secret", record.secret}};
    if (record.expires_at) {
        j["expires_at"] = *record.expires_at;
    } else {
        j["expires_at"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, CredentialRecord& record) {
    j.at("secret").get_to(record.secret);
    auto it = j.find("expires_at");
    if (it == j.end() || it->is_null()) {
        record.expires_at.reset();
    } else {
        record.expires_at = it->get<int64_t>();
    }
}

std::string XstsToken::userHash() const {
    if (DisplayClaims.xui.empty()) return "";
    return DisplayClaims.xui.front().uhs;
}

std::optional<int64_t> XstsToken::notAfterUnix() const {
    if (NotAfter.empty()) return std::nullopt;
    return time_utils::parse_iso8601_unix(NotAfter);
}
