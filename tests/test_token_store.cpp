#include <catch2/catch.hpp>

#include "utils/time_utils.hpp"
#include "utils/token_store.hpp"

TEST_CASE("CredentialRecord expiry boundary", "[token_store]") {
    const int64_t    now = 1700000000;
    CredentialRecord record{"msa", "secret", now};

    SECTION("expires_at equal to now is expired") {
        CHECK_FALSE(record.isValidAt(now));
        CHECK(record.isExpired(now));
    }

    SECTION("one second before expiry is still valid") { CHECK(record.isValidAt(now - 1)); }

    SECTION("one second after expiry is expired") { CHECK(record.isExpired(now + 1)); }

    SECTION("a record without expiry is never valid as an access token") {
        CredentialRecord refresh{"msa_refresh", "rt", std::nullopt};
        CHECK_FALSE(refresh.isValidAt(0));
    }
}

TEST_CASE("CredentialRecord JSON keeps null expiry", "[token_store]") {
    CredentialRecord record{"msa_refresh", "rt", std::nullopt};
    nlohmann::json   j = record;

    REQUIRE(j.at("expires_at").is_null());
    CHECK_FALSE(j.contains("stage_id"));

    auto parsed = j.get<CredentialRecord>();
    CHECK(parsed.secret == "rt");
    CHECK_FALSE(parsed.expires_at.has_value());
}

TEST_CASE("XstsToken exposes the first user hash", "[token_store]") {
    auto token = nlohmann::json::parse(R"({
        "IssueInstant": "2025-11-26T08:32:10.5118384Z",
        "NotAfter": "2025-11-27T00:32:10.5118384Z",
        "Token": "eyJ...",
        "DisplayClaims": {"xui": [{"uhs": "1234567890"}]}
    })")
                     .get<XstsToken>();

    CHECK(token.userHash() == "1234567890");
    REQUIRE(token.notAfterUnix().has_value());
    CHECK(*token.notAfterUnix() == 1764203530);

    XstsToken empty;
    CHECK(empty.userHash().empty());
    CHECK_FALSE(empty.notAfterUnix().has_value());
}

TEST_CASE("parse_iso8601_utc", "[time_utils]") {
    CHECK(time_utils::parse_iso8601_unix("1970-01-01T00:00:00Z") == 0);
    CHECK(time_utils::parse_iso8601_unix("2000-03-01T12:30:45.123Z") == 951913845);

    CHECK_FALSE(time_utils::parse_iso8601_unix("2025-02-30T00:00:00Z").has_value());
    CHECK_FALSE(time_utils::parse_iso8601_unix("2025-01-01T00:00:00+02:00").has_value());
    CHECK_FALSE(time_utils::parse_iso8601_unix("yesterday").has_value());
}
