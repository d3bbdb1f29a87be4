#include <catch2/catch.hpp>

#include "common_fakes.hpp"
#include "xbl/credential_pipeline.hpp"

static const std::string kUserAuth = "user/authenticate";
static const std::string kXstsAuth = "xsts/authorize";

struct PipelineFixture {
    int64_t           now = 1700000000;
    AuthConfig        config;
    CredentialCache   cache{std::nullopt};
    FakeHttpTransport http;

    Result<std::string> run() {
        UnixClock          clock = [this] { return now; };
        MSAL               msal(config, cache, http, clock);
        XstsExchanger      exchanger(config, http);
        CredentialPipeline pipeline(config, cache, msal, exchanger, clock);
        msal.setPollSleeper([](std::chrono::seconds) {});
        return pipeline.getCompositeCredential();
    }

    void seedMsaToken() { (void)cache.put(MSAL::kAccessStage, CredentialRecord{"", "msa-token", now + 3600}); }
};

TEST_CASE("composeCredential formats the authorization value", "[pipeline]") {
    CHECK(composeCredential("XBL3.0", "abc123", "tokval") == "XBL3.0 x=abc123;tokval");
}

TEST_CASE_METHOD(PipelineFixture, "A valid cached credential short-circuits the pipeline", "[pipeline]") {
    (void)cache.put(CredentialPipeline::kFinalStage, CredentialRecord{"", "XBL3.0 x=u;cached", now + 1});

    auto credential = run();
    REQUIRE(credential);
    CHECK(credential.value() == "XBL3.0 x=u;cached");
    CHECK(http.calls.empty());
}

TEST_CASE_METHOD(PipelineFixture, "A cached credential expiring now is fetched again", "[pipeline]") {
    (void)cache.put(CredentialPipeline::kFinalStage, CredentialRecord{"", "XBL3.0 x=u;old", now});
    seedMsaToken();
    http.enqueue(kUserAuth, 200, xstsBody("user-token", "uhsA"));
    http.enqueue(kXstsAuth, 200, xstsBody("xsts-token", "uhsB"));

    auto credential = run();
    REQUIRE(credential);
    CHECK(credential.value() == "XBL3.0 x=uhsB;xsts-token");
}

TEST_CASE_METHOD(PipelineFixture, "A full run composes from stage B and caches the result", "[pipeline]") {
    seedMsaToken();
    http.enqueue(kUserAuth, 200, xstsBody("user-token", "uhsA"));
    http.enqueue(kXstsAuth, 200, xstsBody("xsts-token", "uhsB"));

    auto credential = run();
    REQUIRE(credential);
    CHECK(credential.value() == "XBL3.0 x=uhsB;xsts-token");

    // stage B 收到的是 stage A 的令牌
    auto stage_b = nlohmann::json::parse(http.calls.at(1).body);
    CHECK(stage_b.at("Properties").at("UserTokens").at(0) == "user-token");
    CHECK(nlohmann::json::parse(http.calls.at(0).body).at("Properties").at("RpsTicket") == "d=msa-token");

    auto record = cache.get(CredentialPipeline::kFinalStage);
    REQUIRE(record.has_value());
    CHECK(record->secret == "XBL3.0 x=uhsB;xsts-token");
    CHECK(record->expires_at == now + 82800);

    SECTION("the next run is served from the cache") {
        now += 82799;
        auto again = run();
        REQUIRE(again);
        CHECK(again.value() == credential.value());
        CHECK(http.calls.size() == 2);
    }
}

TEST_CASE_METHOD(PipelineFixture, "The cached credential never outlives NotAfter", "[pipeline]") {
    now = 1704067200; // 2024-01-01T00:00:00Z
    seedMsaToken();
    http.enqueue(kUserAuth, 200, xstsBody("user-token", "uhsA"));
    http.enqueue(kXstsAuth, 200, xstsBody("xsts-token", "uhsB", "2024-01-01T01:00:00.0000000Z"));

    REQUIRE(run());
    CHECK(cache.get(CredentialPipeline::kFinalStage)->expires_at == now + 3600);
}

TEST_CASE_METHOD(PipelineFixture, "A custom scheme is used for composition", "[pipeline]") {
    config.scheme = "XBL2.0";
    seedMsaToken();
    http.enqueue(kUserAuth, 200, xstsBody("user-token", "uhsA"));
    http.enqueue(kXstsAuth, 200, xstsBody("xsts-token", "uhsB"));

    auto credential = run();
    REQUIRE(credential);
    CHECK(credential.value() == "XBL2.0 x=uhsB;xsts-token");
}

TEST_CASE_METHOD(PipelineFixture, "Failures propagate and leave no final record", "[pipeline]") {
    SECTION("stage A failure skips stage B") {
        seedMsaToken();
        http.enqueue(kUserAuth, 400, "{}");
        http.enqueue(kXstsAuth, 200, xstsBody("xsts-token", "uhsB"));

        auto credential = run();
        REQUIRE_FALSE(credential);
        CHECK(credential.error().kind == ErrorKind::NetworkFailure);
        CHECK(http.countCalls(kXstsAuth) == 0);
    }

    SECTION("stage B failure") {
        seedMsaToken();
        http.enqueue(kUserAuth, 200, xstsBody("user-token", "uhsA"));
        http.enqueue(kXstsAuth, 200, R"({"Token":"xsts-token","DisplayClaims":{"xui":[]}})");

        auto credential = run();
        REQUIRE_FALSE(credential);
        CHECK(credential.error().kind == ErrorKind::ProtocolError);
    }

    SECTION("no MSA token and interactive sign-in disabled") {
        config.interactive = false;

        auto credential = run();
        REQUIRE_FALSE(credential);
        CHECK(credential.error().kind == ErrorKind::AuthRequired);
        CHECK(http.calls.empty());
    }

    CHECK_FALSE(cache.get(CredentialPipeline::kFinalStage).has_value());
}
