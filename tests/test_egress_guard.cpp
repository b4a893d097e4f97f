#include <catch2/catch_test_macros.hpp>

#include "egress/egress_guard.hpp"
#include "egress/url.hpp"
#include "mock_transport.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

EgressRequest transcription(const std::string& url, size_t bytes = 1000) {
    return {.destination = url, .category = EgressCategory::Transcription, .byte_estimate = bytes};
}

void opt_in(EgressGuard& guard, const std::string& destination) {
    REQUIRE(guard.enable_cloud(EgressCategory::Transcription, destination).has_value());
    REQUIRE(guard.provide_credential("sk-test").has_value());
    REQUIRE(guard.confirm(destination).has_value());
}

} // namespace

TEST_CASE("Url parsing", "[egress]") {

    SECTION("HttpsWithPath") {
        auto u = parse_url("https://API.OpenAI.com/v1/audio/transcriptions");
        REQUIRE(u.has_value());
        REQUIRE(u->scheme == "https");
        REQUIRE(u->host == "api.openai.com");
        REQUIRE(u->port == 443);
        REQUIRE(u->path == "/v1/audio/transcriptions");
    }

    SECTION("ExplicitPortAndUserinfo") {
        auto u = parse_url("http://user:pw@10.0.0.1:9090/inference");
        REQUIRE(u.has_value());
        REQUIRE(u->host == "10.0.0.1");
        REQUIRE(u->port == 9090);
    }

    SECTION("Ipv6") {
        auto u = parse_url("http://[::1]:8080/");
        REQUIRE(u.has_value());
        REQUIRE(u->host == "::1");
        REQUIRE(u->port == 8080);
    }

    SECTION("Rejected") {
        REQUIRE_FALSE(parse_url("ftp://example.com/").has_value());
        REQUIRE_FALSE(parse_url("example.com").has_value());
        REQUIRE_FALSE(parse_url("https://").has_value());
        REQUIRE_FALSE(parse_url("https://host:99999/").has_value());
    }

    SECTION("HostMatching") {
        REQUIRE(host_matches("api.openai.com", "openai.com"));
        REQUIRE(host_matches("openai.com", "openai.com"));
        REQUIRE_FALSE(host_matches("evilopenai.com", "openai.com"));
        REQUIRE_FALSE(host_matches("openai.com.evil.net", "openai.com"));
    }
}

TEST_CASE("EgressGuard", "[egress]") {
    EgressGuard guard;
    std::vector<EgressDecision> seen;
    guard.add_sink([&](const EgressDecision& d) { seen.push_back(d); });

    SECTION("StartsLocal") {
        REQUIRE(guard.mode() == PrivacyMode::Local);
        auto c = guard.consent();
        REQUIRE(c.step == ConsentStep::None);
        REQUIRE_FALSE(c.has_credential);
    }

    SECTION("LocalModeDeniesEverything") {
        auto r = guard.authorize(transcription("https://api.openai.com/v1/audio/transcriptions"));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::EgressDenied);

        REQUIRE(seen.size() == 1);
        REQUIRE_FALSE(seen[0].allowed);
        REQUIRE(seen[0].byte_estimate == 1000);
        REQUIRE(seen[0].reason == "local-only mode");
    }

    SECTION("EveryCallRecordedInOrder") {
        for (int i = 0; i < 5; ++i) {
            (void)guard.authorize(transcription("https://example.com/" + std::to_string(i)));
        }
        REQUIRE(guard.decision_count() == 5);
        auto log = guard.decisions();
        REQUIRE(log.size() == 5);
        for (size_t i = 0; i < log.size(); ++i) {
            REQUIRE(log[i].sequence == i + 1);
            REQUIRE(seen[i].sequence == i + 1);
        }
        REQUIRE(guard.decisions(2).front().sequence == 4);
    }

    SECTION("UnparsableDestinationDenied") {
        auto r = guard.authorize(transcription("not a url"));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(seen.back().reason == "unparsable destination");
    }

    SECTION("AllowListPermitsInLocalMode") {
        guard.set_allow_list({{EgressCategory::ModelDownload, "huggingface.co"}});

        auto ok = guard.authorize({.destination = "https://cdn.huggingface.co/ggml-base.bin",
                                   .category = EgressCategory::ModelDownload});
        REQUIRE(ok.has_value());
        REQUIRE(seen.back().allowed);

        // Category must match too
        auto other = guard.authorize(transcription("https://huggingface.co/transcribe"));
        REQUIRE_FALSE(other.has_value());
    }

    SECTION("AllowListAcceptsUrls") {
        guard.set_allow_list({{EgressCategory::UpdateCheck, "https://Updates.Example.org/feed"},
                              {EgressCategory::UpdateCheck, "not a host/"}});
        auto list = guard.allow_list();
        REQUIRE(list.size() == 1);
        REQUIRE(list[0].domain == "updates.example.org");
    }

    SECTION("FullConsentEnablesCloud") {
        opt_in(guard, "https://api.openai.com");
        REQUIRE(guard.mode() == PrivacyMode::CloudOptIn);

        auto c = guard.consent();
        REQUIRE(c.step == ConsentStep::Confirmed);
        REQUIRE(c.destination == "api.openai.com");
        REQUIRE(c.has_credential);

        REQUIRE(guard.authorize(transcription("https://api.openai.com/v1/audio/transcriptions")));
        REQUIRE(seen.back().allowed);
    }

    SECTION("CloudModeLimitedToConsentedDestination") {
        opt_in(guard, "api.openai.com");

        auto r = guard.authorize(transcription("https://other.example.com/v1"));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::EgressDenied);

        auto wrong_category = guard.authorize({.destination = "https://api.openai.com/models",
                                               .category = EgressCategory::UpdateCheck});
        REQUIRE_FALSE(wrong_category.has_value());
    }

    SECTION("StepsMustBeInOrder") {
        auto early_credential = guard.provide_credential("sk-test");
        REQUIRE_FALSE(early_credential.has_value());
        REQUIRE(early_credential.error().code == ErrorCode::InvalidState);

        REQUIRE(guard.enable_cloud(EgressCategory::Transcription, "api.openai.com"));
        auto early_confirm = guard.confirm("api.openai.com");
        REQUIRE_FALSE(early_confirm.has_value());
        REQUIRE(early_confirm.error().code == ErrorCode::InvalidState);
        REQUIRE(guard.mode() == PrivacyMode::Local);
    }

    SECTION("EmptyCredentialRejected") {
        REQUIRE(guard.enable_cloud(EgressCategory::Transcription, "api.openai.com"));
        auto r = guard.provide_credential("");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::ConsentRejected);
        REQUIRE(guard.consent().step == ConsentStep::Enabled);
    }

    SECTION("MismatchedDisclosureResetsConsent") {
        REQUIRE(guard.enable_cloud(EgressCategory::Transcription, "api.openai.com"));
        REQUIRE(guard.provide_credential("sk-test"));

        auto r = guard.confirm("https://api.evil.example/");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::ConsentRejected);
        REQUIRE(guard.mode() == PrivacyMode::Local);
        REQUIRE(guard.consent().step == ConsentStep::None);
        REQUIRE_FALSE(guard.consent().has_credential);
    }

    SECTION("InvalidDestinationRejected") {
        auto r = guard.enable_cloud(EgressCategory::Transcription, "ftp://files.example.com");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::ConsentRejected);
    }

    SECTION("EnableWhileCloudActiveRejected") {
        opt_in(guard, "api.openai.com");
        auto r = guard.enable_cloud(EgressCategory::Transcription, "other.example.com");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::InvalidState);
        REQUIRE(guard.consent().destination == "api.openai.com");
    }

    SECTION("RevokeReturnsToLocal") {
        opt_in(guard, "api.openai.com");
        guard.revoke();
        REQUIRE(guard.mode() == PrivacyMode::Local);
        REQUIRE_FALSE(guard.consent().has_credential);
        REQUIRE_FALSE(guard.authorize(transcription("https://api.openai.com/v1")).has_value());
    }

    SECTION("ClearedSinksNotCalled") {
        guard.clear_sinks();
        (void)guard.authorize(transcription("https://example.com/"));
        REQUIRE(seen.empty());
        REQUIRE(guard.decision_count() == 1);
    }
}

TEST_CASE("GuardedHttpClient", "[egress]") {
    auto transport = std::make_unique<MockTransport>();
    MockTransport* mock = transport.get();
    EgressGuard guard({}, std::move(transport));
    auto client = guard.make_client();

    HttpRequest req;
    req.url = "https://api.openai.com/v1/audio/transcriptions";
    req.form.push_back({"file", std::string(4000, 'x'), "audio.wav", "audio/wav"});

    SECTION("DeniedRequestNeverReachesTransport") {
        auto r = client->send(req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::EgressDenied);
        REQUIRE(mock->calls() == 0);
        REQUIRE(guard.decision_count() == 1);
        REQUIRE(guard.decisions().back().byte_estimate == req.byte_estimate());
    }

    SECTION("AuthorizedRequestCarriesCredential") {
        opt_in(guard, "api.openai.com");

        auto r = client->send(req);
        REQUIRE(r.has_value());
        REQUIRE(r->status == 200);
        REQUIRE(mock->calls() == 1);

        auto sent = mock->last();
        bool has_auth = false;
        for (auto& [name, value] : sent.headers) {
            if (name == "Authorization") has_auth = true;
        }
        REQUIRE(has_auth);
    }

    SECTION("AllowListedRequestHasNoCredential") {
        guard.set_allow_list({{EgressCategory::Transcription, "10.0.0.5"}});
        req.url = "http://10.0.0.5:8080/inference";

        REQUIRE(client->send(req).has_value());
        REQUIRE(mock->last().headers.empty());
    }

    SECTION("RevokeNeverStripsCredentialFromAllowedRequest") {
        // Consent toggles while requests go out: whatever is authorized under
        // cloud mode leaves with its credential.
        std::atomic<bool> done{false};
        std::thread toggler([&] {
            while (!done) {
                guard.enable_cloud(EgressCategory::Transcription, "api.openai.com");
                guard.provide_credential("sk-test");
                guard.confirm("api.openai.com");
                guard.revoke();
            }
        });

        size_t allowed = 0;
        for (int i = 0; i < 2000; ++i) {
            if (client->send(req)) ++allowed;
        }
        done = true;
        toggler.join();

        REQUIRE(mock->calls() == allowed);
        size_t without_credential = 0;
        for (auto& sent : mock->all()) {
            bool has_auth = false;
            for (auto& [name, value] : sent.headers) {
                if (name == "Authorization" && value == "Bearer sk-test") has_auth = true;
            }
            if (!has_auth) ++without_credential;
        }
        REQUIRE(without_credential == 0);
    }

    SECTION("TransportFailureReported") {
        opt_in(guard, "api.openai.com");
        mock->fail_with = "connection refused";

        auto r = client->send(req);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::NetworkFailure);
        // Authorized and logged even though the call failed
        REQUIRE(guard.decisions().back().allowed);
    }
}
