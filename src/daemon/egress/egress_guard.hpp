#pragma once

#include "egress/http.hpp"
#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class GuardedHttpClient;

enum class PrivacyMode { Local, CloudOptIn };

const char* mode_name(PrivacyMode mode);

// Local -> CloudOptIn takes enable, credential and confirm, in that order.
enum class ConsentStep { None, Enabled, CredentialProvided, Confirmed };

const char* step_name(ConsentStep step);

struct AllowListEntry {
    EgressCategory category;
    std::string domain;
};

struct EgressRequest {
    std::string destination; // absolute URL
    EgressCategory category = EgressCategory::Transcription;
    size_t byte_estimate = 0;
};

struct EgressDecision {
    uint64_t sequence = 0;
    std::string destination;
    EgressCategory category = EgressCategory::Transcription;
    size_t byte_estimate = 0;
    std::string reason;
    bool allowed = false;
    std::chrono::system_clock::time_point timestamp;
};

// "2026-01-31T12:00:00.123Z"
std::string format_timestamp(std::chrono::system_clock::time_point tp);

struct ConsentStatus {
    PrivacyMode mode = PrivacyMode::Local;
    ConsentStep step = ConsentStep::None;
    std::optional<EgressCategory> category;
    std::string destination; // consented (or pending) host
    bool has_credential = false;
};

using GuardResult = std::expected<void, PipelineError>;

// The one place network access is decided. Constructed once at startup in
// Local mode and kept for the life of the process; every component that may
// reach the network receives it (or a client created from it) explicitly.
//
// Every authorize() call appends exactly one EgressDecision, allowed or not,
// and hands it to the registered sinks in append order.
class EgressGuard {
public:
    using DecisionSink = std::function<void(const EgressDecision&)>;

    explicit EgressGuard(std::vector<AllowListEntry> allow_list = {},
                         std::unique_ptr<HttpTransport> transport = nullptr);
    ~EgressGuard();

    EgressGuard(const EgressGuard&) = delete;
    EgressGuard& operator=(const EgressGuard&) = delete;

    GuardResult authorize(const EgressRequest& request);

    PrivacyMode mode() const;
    ConsentStatus consent() const;

    // Consent, step 1: names the category and destination (URL or host).
    GuardResult enable_cloud(EgressCategory category, const std::string& destination);
    // Step 2.
    GuardResult provide_credential(std::string credential);
    // Step 3: the disclosure must name the same destination as step 1.
    GuardResult confirm(const std::string& destination);
    // Back to Local immediately; the credential is discarded.
    void revoke();

    std::vector<AllowListEntry> allow_list() const;
    void set_allow_list(std::vector<AllowListEntry> entries);

    void add_sink(DecisionSink sink);
    void clear_sinks();

    // Most recent decisions, oldest first.
    std::vector<EgressDecision> decisions(size_t limit = SIZE_MAX) const;
    uint64_t decision_count() const;

    // The only way for other components to obtain network access.
    std::shared_ptr<GuardedHttpClient> make_client();

private:
    friend class GuardedHttpClient;

    // Decision and bearer credential (consented destination only) under one
    // lock, so a revoke() cannot fall between them.
    GuardResult authorize(const EgressRequest& request, std::optional<std::string>& credential);
    GuardResult authorize_locked(const EgressRequest& request);
    std::expected<HttpResponse, std::string> transmit(const HttpRequest& request);

    std::pair<bool, std::string> evaluate(const EgressRequest& request) const;
    void reset_consent();

    static constexpr size_t kRetainedDecisions = 4096;

    mutable std::mutex mutex_;
    PrivacyMode mode_ = PrivacyMode::Local;
    ConsentStep step_ = ConsentStep::None;
    std::optional<EgressCategory> consent_category_;
    std::string consent_host_;
    std::string credential_;
    std::vector<AllowListEntry> allow_list_;

    std::deque<EgressDecision> log_;
    uint64_t next_sequence_ = 1;
    std::vector<DecisionSink> sinks_;

    std::unique_ptr<HttpTransport> transport_;
};

// Network access handed to backends. Each send() is authorized first; the
// transport is never reached on a denial.
class GuardedHttpClient {
public:
    explicit GuardedHttpClient(EgressGuard& guard) : guard_(guard) {}

    std::expected<HttpResponse, PipelineError> send(HttpRequest request);

private:
    EgressGuard& guard_;
};
