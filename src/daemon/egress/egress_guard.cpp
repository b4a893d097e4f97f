#include "egress/egress_guard.hpp"

#include "egress/url.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

const char* category_name(EgressCategory category) {
    switch (category) {
        case EgressCategory::Transcription: return "transcription";
        case EgressCategory::ModelDownload: return "model_download";
        case EgressCategory::UpdateCheck: return "update_check";
    }
    return "unknown";
}

std::optional<EgressCategory> parse_category(std::string_view name) {
    if (name == "transcription") return EgressCategory::Transcription;
    if (name == "model_download") return EgressCategory::ModelDownload;
    if (name == "update_check") return EgressCategory::UpdateCheck;
    return std::nullopt;
}

const char* mode_name(PrivacyMode mode) {
    return mode == PrivacyMode::Local ? "local" : "cloud_opt_in";
}

const char* step_name(ConsentStep step) {
    switch (step) {
        case ConsentStep::None: return "none";
        case ConsentStep::Enabled: return "enabled";
        case ConsentStep::CredentialProvided: return "credential_provided";
        case ConsentStep::Confirmed: return "confirmed";
    }
    return "unknown";
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms));
    return buf;
}

namespace {

// Accepts a bare host or a URL; returns the lowercase host.
std::optional<std::string> destination_host(const std::string& destination) {
    if (destination.find("://") != std::string::npos) {
        auto url = parse_url(destination);
        if (!url) return std::nullopt;
        return url->host;
    }
    auto url = parse_url("https://" + destination);
    if (!url || url->path != "/") return std::nullopt;
    return url->host;
}

void wipe_string(std::string& s) {
    volatile char* p = s.data();
    for (size_t i = 0; i < s.size(); ++i) p[i] = 0;
    s.clear();
}

std::vector<AllowListEntry> normalized(std::vector<AllowListEntry> entries) {
    std::vector<AllowListEntry> out;
    for (auto& e : entries) {
        auto host = destination_host(e.domain);
        if (!host) {
            logging::error("egress", "ignoring invalid allow-list domain '" + e.domain + "'");
            continue;
        }
        out.push_back({e.category, *host});
    }
    return out;
}

} // namespace

EgressGuard::EgressGuard(std::vector<AllowListEntry> allow_list,
                         std::unique_ptr<HttpTransport> transport)
    : allow_list_(normalized(std::move(allow_list))), transport_(std::move(transport)) {}

EgressGuard::~EgressGuard() {
    wipe_string(credential_);
}

GuardResult EgressGuard::authorize(const EgressRequest& request) {
    std::lock_guard lock(mutex_);
    return authorize_locked(request);
}

GuardResult EgressGuard::authorize(const EgressRequest& request,
                                   std::optional<std::string>& credential) {
    std::lock_guard lock(mutex_);
    auto decision = authorize_locked(request);
    if (!decision) return decision;

    if (mode_ == PrivacyMode::CloudOptIn && !credential_.empty() &&
        request.category == consent_category_) {
        auto parsed = parse_url(request.destination);
        if (parsed && host_matches(parsed->host, consent_host_)) credential = credential_;
    }
    return decision;
}

GuardResult EgressGuard::authorize_locked(const EgressRequest& request) {
    auto [allowed, reason] = evaluate(request);

    EgressDecision decision{
        .sequence = next_sequence_++,
        .destination = request.destination,
        .category = request.category,
        .byte_estimate = request.byte_estimate,
        .reason = reason,
        .allowed = allowed,
        .timestamp = std::chrono::system_clock::now(),
    };

    log_.push_back(decision);
    if (log_.size() > kRetainedDecisions) log_.pop_front();

    // Under the lock so sinks observe decisions in append order.
    for (auto& sink : sinks_) sink(decision);

    if (!allowed) {
        logging::info("Egress denied: " + request.destination + " (" + reason + ")");
        return std::unexpected(PipelineError{ErrorCode::EgressDenied,
                                             request.destination + ": " + reason});
    }
    logging::info("Egress allowed: " + request.destination);
    return {};
}

std::pair<bool, std::string> EgressGuard::evaluate(const EgressRequest& request) const {
    auto url = parse_url(request.destination);
    if (!url) return {false, "unparsable destination"};

    for (const auto& entry : allow_list_) {
        if (entry.category == request.category && host_matches(url->host, entry.domain)) {
            return {true, std::string("allow-listed for ") + category_name(entry.category)};
        }
    }

    if (mode_ == PrivacyMode::Local) {
        return {false, "local-only mode"};
    }

    if (request.category != consent_category_) {
        return {false, std::string("no consent for ") + category_name(request.category)};
    }
    if (!host_matches(url->host, consent_host_)) {
        return {false, "destination " + url->host + " not consented"};
    }
    return {true, "cloud opt-in for " + consent_host_};
}

PrivacyMode EgressGuard::mode() const {
    std::lock_guard lock(mutex_);
    return mode_;
}

ConsentStatus EgressGuard::consent() const {
    std::lock_guard lock(mutex_);
    return {
        .mode = mode_,
        .step = step_,
        .category = consent_category_,
        .destination = consent_host_,
        .has_credential = !credential_.empty(),
    };
}

GuardResult EgressGuard::enable_cloud(EgressCategory category, const std::string& destination) {
    std::lock_guard lock(mutex_);

    if (mode_ == PrivacyMode::CloudOptIn) {
        return std::unexpected(PipelineError{ErrorCode::InvalidState,
                                             "cloud mode already active; revoke first"});
    }

    auto host = destination_host(destination);
    if (!host) {
        reset_consent();
        return std::unexpected(PipelineError{ErrorCode::ConsentRejected,
                                             "invalid destination '" + destination + "'"});
    }

    reset_consent();
    step_ = ConsentStep::Enabled;
    consent_category_ = category;
    consent_host_ = *host;
    logging::info(std::string("Consent: cloud mode requested for ") + category_name(category) +
                  " at " + consent_host_);
    return {};
}

GuardResult EgressGuard::provide_credential(std::string credential) {
    std::lock_guard lock(mutex_);

    if (step_ != ConsentStep::Enabled) {
        wipe_string(credential);
        return std::unexpected(PipelineError{ErrorCode::InvalidState,
                                             std::string("credential out of order (step: ") +
                                                 step_name(step_) + ")"});
    }
    if (credential.empty()) {
        return std::unexpected(PipelineError{ErrorCode::ConsentRejected, "empty credential"});
    }

    wipe_string(credential_);
    credential_ = std::move(credential);
    step_ = ConsentStep::CredentialProvided;
    return {};
}

GuardResult EgressGuard::confirm(const std::string& destination) {
    std::lock_guard lock(mutex_);

    if (step_ != ConsentStep::CredentialProvided) {
        return std::unexpected(PipelineError{ErrorCode::InvalidState,
                                             std::string("confirmation out of order (step: ") +
                                                 step_name(step_) + ")"});
    }

    auto host = destination_host(destination);
    if (!host || *host != consent_host_) {
        std::string expected = consent_host_;
        reset_consent();
        return std::unexpected(PipelineError{ErrorCode::ConsentRejected,
                                             "disclosure named '" + destination +
                                                 "', consent was for '" + expected + "'"});
    }

    step_ = ConsentStep::Confirmed;
    mode_ = PrivacyMode::CloudOptIn;
    logging::info("Consent confirmed, cloud mode active for " + consent_host_);
    return {};
}

void EgressGuard::revoke() {
    std::lock_guard lock(mutex_);
    reset_consent();
    logging::info("Consent revoked, local-only mode");
}

void EgressGuard::reset_consent() {
    mode_ = PrivacyMode::Local;
    step_ = ConsentStep::None;
    consent_category_.reset();
    consent_host_.clear();
    wipe_string(credential_);
}

std::vector<AllowListEntry> EgressGuard::allow_list() const {
    std::lock_guard lock(mutex_);
    return allow_list_;
}

void EgressGuard::set_allow_list(std::vector<AllowListEntry> entries) {
    auto list = normalized(std::move(entries));
    std::lock_guard lock(mutex_);
    allow_list_ = std::move(list);
}

void EgressGuard::add_sink(DecisionSink sink) {
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void EgressGuard::clear_sinks() {
    std::lock_guard lock(mutex_);
    sinks_.clear();
}

std::vector<EgressDecision> EgressGuard::decisions(size_t limit) const {
    std::lock_guard lock(mutex_);
    size_t n = std::min(limit, log_.size());
    return {log_.end() - static_cast<std::ptrdiff_t>(n), log_.end()};
}

uint64_t EgressGuard::decision_count() const {
    std::lock_guard lock(mutex_);
    return next_sequence_ - 1;
}

std::shared_ptr<GuardedHttpClient> EgressGuard::make_client() {
    return std::make_shared<GuardedHttpClient>(*this);
}

std::expected<HttpResponse, std::string> EgressGuard::transmit(const HttpRequest& request) {
    if (!transport_) return std::unexpected("no network transport");
    return transport_->perform(request);
}

std::expected<HttpResponse, PipelineError> GuardedHttpClient::send(HttpRequest request) {
    std::optional<std::string> token;
    auto decision = guard_.authorize({
        .destination = request.url,
        .category = request.category,
        .byte_estimate = request.byte_estimate(),
    }, token);
    if (!decision) return std::unexpected(decision.error());

    if (token) {
        request.headers.emplace_back("Authorization", "Bearer " + *token);
        wipe_string(*token);
    }

    auto response = guard_.transmit(request);
    for (auto& [name, value] : request.headers) {
        if (name == "Authorization") wipe_string(value);
    }

    if (!response) {
        return std::unexpected(PipelineError{ErrorCode::NetworkFailure, response.error()});
    }
    return std::move(*response);
}
