#include "daemon_core.hpp"

#include "log.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>

using json = nlohmann::json;

namespace {

json error_response(const PipelineError& err) {
    return {{"status", "error"}, {"code", code_name(err.code)}, {"message", err.detail}};
}

json bad_request(const std::string& message) {
    return {{"status", "error"}, {"code", "bad_request"}, {"message", message}};
}

std::vector<AllowListEntry> allow_entries(const std::vector<Config::AllowEntry>& entries) {
    std::vector<AllowListEntry> out;
    for (const auto& e : entries) {
        auto category = parse_category(e.category);
        if (!category) {
            logging::error("config", "unknown egress category '" + e.category + "' in allow_list");
            continue;
        }
        out.push_back({*category, e.domain});
    }
    return out;
}

RecoveryPolicy recovery_policy(const Config::Recovery& r) {
    return {
        .initial_delay = std::chrono::milliseconds(r.initial_delay_ms),
        .multiplier = r.multiplier,
        .max_delay = std::chrono::milliseconds(r.max_delay_ms),
        .max_attempts = r.max_attempts,
        .overrun_check = std::chrono::milliseconds(r.overrun_check_ms),
        .overrun_windows = r.overrun_windows,
    };
}

DispatcherOptions dispatcher_options(const Config::Dispatcher& d) {
    return {
        .reorder_window = d.reorder_window,
        .compute_threads = 0,
        .io_threads = d.io_threads,
        .backpressure_timeout = std::chrono::milliseconds(d.backpressure_timeout_ms),
    };
}

const char* event_kind(CaptureEvent::Kind kind) {
    switch (kind) {
        case CaptureEvent::Kind::StateChanged: return "state_changed";
        case CaptureEvent::Kind::RecoverySucceeded: return "recovery_succeeded";
        case CaptureEvent::Kind::RecoveryExhausted: return "recovery_exhausted";
        case CaptureEvent::Kind::SustainedOverrun: return "sustained_overrun";
    }
    return "unknown";
}

} // namespace

DaemonCore::DaemonCore(Config config, std::string config_path,
                       StreamingAudioBuffer& buffer, AudioCapture& capture,
                       EgressGuard& guard, IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)), config_path_(std::move(config_path)),
      buffer_(buffer), capture_(capture), guard_(guard), ipc_(ipc),
      notify_(std::move(notify)),
      dispatcher_(guard_, dispatcher_options(config_.dispatcher),
                  [this](const DispatchOutcome& o) { on_outcome(o); }),
      supervisor_(buffer_, capture_, recovery_policy(config_.recovery),
                  [this](const CaptureEvent& ev) { on_capture_event(ev); }) {
    apply_session_config();
}

DaemonCore::~DaemonCore() {
    guard_.clear_sinks();
}

bool DaemonCore::init(std::vector<std::shared_ptr<TranscriptionBackend>> backends) {
    std::string path = config_.audit_path;
    if (path.empty()) {
        auto data = platform::data_dir();
        path = (data.empty() ? std::string("/tmp/localscribe") : data) + "/audit.db";
    }
    if (!audit_.open(path)) {
        logging::error("db", "egress audit not persisted, keeping it in memory only");
    } else {
        logging::info("Egress audit at " + path);
    }

    guard_.add_sink([this](const EgressDecision& d) { on_egress(d); });

    if (backends.empty()) {
        logging::error("daemon", "no transcription backends");
        return false;
    }
    for (auto& b : backends) {
        dispatcher_.register_backend(std::move(b));
    }
    if (auto r = dispatcher_.select_backend(config_.backend.default_id); !r) {
        logging::error("daemon", r.error().detail + ", using " + dispatcher_.active_backend_id());
    }
    return true;
}

std::optional<json> DaemonCore::handle_command(int client_fd, const json& cmd) {
    if (cmd.is_discarded() || !cmd.is_object()) {
        return bad_request("invalid JSON");
    }

    try {
        std::string name = cmd.value("cmd", "");
        bool deferred = false;
        json resp;

        if (name == "start") resp = handle_start(client_fd, deferred);
        else if (name == "stop") resp = handle_stop(client_fd, deferred);
        else if (name == "status") resp = handle_status();
        else if (name == "backends") resp = handle_backends();
        else if (name == "select_backend") resp = handle_select_backend(cmd);
        else if (name == "devices") resp = handle_devices();
        else if (name == "select_device") resp = handle_select_device(cmd);
        else if (name == "privacy") resp = handle_privacy();
        else if (name == "consent_enable") resp = handle_consent_enable(cmd);
        else if (name == "consent_credential") resp = handle_consent_credential(cmd);
        else if (name == "consent_confirm") resp = handle_consent_confirm(cmd);
        else if (name == "consent_revoke") resp = handle_consent_revoke();
        else if (name == "audit") resp = handle_audit(cmd);
        else if (name == "subscribe") resp = handle_subscribe(client_fd);
        else return bad_request("unknown command '" + name + "'");

        if (deferred) return std::nullopt;
        return resp;
    } catch (const json::exception& e) {
        return bad_request(std::string("malformed request: ") + e.what());
    }
}

json DaemonCore::handle_start(int client_fd, bool& deferred) {
    if (control_busy_) {
        return error_response({ErrorCode::InvalidState, "start or stop already in progress"});
    }
    if (supervisor_.state() == CaptureState::Recording) {
        return error_response({ErrorCode::InvalidState, "already recording"});
    }

    apply_session_config();
    capture_.set_preferred_device(config_.audio.device);
    session_ = dispatcher_.begin_session();

    control_busy_ = true;
    deferred = true;
    waiting_clients_.push_back(client_fd);

    uint64_t session = session_;
    control_waiter_ = std::jthread([this, client_fd, session, fut = supervisor_.start()]() mutable {
        StartResult result = fut.get();
        post([this, client_fd, session, result] {
            control_busy_ = false;
            if (!result) {
                dispatcher_.end_session();
                reply(client_fd, error_response(result.error()));
                return;
            }
            segmenter_worker_->start();
            logging::info("Session " + std::to_string(session) + " started");
            reply(client_fd, {{"status", "ok"}, {"state", "recording"}, {"session", session}});
        });
    });
    return {};
}

json DaemonCore::handle_stop(int client_fd, bool& deferred) {
    if (control_busy_) {
        return error_response({ErrorCode::InvalidState, "start or stop already in progress"});
    }

    control_busy_ = true;
    deferred = true;
    waiting_clients_.push_back(client_fd);

    // Speech captured so far is segmented and transcribed before capture
    // stops; whatever is still running after the drain timeout is discarded
    // with the session.
    uint64_t session = session_;
    control_waiter_ = std::jthread([this, client_fd, session] {
        drain_session(session);
        supervisor_.stop().get();
        post([this, client_fd, session] {
            close_session();
            logging::info("Session " + std::to_string(session) + " stopped");
            reply(client_fd, {{"status", "ok"}, {"state", "idle"}});
        });
    });
    return {};
}

void DaemonCore::drain_session(uint64_t session) {
    segmenter_worker_->finish();
    if (!dispatcher_.wait_idle(std::chrono::milliseconds(config_.dispatcher.drain_timeout_ms))) {
        logging::info("Session " + std::to_string(session) +
                      ": transcriptions still running at drain timeout, discarded");
    }
}

void DaemonCore::close_session() {
    dispatcher_.end_session();
    segmenter_->reset();
    control_busy_ = false;
}

void DaemonCore::end_failed_session() {
    // A stop in progress ends the session itself.
    if (control_busy_ || !dispatcher_.session_active()) return;

    control_busy_ = true;
    uint64_t session = session_;
    control_waiter_ = std::jthread([this, session] {
        drain_session(session);
        post([this, session] {
            close_session();
            logging::info("Session " + std::to_string(session) + " ended, input device lost");
        });
    });
}

json DaemonCore::handle_status() {
    json resp = {
        {"status", "ok"},
        {"state", state_name(supervisor_.state())},
        {"recovery_attempt", supervisor_.recovery_attempts()},
        {"level", supervisor_.level()},
        {"buffer", {
            {"used", buffer_.used()},
            {"capacity", buffer_.capacity()},
            {"dropped", buffer_.dropped()},
        }},
        {"backend", dispatcher_.active_backend_id()},
        {"in_flight", dispatcher_.in_flight()},
        {"session", session_},
        {"session_active", dispatcher_.session_active()},
        {"privacy", mode_name(guard_.mode())},
    };

    if (auto dev = supervisor_.device()) {
        resp["device"] = {
            {"id", dev->id},
            {"name", dev->name},
            {"description", dev->description},
            {"sample_rate", dev->sample_rate},
            {"channels", dev->channels},
        };
    }
    return resp;
}

json DaemonCore::handle_devices() {
    json list = json::array();
    for (const auto& d : capture_.list_devices()) {
        list.push_back({
            {"id", d.id},
            {"name", d.name},
            {"description", d.description},
            {"default", d.is_default},
        });
    }
    return {{"status", "ok"}, {"devices", list}, {"selected", config_.audio.device}};
}

json DaemonCore::handle_select_device(const json& cmd) {
    std::string name = cmd.value("name", "");
    if (!name.empty()) {
        auto devices = capture_.list_devices();
        if (std::ranges::find(devices, name, &DeviceHandle::name) == devices.end()) {
            return error_response({ErrorCode::DeviceUnavailable, "no input device named '" + name + "'"});
        }
    }

    // Kept across config reloads; the open stream is left alone.
    config_.audio.device = name;
    logging::info("Input device for the next session: " + (name.empty() ? std::string("system default") : name));
    return {{"status", "ok"}, {"device", name}};
}

json DaemonCore::handle_backends() {
    auto active = dispatcher_.active_backend_id();
    json list = json::array();
    for (const auto& b : dispatcher_.backends()) {
        auto caps = b->capabilities();
        list.push_back({
            {"id", b->id()},
            {"active", b->id() == active},
            {"available", b->is_available()},
            {"requires_network", caps.requires_network},
            {"supports_streaming", caps.supports_streaming},
            {"languages", caps.supported_languages},
        });
    }
    return {{"status", "ok"}, {"backends", list}};
}

json DaemonCore::handle_select_backend(const json& cmd) {
    std::string id = cmd.value("id", "");
    if (id.empty()) return bad_request("select_backend needs an id");

    if (auto r = dispatcher_.select_backend(id); !r) return error_response(r.error());

    auto backend = dispatcher_.find_backend(id);
    bool available = backend && backend->is_available();
    broadcast({{"event", "backend"}, {"id", id}, {"available", available}});
    return {{"status", "ok"}, {"backend", id}, {"available", available}};
}

json DaemonCore::handle_privacy() {
    auto c = guard_.consent();

    json allow = json::array();
    for (const auto& e : guard_.allow_list()) {
        allow.push_back({{"category", category_name(e.category)}, {"domain", e.domain}});
    }

    return {
        {"status", "ok"},
        {"mode", mode_name(c.mode)},
        {"step", step_name(c.step)},
        {"category", c.category ? json(category_name(*c.category)) : json(nullptr)},
        {"destination", c.destination},
        {"has_credential", c.has_credential},
        {"allow_list", allow},
        {"decisions", guard_.decision_count()},
    };
}

json DaemonCore::handle_consent_enable(const json& cmd) {
    auto category = parse_category(cmd.value("category", "transcription"));
    if (!category) {
        return error_response({ErrorCode::ConsentRejected, "unknown category"});
    }

    // Default to the configured remote transcription server.
    std::string destination = cmd.value("destination", config_.backend.remote_url);
    if (auto r = guard_.enable_cloud(*category, destination); !r) return error_response(r.error());

    auto c = guard_.consent();
    broadcast({{"event", "privacy"}, {"mode", mode_name(c.mode)}, {"step", step_name(c.step)}});
    return {{"status", "ok"}, {"step", step_name(c.step)}, {"destination", c.destination},
            {"next", "consent_credential"}};
}

json DaemonCore::handle_consent_credential(const json& cmd) {
    std::string credential = cmd.value("credential", "");
    if (auto r = guard_.provide_credential(std::move(credential)); !r) return error_response(r.error());

    auto c = guard_.consent();
    broadcast({{"event", "privacy"}, {"mode", mode_name(c.mode)}, {"step", step_name(c.step)}});
    return {{"status", "ok"}, {"step", step_name(c.step)}, {"next", "consent_confirm"},
            {"disclosure", "Speech audio will be sent to " + c.destination +
                               ". Confirm by naming this destination."}};
}

json DaemonCore::handle_consent_confirm(const json& cmd) {
    std::string destination = cmd.value("destination", "");
    auto r = guard_.confirm(destination);

    auto c = guard_.consent();
    broadcast({{"event", "privacy"}, {"mode", mode_name(c.mode)}, {"step", step_name(c.step)}});
    if (!r) return error_response(r.error());
    return {{"status", "ok"}, {"mode", mode_name(c.mode)}, {"destination", c.destination}};
}

json DaemonCore::handle_consent_revoke() {
    guard_.revoke();
    broadcast({{"event", "privacy"}, {"mode", mode_name(PrivacyMode::Local)},
               {"step", step_name(ConsentStep::None)}});
    return {{"status", "ok"}, {"mode", mode_name(PrivacyMode::Local)}};
}

json DaemonCore::handle_audit(const json& cmd) {
    int limit = std::clamp(cmd.value("limit", 20), 1, 1000);

    json entries = json::array();
    if (audit_.is_open()) {
        for (const auto& r : audit_.recent(limit)) {
            entries.push_back({
                {"id", r.id},
                {"timestamp", r.timestamp},
                {"destination", r.destination},
                {"category", r.category},
                {"bytes", r.byte_estimate},
                {"reason", r.reason},
                {"allowed", r.allowed},
            });
        }
    } else {
        auto decisions = guard_.decisions(static_cast<size_t>(limit));
        for (auto it = decisions.rbegin(); it != decisions.rend(); ++it) {
            entries.push_back({
                {"id", it->sequence},
                {"timestamp", format_timestamp(it->timestamp)},
                {"destination", it->destination},
                {"category", category_name(it->category)},
                {"bytes", it->byte_estimate},
                {"reason", it->reason},
                {"allowed", it->allowed},
            });
        }
    }
    return {{"status", "ok"}, {"persisted", audit_.is_open()}, {"entries", entries}};
}

json DaemonCore::handle_subscribe(int client_fd) {
    if (std::ranges::find(subscribers_, client_fd) == subscribers_.end()) {
        subscribers_.push_back(client_fd);
    }
    return {{"status", "ok"}, {"subscribed", true}};
}

void DaemonCore::apply_session_config() {
    if (!config_path_.empty() && std::filesystem::exists(config_path_)) {
        auto fresh = Config::load(config_path_);
        if (fresh.audio.buffer_samples() != config_.audio.buffer_samples() ||
            fresh.audio.sample_rate != config_.audio.sample_rate) {
            logging::error("config", "audio buffer changes take effect after a restart");
        }
        fresh.audio = config_.audio;
        config_ = std::move(fresh);
    }

    guard_.set_allow_list(allow_entries(config_.privacy.allow_list));
    dispatcher_.set_options({.language = config_.backend.language});

    VadParams params{
        .sample_rate = config_.audio.sample_rate,
        .threshold = config_.vad.threshold,
        .frame_ms = config_.vad.frame_ms,
        .min_speech_ms = config_.vad.min_speech_ms,
        .min_silence_ms = config_.vad.min_silence_ms,
        .padding_ms = config_.vad.padding_ms,
        .max_segment_s = config_.vad.max_segment_s,
    };

    if (segmenter_worker_) segmenter_worker_->stop();
    segmenter_ = std::make_unique<VoiceSegmenter>(
        params, std::make_unique<EnergyClassifier>(),
        [this](SpeechSegment seg) { on_segment(std::move(seg)); });
    segmenter_worker_ = std::make_unique<SegmenterWorker>(
        buffer_, *segmenter_, std::chrono::milliseconds(config_.audio.poll_ms));
}

void DaemonCore::on_capture_event(const CaptureEvent& ev) {
    json event = {
        {"event", "capture"},
        {"kind", event_kind(ev.kind)},
        {"from", state_name(ev.from)},
        {"to", state_name(ev.to)},
        {"attempt", ev.attempt},
    };
    if (!ev.device.empty()) event["device"] = ev.device;
    if (!ev.reason.empty()) event["reason"] = ev.reason;
    if (ev.kind == CaptureEvent::Kind::SustainedOverrun) event["dropped"] = ev.dropped;
    if (ev.kind == CaptureEvent::Kind::RecoveryExhausted) {
        event["code"] = code_name(ErrorCode::RecoveryExhausted);
        event["message"] = "input device lost, " + std::to_string(ev.attempt) +
                           " recovery attempts failed: " + ev.reason;
    }

    bool lost = ev.kind == CaptureEvent::Kind::StateChanged &&
                ev.from == CaptureState::Recording && ev.to == CaptureState::DeviceLost;
    bool exhausted = ev.kind == CaptureEvent::Kind::RecoveryExhausted;

    post([this, event = std::move(event), lost, exhausted] {
        // Close the segment in progress before recovery restarts the buffer.
        if (lost && segmenter_worker_) segmenter_worker_->request_flush();
        broadcast(event);
        if (exhausted) end_failed_session();
    });
}

void DaemonCore::on_segment(SpeechSegment segment) {
    uint64_t sequence = segment.sequence();
    auto r = dispatcher_.submit(std::move(segment));
    if (r) return;
    if (!dispatcher_.session_active()) {
        logging::info("Segment " + std::to_string(sequence) + " dropped, session ended");
        return;
    }

    json event = {
        {"event", "segment_rejected"},
        {"segment", sequence},
        {"code", code_name(r.error().code)},
        {"message", r.error().detail},
    };
    post([this, event = std::move(event)] { broadcast(event); });
}

void DaemonCore::on_outcome(const DispatchOutcome& o) {
    json event;
    if (o.result) {
        event = {
            {"event", "transcript"},
            {"session", o.session},
            {"segment", o.segment},
            {"index", o.index},
            {"text", o.result->text},
            {"backend", o.result->backend_id},
            {"final", o.result->is_final},
            {"latency_ms", o.result->latency.count()},
            {"start", o.start_s},
            {"duration", o.duration_s},
        };
        logging::info("Transcript " + std::to_string(o.index) + " (" + o.result->backend_id + ", " +
                      std::to_string(o.result->latency.count()) + " ms): " +
                      std::to_string(o.result->text.size()) + " chars");
    } else {
        event = {
            {"event", "transcript_error"},
            {"session", o.session},
            {"segment", o.segment},
            {"index", o.index},
            {"code", code_name(o.result.error().code)},
            {"message", o.result.error().detail},
        };
    }
    post([this, event = std::move(event)] { broadcast(event); });
}

void DaemonCore::on_egress(const EgressDecision& d) {
    if (audit_.is_open() && !audit_.append(d)) {
        logging::error("db", "egress decision " + std::to_string(d.sequence) + " not persisted");
    }

    json event = {
        {"event", "egress"},
        {"destination", d.destination},
        {"category", category_name(d.category)},
        {"bytes", d.byte_estimate},
        {"allowed", d.allowed},
        {"reason", d.reason},
        {"timestamp", format_timestamp(d.timestamp)},
    };
    post([this, event = std::move(event)] { broadcast(event); });
}

void DaemonCore::post(std::function<void()> task) {
    {
        std::lock_guard lock(posted_mutex_);
        posted_.push_back(std::move(task));
    }
    if (notify_) notify_();
}

void DaemonCore::process_posted() {
    std::deque<std::function<void()>> tasks;
    {
        std::lock_guard lock(posted_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) task();
}

void DaemonCore::broadcast(const json& event) {
    for (int fd : subscribers_) {
        if (!ipc_.send_response(fd, event)) {
            logging::info("Event dropped for client " + std::to_string(fd));
        }
    }
}

void DaemonCore::reply(int client_fd, const json& response) {
    auto it = std::ranges::find(waiting_clients_, client_fd);
    if (it == waiting_clients_.end()) return; // client went away
    waiting_clients_.erase(it);
    ipc_.send_response(client_fd, response);
}

void DaemonCore::remove_client(int fd) {
    std::erase(subscribers_, fd);
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    // Ending the session first cuts short any drain in progress.
    dispatcher_.end_session();
    if (control_waiter_.joinable()) control_waiter_.join();
    if (segmenter_worker_) segmenter_worker_->stop();
    supervisor_.stop().wait();
    process_posted();
}
