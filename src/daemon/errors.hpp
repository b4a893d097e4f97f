#pragma once

#include <string>

enum class ErrorCode {
    DeviceUnavailable,
    DeviceLost,
    RecoveryExhausted,
    BackendUnavailable,
    TranscriptionFailed,
    EgressDenied,
    NetworkFailure,
    InvalidState,
    ConsentRejected,
    Backpressure,
};

// Stable identifier used on the IPC wire.
inline const char* code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::DeviceUnavailable: return "device_unavailable";
        case ErrorCode::DeviceLost: return "device_lost";
        case ErrorCode::RecoveryExhausted: return "recovery_exhausted";
        case ErrorCode::BackendUnavailable: return "backend_unavailable";
        case ErrorCode::TranscriptionFailed: return "transcription_failed";
        case ErrorCode::EgressDenied: return "egress_denied";
        case ErrorCode::NetworkFailure: return "network_failure";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::ConsentRejected: return "consent_rejected";
        case ErrorCode::Backpressure: return "backpressure";
    }
    return "unknown";
}

struct PipelineError {
    ErrorCode code;
    std::string detail;

    std::string describe() const {
        std::string s = code_name(code);
        if (!detail.empty()) s += ": " + detail;
        return s;
    }
};
