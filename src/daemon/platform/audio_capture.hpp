#pragma once

#include "capture/device.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

// Stream health notifications. Called on the audio backend's thread;
// implementations must return quickly.
class CaptureListener {
public:
    virtual ~CaptureListener() = default;
    virtual void on_stream_failed(const std::string& reason) = 0;
    virtual void on_default_device_changed() = 0;
};

// Platform input stream. Implementations write mono S16 samples at the
// configured rate into the StreamingAudioBuffer they were constructed with.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    virtual void set_listener(CaptureListener* listener) = 0;

    // Re-enumerates devices. The preferred device when it is present,
    // else the system default; nullopt when no input device exists.
    virtual std::optional<DeviceHandle> default_device() = 0;

    virtual std::vector<DeviceHandle> list_devices() = 0;

    // node name opened instead of the system default; empty follows the default.
    virtual void set_preferred_device(std::string name) = 0;

    virtual std::expected<void, std::string> open(const DeviceHandle& device) = 0;
    virtual void close() = 0;
    virtual bool is_capturing() const = 0;

    // Normalized RMS of the most recent callback.
    virtual float level() const = 0;
};
