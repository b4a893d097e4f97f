#pragma once

#include <cstdint>
#include <string>

enum class SampleFormat { S16LE, F32LE };

// Identifies the input device a stream is open on. Valid only while that
// stream is open; never persisted.
struct DeviceHandle {
    uint32_t id = 0;          // platform-assigned (PipeWire global id)
    std::string name;         // node.name
    std::string description;  // node.description, for display
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    SampleFormat format = SampleFormat::S16LE;
    bool is_default = false;  // the system default source when enumerated
};
