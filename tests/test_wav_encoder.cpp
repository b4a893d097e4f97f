#include <catch2/catch_test_macros.hpp>

#include "wav_encoder.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

const uint8_t* bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(bytes(wav)) == "RIFF");
        REQUIRE(read_tag(bytes(wav) + 8) == "WAVE");
        REQUIRE(read_tag(bytes(wav) + 12) == "fmt ");
        REQUIRE(read_tag(bytes(wav) + 36) == "data");
    }

    SECTION("HeaderSize") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == wav::kHeaderSize + samples.size() * 2);
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        const uint8_t* p = bytes(wav);

        REQUIRE(read_u32(p + 16) == 16);
        // PCM, mono
        REQUIRE(read_u16(p + 20) == 1);
        REQUIRE(read_u16(p + 22) == 1);
        REQUIRE(read_u32(p + 24) == sample_rate);
        REQUIRE(read_u32(p + 28) == sample_rate * 2);
        REQUIRE(read_u16(p + 32) == 2);
        REQUIRE(read_u16(p + 34) == 16);

        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(p + 40) == data_size);
        REQUIRE(read_u32(p + 4) == 36 + data_size);
    }

    SECTION("SamplesLittleEndian") {
        auto wav = wav::encode(samples, sample_rate);
        const uint8_t* data = bytes(wav) + wav::kHeaderSize;
        for (size_t i = 0; i < samples.size(); ++i) {
            REQUIRE(static_cast<int16_t>(read_u16(data + 2 * i)) == samples[i]);
        }
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == wav::kHeaderSize);
        REQUIRE(read_u32(bytes(wav) + 40) == 0);
    }
}
