#include "../../include/pipeline/AudioLoader.h"
#include "../../include/pipeline/ExternalTools.h"
#include <fstream>
#include <stdexcept>
#include <cstdint>
#include <vector>
#include <string>
#include <cstring>

namespace dae::pipeline {

namespace {

struct WavFormat {
    uint16_t audioFormat = 0;    ///< 1 = PCM, 3 = IEEE float.
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    uint32_t dataSize = 0;
    std::streampos dataPos = 0;
};

uint32_t readU32(std::ifstream& f) {
    uint8_t b[4] = {0, 0, 0, 0};
    f.read(reinterpret_cast<char*>(b), 4);
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
}

uint16_t readU16(std::ifstream& f) {
    uint8_t b[2] = {0, 0};
    f.read(reinterpret_cast<char*>(b), 2);
    return static_cast<uint16_t>(b[0] | (b[1] << 8));
}

bool readTag(std::ifstream& f, const char* expected) {
    char tag[4];
    f.read(tag, 4);
    return f.gcount() == 4 && std::memcmp(tag, expected, 4) == 0;
}

/**
 * @brief Walks the RIFF chunks and records the 'fmt ' fields and the 'data' location.
 */
WavFormat readHeader(std::ifstream& f) {
    if (!readTag(f, "RIFF")) throw std::runtime_error("Not a RIFF file");
    (void)readU32(f);
    if (!readTag(f, "WAVE")) throw std::runtime_error("Not a WAVE file");

    WavFormat fmt;
    while (f) {
        char id[4];
        f.read(id, 4);
        if (f.gcount() != 4) break;
        const uint32_t chunkSize = readU32(f);
        const std::string chunkId(id, 4);

        if (chunkId == "fmt ") {
            fmt.audioFormat = readU16(f);
            fmt.channels = readU16(f);
            fmt.sampleRate = readU32(f);
            (void)readU32(f);  // byte rate
            (void)readU16(f);  // block align
            fmt.bitsPerSample = readU16(f);
            if (chunkSize > 16) f.seekg(chunkSize - 16, std::ios::cur);
        } else if (chunkId == "data") {
            fmt.dataSize = chunkSize;
            fmt.dataPos = f.tellg();
            f.seekg(chunkSize, std::ios::cur);
        } else {
            f.seekg(chunkSize, std::ios::cur);
        }
        if (chunkSize % 2 == 1) f.seekg(1, std::ios::cur);
    }

    if (fmt.audioFormat == 0 || fmt.channels == 0 || fmt.dataSize == 0 || fmt.bitsPerSample == 0) {
        throw std::runtime_error("Invalid WAV: Missing 'fmt ' or 'data' chunks");
    }
    if (fmt.sampleRate == 0) {
        throw std::runtime_error("Invalid WAV: sample rate is zero");
    }
    return fmt;
}

} // namespace

/**
 * @brief Loads a WAV file from the specified path into an AudioBuffer object.
 *
 * Supports 16-bit PCM, 24-bit PCM and 32-bit IEEE float, little-endian,
 * any channel count. Samples are normalized to [-1.0, 1.0].
 *
 * @throw std::runtime_error if the file cannot be opened, is not a valid RIFF/WAV file,
 * or contains an unsupported audio format.
 */
core::AudioBuffer AudioLoader::loadWav(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open WAV: " + path);

    const WavFormat fmt = readHeader(f);
    const size_t bytesPerSample = fmt.bitsPerSample / 8;

    const bool pcm16 = fmt.audioFormat == 1 && fmt.bitsPerSample == 16;
    const bool pcm24 = fmt.audioFormat == 1 && fmt.bitsPerSample == 24;
    const bool float32 = fmt.audioFormat == 3 && fmt.bitsPerSample == 32;
    if (!pcm16 && !pcm24 && !float32) {
        throw std::runtime_error("Unsupported audio format or bit depth: Format=" + std::to_string(fmt.audioFormat) +
                                 ", Bits=" + std::to_string(fmt.bitsPerSample));
    }

    const size_t frames = fmt.dataSize / (bytesPerSample * fmt.channels);
    core::AudioBuffer buffer(fmt.channels, frames, static_cast<float>(fmt.sampleRate));

    f.clear();
    f.seekg(fmt.dataPos);
    std::vector<uint8_t> raw(frames * fmt.channels * bytesPerSample);
    f.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (static_cast<size_t>(f.gcount()) != raw.size()) {
        throw std::runtime_error("Truncated WAV data: " + path);
    }

    const uint8_t* p = raw.data();
    for (size_t i = 0; i < frames; ++i) {
        for (size_t ch = 0; ch < fmt.channels; ++ch, p += bytesPerSample) {
            float s = 0.0f;
            if (pcm16) {
                const auto v = static_cast<int16_t>(static_cast<uint16_t>(p[0] | (p[1] << 8)));
                s = static_cast<float>(v) / 32768.0f;
            } else if (pcm24) {
                int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
                if (v & 0x800000) v |= ~0xFFFFFF;
                s = static_cast<float>(v) / 8388608.0f;
            } else {
                std::memcpy(&s, p, 4);
            }
            buffer.getChannel(ch)[i] = s;
        }
    }
    return buffer;
}

core::Result<core::AudioBuffer> WavAudioDecoder::decode(const std::string& mediaPath, int sampleRate) {
    core::AudioBuffer audio;
    try {
        audio = AudioLoader::loadWav(mediaPath);
    } catch (const std::runtime_error& e) {
        return core::Result<core::AudioBuffer>::degraded(
            std::string("WAV decoding failed. Tonal analysis unavailable. (") + e.what() + ")");
    }

    core::AudioBuffer mono = audio.toMono().resampled(static_cast<float>(sampleRate));
    if (mono.getDuration() < FfmpegAudioDecoder::kMinDurationSec) {
        return core::Result<core::AudioBuffer>::degraded(
            "Audio sample was too short for reliable tonal analysis.");
    }
    return mono;
}

} // namespace dae::pipeline
