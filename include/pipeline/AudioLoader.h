#ifndef DAE_PIPELINE_AUDIOLOADER_H
#define DAE_PIPELINE_AUDIOLOADER_H

#include <string>
#include "../core/AudioBuffer.h"
#include "Collaborators.h"

namespace dae::pipeline {

    /**
     * @brief Utility class responsible for loading audio files into an AudioBuffer object.
     *
     * Currently supports loading uncompressed WAV format files.
     */
    class AudioLoader {
    public:
        /**
         * @brief Loads audio data from a specified WAV file path into an AudioBuffer.
         *
         * This method handles common uncompressed WAV formats (PCM 16/24-bit or IEEE float 32-bit),
         * assuming little-endian byte order.
         *
         * @param path The file path to the WAV file.
         * @return A core::AudioBuffer containing the loaded audio data and metadata.
         * @throws std::runtime_error If the file cannot be opened, is corrupted, or if the format is unsupported.
         */
        static core::AudioBuffer loadWav(const std::string& path);
    };

    /**
     * @brief Built-in decoder for plain WAV input, used when ffmpeg is not wanted.
     *
     * Mixes down to mono and linearly resamples to the requested rate.
     */
    class WavAudioDecoder : public IAudioDecoder {
    public:
        core::Capability capability() const override { return core::Capability::yes(); }
        core::Result<core::AudioBuffer> decode(const std::string& mediaPath, int sampleRate) override;
    };

} // namespace dae::pipeline

#endif // DAE_PIPELINE_AUDIOLOADER_H
