#ifndef DAE_PIPELINE_PROCESSRUNNER_H
#define DAE_PIPELINE_PROCESSRUNNER_H

#include <optional>
#include <string>
#include <vector>

namespace dae::pipeline {

/**
 * @brief Captured result of one external process invocation.
 */
struct ProcessOutput {
    int exitCode = -1;
    std::string stdoutData;  ///< Raw bytes; may be binary (PCM).
    std::string stderrData;
};

/**
 * @brief Runs external tools (ffmpeg, ffprobe, the vision tool) through the shell.
 */
class ProcessRunner {
public:
    /**
     * @brief Quotes one argument for a POSIX shell.
     */
    static std::string shellQuote(const std::string& value);

    /**
     * @brief Searches PATH for an executable file.
     * @return The absolute path, or nullopt when not found.
     */
    static std::optional<std::string> findExecutable(const std::string& name);

    /**
     * @brief Runs argv[0] with the remaining arguments and waits for it to exit.
     *
     * stdout is read in binary. stderr is captured through a temporary file
     * that is removed before returning.
     * @throw std::runtime_error if the process cannot be started.
     */
    static ProcessOutput run(const std::vector<std::string>& argv);
};

} // namespace dae::pipeline

#endif // DAE_PIPELINE_PROCESSRUNNER_H
