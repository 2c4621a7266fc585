#include "../../include/pipeline/ProcessRunner.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace dae::pipeline {

std::string ProcessRunner::shellQuote(const std::string& value) {
    std::string escaped = "'";
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "'\\''";
        } else {
            escaped += ch;
        }
    }
    escaped += "'";
    return escaped;
}

std::optional<std::string> ProcessRunner::findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return name;
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return std::nullopt;

    std::stringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        const std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

ProcessOutput ProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::runtime_error("ProcessRunner: empty command");

    const std::filesystem::path errPath = std::filesystem::temp_directory_path() /
        ("dae_stderr_" + std::to_string(::getpid()) + "_" +
         std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log");

    std::ostringstream command;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) command << ' ';
        command << shellQuote(argv[i]);
    }
    command << " 2>" << shellQuote(errPath.string());

    FILE* pipe = ::popen(command.str().c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to launch subprocess: " + argv[0]);
    }

    ProcessOutput output;
    char buffer[65536];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.stdoutData.append(buffer, n);
    }
    const int status = ::pclose(pipe);
    if (status == -1) {
        output.exitCode = -1;
    } else if (WIFEXITED(status)) {
        output.exitCode = WEXITSTATUS(status);
    } else {
        output.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }

    {
        std::ifstream err(errPath, std::ios::binary);
        if (err) {
            output.stderrData.assign(std::istreambuf_iterator<char>(err), std::istreambuf_iterator<char>());
        }
    }
    std::error_code removeError;
    std::filesystem::remove(errPath, removeError);
    return output;
}

} // namespace dae::pipeline
