#ifndef DAE_PIPELINE_ANALYSISJOB_H
#define DAE_PIPELINE_ANALYSISJOB_H

#include <functional>
#include <optional>
#include <string>
#include "../core/AnalysisTypes.h"

namespace dae::pipeline {

enum class JobStatus { Pending, Processing, Done, Error };

std::string toString(JobStatus status);

class AnalysisJob;

/**
 * @brief Called after every status transition. Exceptions it throws are logged, not propagated.
 */
using StatusCallback = std::function<void(const AnalysisJob& job)>;

/**
 * @brief One analysis run: pending -> processing -> {done, error}.
 *
 * Done and error are terminal. A done job holds a fully-shaped JobResult;
 * an error job holds the fault message verbatim.
 */
class AnalysisJob {
public:
    AnalysisJob(std::string id, std::string mediaPath, StatusCallback onStatus = nullptr);

    const std::string& id() const { return m_id; }
    const std::string& mediaPath() const { return m_mediaPath; }
    JobStatus status() const { return m_status; }
    bool isTerminal() const { return m_status == JobStatus::Done || m_status == JobStatus::Error; }

    /** @brief The result; only set once the job is done. */
    const std::optional<core::JobResult>& result() const { return m_result; }
    const std::string& errorMessage() const { return m_errorMessage; }

    /**
     * @brief pending -> processing.
     * @throw std::logic_error if the job is not pending.
     */
    void start();

    /**
     * @brief processing -> done.
     * @throw std::logic_error if the job is not processing.
     */
    void complete(core::JobResult result);

    /**
     * @brief Any non-terminal state -> error. Ignored once terminal.
     */
    void fail(std::string message);

private:
    void transition(JobStatus next);

    std::string m_id;
    std::string m_mediaPath;
    StatusCallback m_onStatus;
    JobStatus m_status = JobStatus::Pending;
    std::optional<core::JobResult> m_result;
    std::string m_errorMessage;
};

} // namespace dae::pipeline

#endif // DAE_PIPELINE_ANALYSISJOB_H
