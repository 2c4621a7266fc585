#include "../../include/pipeline/AnalysisJob.h"
#include <iostream>
#include <stdexcept>

namespace dae::pipeline {

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Done: return "done";
        case JobStatus::Error: return "error";
    }
    return "error";
}

AnalysisJob::AnalysisJob(std::string id, std::string mediaPath, StatusCallback onStatus)
    : m_id(std::move(id)), m_mediaPath(std::move(mediaPath)), m_onStatus(std::move(onStatus)) {
}

void AnalysisJob::start() {
    if (m_status != JobStatus::Pending) {
        throw std::logic_error("Job " + m_id + " cannot start from state " + toString(m_status));
    }
    transition(JobStatus::Processing);
}

void AnalysisJob::complete(core::JobResult result) {
    if (m_status != JobStatus::Processing) {
        throw std::logic_error("Job " + m_id + " cannot complete from state " + toString(m_status));
    }
    m_result = std::move(result);
    transition(JobStatus::Done);
}

void AnalysisJob::fail(std::string message) {
    if (isTerminal()) return;
    m_result.reset();
    m_errorMessage = std::move(message);
    transition(JobStatus::Error);
}

void AnalysisJob::transition(JobStatus next) {
    m_status = next;
    if (!m_onStatus) return;
    try {
        m_onStatus(*this);
    } catch (const std::exception& e) {
        std::cerr << "[Job] Status callback failed for " << m_id << ": " << e.what() << std::endl;
    }
}

} // namespace dae::pipeline
