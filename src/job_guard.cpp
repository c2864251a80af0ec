#include "job_guard.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <filesystem>
#include <system_error>

RunGuard::RunGuard(std::atomic<bool>& running, const char* job_name) : m_running(running) {
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        throw JobStateError(ErrorCode::OperationInProgress, std::string(job_name) + " job is already running");
    }
}

RunGuard::~RunGuard() {
    m_running.store(false);
}

void remove_partial_output(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        LOG_INFO("CLEANUP", "Removed partial output " << path);
    } else if (ec) {
        LOG_WARN("CLEANUP", "Could not remove partial output " << path << ": " << ec.message());
    }
}
