#pragma once

#include <atomic>
#include <string>

// Marks a job as running for the lifetime of one run() call. Throws
// JobStateError(OperationInProgress) if a run is already active.
class RunGuard {
public:
    RunGuard(std::atomic<bool>& running, const char* job_name);
    ~RunGuard();

    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

private:
    std::atomic<bool>& m_running;
};

// Deletes a partially written output file; failures are only logged
void remove_partial_output(const std::string& path);
