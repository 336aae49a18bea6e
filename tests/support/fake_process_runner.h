#pragma once

#include <deque>
#include <string>
#include <vector>

#include "infra/process_runner.h"

// Replays queued results in order and records every invocation.
class FakeProcessRunner : public infra::IProcessRunner {
public:
    struct Call {
        std::vector<std::string> argv;
        unsigned long timeoutMs;
        std::string input;
    };

    void queueExit(int exitCode, const std::string &stdoutText = std::string(),
                   const std::string &stderrText = std::string()) {
        infra::ProcessResult result;
        result.status = infra::ProcessStatus::Exited;
        result.exitCode = exitCode;
        result.stdoutText = stdoutText;
        result.stderrText = stderrText;
        m_results.push_back(result);
    }

    void queueStatus(infra::ProcessStatus status) {
        infra::ProcessResult result;
        result.status = status;
        m_results.push_back(result);
    }

    infra::ProcessResult run(const std::vector<std::string> &argv,
                             unsigned long timeoutMs,
                             const std::string &input = std::string()) override {
        Call call;
        call.argv = argv;
        call.timeoutMs = timeoutMs;
        call.input = input;
        calls.push_back(call);

        if (m_results.empty()) {
            infra::ProcessResult result;
            result.status = infra::ProcessStatus::Exited;
            result.exitCode = 0;
            return result;
        }
        infra::ProcessResult result = m_results.front();
        m_results.pop_front();
        return result;
    }

    std::vector<Call> calls;

private:
    std::deque<infra::ProcessResult> m_results;
};
