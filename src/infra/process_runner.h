#ifndef INFRA_PROCESS_RUNNER_H
#define INFRA_PROCESS_RUNNER_H

#include <string>
#include <vector>

namespace infra {

enum class ProcessStatus : unsigned char {
    Exited = 0,   // ran to completion; see exitCode
    NotFound,     // executable could not be located
    TimedOut,     // killed after the timeout elapsed
    SpawnFailed   // pipes/fork/exec failed for another reason
};

struct ProcessResult {
    ProcessStatus status = ProcessStatus::SpawnFailed;
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;

    bool succeeded() const { return status == ProcessStatus::Exited && exitCode == 0; }
};

const char *processStatusName(ProcessStatus status);

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // Runs argv[0] with the given arguments, blocking for at most timeoutMs.
    // `input` is written to the child's stdin, which is then closed.
    virtual ProcessResult run(const std::vector<std::string> &argv,
                              unsigned long timeoutMs,
                              const std::string &input = std::string()) = 0;
};

} // namespace infra

#endif // INFRA_PROCESS_RUNNER_H
