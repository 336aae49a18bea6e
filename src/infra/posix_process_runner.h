#ifndef INFRA_POSIX_PROCESS_RUNNER_H
#define INFRA_POSIX_PROCESS_RUNNER_H

#include "process_runner.h"

namespace infra {

class PosixProcessRunner : public IProcessRunner {
public:
    PosixProcessRunner() = default;
    ~PosixProcessRunner() override = default;

    ProcessResult run(const std::vector<std::string> &argv,
                      unsigned long timeoutMs,
                      const std::string &input = std::string()) override;
};

} // namespace infra

#endif // INFRA_POSIX_PROCESS_RUNNER_H
