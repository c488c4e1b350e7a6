/**
 * ProcessRunner.hpp - Spawn a utility, capture its output, bound its runtime
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace ut {

struct ProcessOutput {
    std::string out;
    std::string err;
    int exit_code = -1;
};

class ProcessRunner {
public:
    // argv[0] is looked up in PATH; no shell is involved.
    // Throws HandlerError: NotFound if the program cannot be started,
    // Timeout if it outlives the deadline, Cancelled if *cancel becomes true.
    static ProcessOutput run(const std::vector<std::string>& argv,
                             const std::string& cwd,
                             std::chrono::milliseconds timeout,
                             const std::atomic<bool>* cancel = nullptr);
};

} // namespace ut
