#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace QEMUKIT {

/// Outcome of a finished child process
struct ProcessResult {
    int exitCode{ -1 };
    std::string out;   ///< captured standard output
    std::string err;   ///< captured standard error
};

/**
 * @brief Runs an external program to completion and captures its output
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() noexcept = default;

    /**
     * @param program path to the executable, or a bare name looked up in PATH
     * @param args arguments, not including the program itself
     * @param timeout kill the child and fail if it runs longer
     * @return exit status and captured streams; a non-zero exit is not an error here
     * @throws ExternalToolError if the program cannot be found or started,
     *         or (timeout variant) if it exceeds the timeout
     */
    [[nodiscard]] virtual ProcessResult run(const std::string& program,
                                            const std::vector<std::string>& args,
                                            std::optional<std::chrono::milliseconds> timeout) = 0;
};

} // namespace QEMUKIT
