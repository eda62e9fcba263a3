#pragma once

#include "Core/interfaces/IProcessRunner.hpp"
#include <boost/filesystem/path.hpp>

namespace QEMUKIT {

/**
 * @brief IProcessRunner backed by Boost.Process
 *
 * stdout and stderr are drained asynchronously on a private io_context,
 * which is also what bounds the run when a timeout is given.
 */
class BoostProcessRunner final : public IProcessRunner {
public:
    BoostProcessRunner() = default;
    ~BoostProcessRunner() noexcept override = default;

    [[nodiscard]] ProcessResult run(const std::string& program,
                                    const std::vector<std::string>& args,
                                    std::optional<std::chrono::milliseconds> timeout) override;

private:
    [[nodiscard]] static boost::filesystem::path resolve(const std::string& program);
};

} // namespace QEMUKIT
