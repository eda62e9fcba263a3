#include "Core/process/BoostProcessRunner.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <chrono>
#include <future>
#include <system_error>

namespace QEMUKIT {

namespace bp = boost::process;

boost::filesystem::path BoostProcessRunner::resolve(const std::string& program) {
    if (program.empty()) {
        throw ExternalToolError("empty program path");
    }
    if (program.find('/') != std::string::npos) {
        return boost::filesystem::path(program);
    }
    auto found = bp::search_path(program);
    if (found.empty()) {
        throw ExternalToolError("'" + program + "' not found in PATH");
    }
    return found;
}

ProcessResult BoostProcessRunner::run(const std::string& program,
                                      const std::vector<std::string>& args,
                                      std::optional<std::chrono::milliseconds> timeout) {
    const boost::filesystem::path exe = resolve(program);
    BoostLogger::Debug("spawning " + exe.string());

    boost::asio::io_context ioc;
    std::future<std::string> outData;
    std::future<std::string> errData;

    try {
        bp::child child(bp::exe = exe,
                        bp::args = args,
                        bp::std_in.close(),
                        bp::std_out > outData,
                        bp::std_err > errData,
                        ioc);

        if (timeout) {
            // one deadline for draining the pipes and for the exit itself
            const auto deadline = std::chrono::steady_clock::now() + *timeout;
            ioc.run_until(deadline);
            if (!ioc.stopped() || !child.wait_until(deadline)) {
                std::error_code ec;
                child.terminate(ec);
                BoostLogger::Warn(exe.string() + " killed after " + std::to_string(timeout->count()) + " ms");
                throw ExternalToolError(exe.string() + " did not finish within " +
                                        std::to_string(timeout->count()) + " ms", true);
            }
        } else {
            ioc.run();
            child.wait();
        }

        return ProcessResult{ child.exit_code(), outData.get(), errData.get() };
    } catch (const bp::process_error& e) {
        throw ExternalToolError("failed to run " + exe.string() + ": " + e.what());
    }
}

} // namespace QEMUKIT
