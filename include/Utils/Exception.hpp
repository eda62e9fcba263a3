#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace QEMUKIT {

class QemuKitException : public std::runtime_error {
public:
    explicit QemuKitException(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad scalar value handed to the options API (non-positive RAM, empty path...)
class InvalidArgumentError : public QemuKitException {
public:
    explicit InvalidArgumentError(const std::string& msg) : QemuKitException("[InvalidArgument] " + msg) {}
};

class UnknownAttachmentError : public QemuKitException {
public:
    explicit UnknownAttachmentError(const std::string& msg) : QemuKitException("[UnknownAttachment] " + msg) {}
};

class ExternalToolError : public QemuKitException {
public:
    explicit ExternalToolError(const std::string& msg, bool timeout = false)
        : QemuKitException(std::string(timeout ? "[ExternalTool/Timeout] " : "[ExternalTool] ") + msg),
          timedOut(timeout) {}

    [[nodiscard]] bool isTimeout() const noexcept { return timedOut; }

private:
    bool timedOut;
};

class ParseError : public QemuKitException {
public:
    explicit ParseError(const std::string& msg)
        : QemuKitException("[Parse] " + msg), detail(msg), lineNo(0) {}
    ParseError(const std::string& msg, std::size_t line)
        : QemuKitException("[Parse] line " + std::to_string(line) + ": " + msg), detail(msg), lineNo(line) {}

    /// 1-based line of the offending input, 0 when not tied to a line
    [[nodiscard]] std::size_t line() const noexcept { return lineNo; }
    /// message without the kind and line prefix
    [[nodiscard]] const std::string& reason() const noexcept { return detail; }

private:
    std::string detail;
    std::size_t lineNo;
};

class IoError : public QemuKitException {
public:
    explicit IoError(const std::string& msg) : QemuKitException("[Io] " + msg) {}
};

} // namespace QEMUKIT
