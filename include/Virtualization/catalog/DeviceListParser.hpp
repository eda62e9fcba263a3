#pragma once
#include "Virtualization/catalog/DeviceCatalog.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace QEMUKIT {

/**
 * @brief Turns the output of `qemu-system-* -device help` into a DeviceCatalog
 *
 * The output is a list of sections:
 * @code
 * USB devices:
 * name "usb-kbd", bus usb-bus
 * name "usb-tablet", bus usb-bus
 *
 * Network devices:
 * name "e1000", bus PCI, alias "e1000-82540em", desc "Intel Gigabit Ethernet"
 * @endcode
 *
 * Blank lines are ignored. A header opens a section that lasts until the
 * next header. Every line that is neither blank, a header, nor a
 * well-formed entry inside a section is a ParseError: there is no
 * skip-and-continue mode.
 */
class DeviceListParser {
public:
    enum class LineKind { Blank, Header, Entry, Unrecognized };

    struct OutsideSection {};
    struct InSection {
        std::string className;
    };
    using State = std::variant<OutsideSection, InSection>;

    /// Classifies a single line without any section context
    [[nodiscard]] static LineKind classify(std::string_view line) noexcept;

    /// Feeds one line; lineNo is only used in error messages
    /// @throws ParseError
    void feed(std::string_view line, std::size_t lineNo);

    /// @throws ParseError if no section was seen
    [[nodiscard]] DeviceCatalog finish();

    /// Parses a whole `-device help` output
    /// @throws ParseError
    [[nodiscard]] static DeviceCatalog parse(std::string_view output);

    [[nodiscard]] const State& state() const noexcept { return current; }

private:
    State current{ OutsideSection{} };
    DeviceCatalog catalog;

    [[nodiscard]] static DeviceDescriptor parseEntry(std::string_view line, std::size_t lineNo);
};

} // namespace QEMUKIT
