#include "Virtualization/catalog/DeviceListParser.hpp"
#include "Virtualization/catalog/DevicePropertiesExtractor.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include <optional>
#include <utility>

namespace QEMUKIT {

namespace {

constexpr std::string_view kEntryPrefix = "name ";

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

} // namespace

DeviceListParser::LineKind DeviceListParser::classify(std::string_view line) noexcept {
    const std::string_view trimmed = trim(line);
    if (trimmed.empty()) return LineKind::Blank;
    if (trimmed.starts_with(kEntryPrefix)) return LineKind::Entry;
    const bool indented = line.front() == ' ' || line.front() == '\t';
    if (!indented && trimmed.size() > 1 && trimmed.back() == ':') return LineKind::Header;
    return LineKind::Unrecognized;
}

DeviceDescriptor DeviceListParser::parseEntry(std::string_view line, std::size_t lineNo) {
    std::vector<DevicePropertiesExtractor::Property> properties;
    try {
        properties = DevicePropertiesExtractor(trim(line)).run();
    } catch (const ParseError& e) {
        throw ParseError(e.reason(), lineNo);
    }

    DeviceDescriptor device;
    for (auto& [key, value] : properties) {
        if (key == "name") {
            device.name = std::move(value);
            continue;
        }
        // empty values are stored as absent
        std::optional<std::string> stored;
        if (!value.empty()) stored = std::move(value);

        if (key == "bus") {
            device.bus = std::move(stored);
        } else if (key == "alias") {
            device.alias = std::move(stored);
        } else if (key == "desc") {
            device.description = std::move(stored);
        } else {
            throw ParseError("unrecognized device property '" + key + "'", lineNo);
        }
    }
    if (device.name.empty()) {
        throw ParseError("device entry without a name", lineNo);
    }
    return device;
}

void DeviceListParser::feed(std::string_view line, std::size_t lineNo) {
    switch (classify(line)) {
        case LineKind::Blank:
            return;
        case LineKind::Header: {
            std::string_view header = trim(line);
            header.remove_suffix(1);
            std::string className(trim(header));
            catalog.addClass(className);
            current = InSection{ std::move(className) };
            return;
        }
        case LineKind::Entry: {
            auto* section = std::get_if<InSection>(&current);
            if (!section) {
                throw ParseError("device entry before any section header", lineNo);
            }
            catalog.addDevice(section->className, parseEntry(line, lineNo));
            return;
        }
        case LineKind::Unrecognized:
            throw ParseError("unrecognized line '" + std::string(trim(line)) + "'", lineNo);
    }
}

DeviceCatalog DeviceListParser::finish() {
    if (catalog.empty()) {
        throw ParseError("no device sections found");
    }
    current = OutsideSection{};
    return std::exchange(catalog, DeviceCatalog{});
}

DeviceCatalog DeviceListParser::parse(std::string_view output) {
    DeviceListParser parser;
    std::size_t lineNo = 0;
    std::size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) end = output.size();
        parser.feed(output.substr(start, end - start), ++lineNo);
        start = end + 1;
    }
    auto catalog = parser.finish();
    BoostLogger::Debug("parsed " + std::to_string(catalog.classCount()) + " device classes, " +
                       std::to_string(catalog.deviceCount()) + " devices");
    return catalog;
}

} // namespace QEMUKIT
