#include "Virtualization/catalog/DeviceCatalog.hpp"
#include "Utils/Exception.hpp"
#include <pugixml.hpp>
#include <algorithm>

namespace QEMUKIT {

namespace {

constexpr char kFieldSeparator = '\t';

std::string escapeField(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c;
        }
    }
    return out;
}

std::string unescapeField(std::string_view field, std::size_t lineNo) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] != '\\') {
            out += field[i];
            continue;
        }
        if (++i == field.size()) {
            throw ParseError("dangling escape character", lineNo);
        }
        switch (field[i]) {
            case '\\': out += '\\'; break;
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            default:
                throw ParseError(std::string("unknown escape sequence \\") + field[i], lineNo);
        }
    }
    return out;
}

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto pos = line.find(kFieldSeparator, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            return fields;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string_view orEmpty(const std::optional<std::string>& value) noexcept {
    return value ? std::string_view(*value) : std::string_view();
}

std::optional<std::string> optionalField(std::string_view field, std::size_t lineNo) {
    if (field.empty()) return std::nullopt;
    return unescapeField(field, lineNo);
}

std::optional<std::string> optionalAttribute(const pugi::xml_node& node, const char* name) {
    auto attr = node.attribute(name);
    if (!attr) return std::nullopt;
    return std::string(attr.value());
}

} // namespace

std::optional<CatalogFormat> catalogFormatFromString(std::string_view name) noexcept {
    if (name == "text") return CatalogFormat::Text;
    if (name == "xml") return CatalogFormat::Xml;
    return std::nullopt;
}

DeviceCatalog::Devices* DeviceCatalog::findMutable(std::string_view className) noexcept {
    auto it = std::ranges::find_if(sections, [&](const auto& s) { return s.first == className; });
    return it == sections.end() ? nullptr : &it->second;
}

const DeviceCatalog::Devices* DeviceCatalog::find(std::string_view className) const noexcept {
    auto it = std::ranges::find_if(sections, [&](const auto& s) { return s.first == className; });
    return it == sections.end() ? nullptr : &it->second;
}

void DeviceCatalog::addClass(std::string_view className) {
    if (!findMutable(className)) {
        sections.emplace_back(std::string(className), Devices{});
    }
}

void DeviceCatalog::addDevice(std::string_view className, DeviceDescriptor device) {
    addClass(className);
    findMutable(className)->push_back(std::move(device));
}

std::optional<DeviceDescriptor> DeviceCatalog::findDevice(std::string_view nameOrAlias) const {
    for (const auto& [className, devices] : sections) {
        for (const auto& device : devices) {
            if (device.name == nameOrAlias || (device.alias && *device.alias == nameOrAlias)) {
                return device;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> DeviceCatalog::classNames() const {
    std::vector<std::string> names;
    names.reserve(sections.size());
    for (const auto& section : sections) {
        names.push_back(section.first);
    }
    return names;
}

std::size_t DeviceCatalog::deviceCount() const noexcept {
    std::size_t count = 0;
    for (const auto& section : sections) {
        count += section.second.size();
    }
    return count;
}

std::set<std::string> DeviceCatalog::buses() const {
    std::set<std::string> result;
    for (const auto& section : sections) {
        for (const auto& device : section.second) {
            if (device.bus) result.insert(*device.bus);
        }
    }
    return result;
}

std::string DeviceCatalog::toText() const {
    std::string text(kTextHeader);
    text += '\n';
    for (const auto& [className, devices] : sections) {
        text += "class";
        text += kFieldSeparator;
        text += escapeField(className);
        text += '\n';
        for (const auto& device : devices) {
            text += "device";
            for (std::string_view field : { std::string_view(className),
                                            std::string_view(device.name),
                                            orEmpty(device.bus),
                                            orEmpty(device.alias),
                                            orEmpty(device.description) }) {
                text += kFieldSeparator;
                text += escapeField(field);
            }
            text += '\n';
        }
    }
    return text;
}

DeviceCatalog DeviceCatalog::fromText(std::string_view text) {
    DeviceCatalog catalog;
    std::size_t lineNo = 0;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        start = end + 1;
        ++lineNo;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty() || line.front() == '#') continue;

        auto fields = splitFields(line);
        if (fields[0] == "class") {
            if (fields.size() != 2 || fields[1].empty()) {
                throw ParseError("class record needs exactly one non-empty name", lineNo);
            }
            catalog.addClass(unescapeField(fields[1], lineNo));
        } else if (fields[0] == "device") {
            if (fields.size() != 6) {
                throw ParseError("device record needs 5 fields, got " + std::to_string(fields.size() - 1), lineNo);
            }
            std::string className = unescapeField(fields[1], lineNo);
            if (!catalog.contains(className)) {
                throw ParseError("device record for undeclared class '" + className + "'", lineNo);
            }
            if (fields[2].empty()) {
                throw ParseError("device record without a name", lineNo);
            }
            DeviceDescriptor device{ unescapeField(fields[2], lineNo),
                                     optionalField(fields[5], lineNo),
                                     optionalField(fields[3], lineNo),
                                     optionalField(fields[4], lineNo) };
            catalog.addDevice(className, std::move(device));
        } else {
            throw ParseError("unknown record type '" + std::string(fields[0]) + "'", lineNo);
        }
    }
    return catalog;
}

DeviceCatalog DeviceCatalog::fromXml(std::string_view xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        throw ParseError(std::string("invalid XML: ") + result.description());
    }
    auto root = doc.child("deviceCatalog");
    if (!root) {
        throw ParseError("missing <deviceCatalog> root element");
    }

    DeviceCatalog catalog;
    for (auto cls : root.children("class")) {
        std::string className = cls.attribute("name").value();
        if (className.empty()) {
            throw ParseError("<class> without a name");
        }
        catalog.addClass(className);
        for (auto dev : cls.children("device")) {
            std::string name = dev.attribute("name").value();
            if (name.empty()) {
                throw ParseError("<device> without a name in class '" + className + "'");
            }
            catalog.addDevice(className, DeviceDescriptor{ std::move(name),
                                                           optionalAttribute(dev, "desc"),
                                                           optionalAttribute(dev, "bus"),
                                                           optionalAttribute(dev, "alias") });
        }
    }
    return catalog;
}

} // namespace QEMUKIT
