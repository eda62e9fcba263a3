#pragma once
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace QEMUKIT {

/// One "name ..., bus ..., desc ..." entry of `-device help`
struct DeviceDescriptor {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> bus;
    std::optional<std::string> alias;

    bool operator==(const DeviceDescriptor&) const = default;
};

enum class CatalogFormat { Text, Xml };

[[nodiscard]] std::optional<CatalogFormat> catalogFormatFromString(std::string_view name) noexcept;

/**
 * @brief Device classes reported by QEMU, each with its devices
 *
 * Classes and devices keep the order in which they were added.
 *
 * Text serialization (toText/fromText), one record per line, tab separated:
 * @code
 * # qemukit device catalog v1
 * class	<class name>
 * device	<class name>	<name>	<bus>	<alias>	<description>
 * @endcode
 * An empty field stands for an absent value. Backslash, tab, newline and
 * carriage return inside a field are written as \\ \t \n \r.
 */
class DeviceCatalog {
public:
    using Devices = std::vector<DeviceDescriptor>;

    static constexpr std::string_view kTextHeader = "# qemukit device catalog v1";

    /// Adds an empty class unless it already exists
    void addClass(std::string_view className);
    /// Appends a device, creating its class on first use
    void addDevice(std::string_view className, DeviceDescriptor device);

    /// @return devices of the class, nullptr if the class is unknown
    [[nodiscard]] const Devices* find(std::string_view className) const noexcept;
    [[nodiscard]] bool contains(std::string_view className) const noexcept { return find(className) != nullptr; }

    /// Looks a device up by name or alias in every class
    [[nodiscard]] std::optional<DeviceDescriptor> findDevice(std::string_view nameOrAlias) const;

    [[nodiscard]] std::vector<std::string> classNames() const;
    [[nodiscard]] std::size_t classCount() const noexcept { return sections.size(); }
    [[nodiscard]] std::size_t deviceCount() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return sections.empty(); }

    /// Distinct bus names over all devices, sorted
    [[nodiscard]] std::set<std::string> buses() const;

    [[nodiscard]] std::string toText() const;
    /// @throws ParseError on a malformed record
    [[nodiscard]] static DeviceCatalog fromText(std::string_view text);
    /// Reads the document written by DeviceCatalogXmlBuilder
    /// @throws ParseError if the document is not a device catalog
    [[nodiscard]] static DeviceCatalog fromXml(std::string_view xml);

    [[nodiscard]] auto begin() const noexcept { return sections.begin(); }
    [[nodiscard]] auto end() const noexcept { return sections.end(); }

    bool operator==(const DeviceCatalog&) const = default;

private:
    std::vector<std::pair<std::string, Devices>> sections;

    Devices* findMutable(std::string_view className) noexcept;
};

} // namespace QEMUKIT
