#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace QEMUKIT {

/**
 * @brief Splits one `-device help` entry into its key/value properties
 *
 * Input looks like
 * @code
 * name "virtio-net-pci", bus PCI, alias "virtio-net", desc "Virtio, network"
 * @endcode
 * Properties are separated by commas; a key is separated from its value by
 * a space; a value is either bare (ends at the next comma) or double
 * quoted (may contain commas).
 */
class DevicePropertiesExtractor {
public:
    using Property = std::pair<std::string, std::string>;

    enum class State {
        NameSearch,
        Name,
        ValueStart,
        Value,
        ValueInQuotes,
        PostValue
    };

    explicit DevicePropertiesExtractor(std::string_view line) : line(line) {}

    /**
     * @return properties in input order
     * @throws ParseError on a key without value, an unterminated quote
     *         or text after a closing quote
     */
    [[nodiscard]] std::vector<Property> run();

private:
    std::string_view line;
    State state{ State::NameSearch };
    std::size_t nameStart{ 0 };
    std::size_t valueStart{ 0 };
    std::string pendingName;
    std::vector<Property> properties;

    void onNameSearch(char c, std::size_t index);
    void onName(char c, std::size_t index);
    void onValueStart(char c, std::size_t index);
    void onValue(char c, std::size_t index);
    void onValueInQuotes(char c, std::size_t index);
    void onPostValue(char c, std::size_t index);
    void finish();

    void emit(std::string_view value);
};

} // namespace QEMUKIT
