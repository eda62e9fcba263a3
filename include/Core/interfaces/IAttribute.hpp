#pragma once
#include <string>
#include <string_view>
#include <concepts>
#include <utility>
#include <vector>

namespace QEMUKIT {

// A command-line option that renders to "-<name> <value>"
template<typename T>
concept AttributeType = requires(const T t) {
    { t.name() } -> std::convertible_to<std::string_view>;
    { t.value() } -> std::convertible_to<std::string>;
    { t.to_args() } -> std::same_as<std::vector<std::string>>;
};

// CRTP base, derived classes supply value_impl()
template<typename Derived>
class IAttribute {
protected:
    std::string name_;

public:
    explicit IAttribute(std::string_view name) : name_(name) {}
    virtual ~IAttribute() = default;

    const std::string& name() const noexcept { return name_; }

    std::string value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    std::string flag() const { return "-" + name_; }

    std::vector<std::string> to_args() const {
        return { flag(), value() };
    }
};

/**
 * @brief Option carrying a single scalar value, e.g. "-m 4096M"
 */
class SingleAttribute final : public IAttribute<SingleAttribute> {
private:
    std::string value_;

public:
    SingleAttribute(std::string_view name, std::string_view value)
        : IAttribute(name), value_(value) {}

    std::string value_impl() const { return value_; }
};

/**
 * @brief Option carrying a comma separated property list,
 *        e.g. "-drive file=/a.iso,id=drive0,media=cdrom"
 *
 * Sub-entries keep insertion order. An entry with an empty value renders
 * as the bare key, which is how QEMU spells the leading driver name of a
 * "-device" list.
 */
class VectorAttribute final : public IAttribute<VectorAttribute> {
private:
    std::vector<std::pair<std::string, std::string>> attributes_;

public:
    explicit VectorAttribute(std::string_view name) : IAttribute(name) {}

    VectorAttribute& add(std::string_view sub_name, std::string_view sub_value = {}) {
        attributes_.emplace_back(sub_name, sub_value);
        return *this;
    }

    std::string value_impl() const {
        std::string result;
        for (const auto& [key, val] : attributes_) {
            if (!result.empty()) result += ',';
            result += key;
            if (!val.empty()) {
                result += '=';
                result += escape(val);
            }
        }
        return result;
    }

    // QEMU reads ",," as a literal comma inside an option value
    static std::string escape(std::string_view raw) {
        std::string out;
        out.reserve(raw.size());
        for (char c : raw) {
            out += c;
            if (c == ',') out += ',';
        }
        return out;
    }
};

} // namespace QEMUKIT
