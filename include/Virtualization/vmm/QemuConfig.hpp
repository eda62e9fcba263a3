#ifndef QEMUKIT_QEMUCONFIG_H
#define QEMUKIT_QEMUCONFIG_H

#include "Utils/Logger.hpp"
#include "Virtualization/builder/QemuOptions.hpp"
#include "Virtualization/catalog/DeviceCatalog.hpp"
#include "Virtualization/catalog/DeviceCatalogGenerator.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace QEMUKIT {

struct DriveConfig {
    QemuDriveKind kind;            // "cdrom" | "disk"
    std::string path;
    std::optional<int> bootIndex;
};

struct CatalogConfig {
    std::string output{ DeviceCatalogGenerator::kDefaultOutputPath };
    CatalogFormat format{ CatalogFormat::Text };
    std::optional<std::chrono::seconds> timeout;
};

struct LoggingConfig {
    std::optional<BoostLogger::Level> level;
    std::optional<std::string> file;
};

struct QemuConfig {
    std::string qemu{ QemuOptions::kDefaultQemuBinary };

    // resources
    std::optional<long long> ramMegabytes;
    std::optional<long long> ramGigabytes;
    std::optional<int> cpus;
    std::optional<std::string> cpuModel;
    std::optional<QemuAccelerationMode> acceleration;

    // storage, in attachment order
    std::vector<DriveConfig> drives;

    CatalogConfig catalog;
    LoggingConfig logging;

    // JSON in; structural and type errors come back as the error string
    [[nodiscard]] static std::expected<QemuConfig, std::string> parse(std::string_view json) noexcept;
    [[nodiscard]] static std::expected<QemuConfig, std::string> fromFile(const std::filesystem::path& path) noexcept;

    // value checks happen here, through the QemuOptions setters
    [[nodiscard]] QemuOptions toOptions() const;

    [[nodiscard]] BoostLogger::Config loggerConfig() const;
};

} // namespace QEMUKIT

#endif // QEMUKIT_QEMUCONFIG_H
