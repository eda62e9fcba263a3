#pragma once

#include "Core/interfaces/IProcessRunner.hpp"
#include "Virtualization/catalog/DeviceCatalog.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace QEMUKIT {

/**
 * @brief Builds a DeviceCatalog from `<qemu> -device help` and writes it out
 *
 * Each call runs the binary again; nothing is cached between calls.
 */
class DeviceCatalogGenerator {
public:
    static constexpr std::string_view kDefaultOutputPath = "./qemu_devices.catalog";

    /**
     * @param qemuPath binary to query, absolute/relative path or a name looked up in PATH
     * @param runner process runner, a BoostProcessRunner when null
     * @param timeout bound on the external run, unbounded when empty
     */
    explicit DeviceCatalogGenerator(std::string qemuPath,
                                    std::shared_ptr<IProcessRunner> runner = nullptr,
                                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Runs the introspection and parses its output
     * @throws ExternalToolError binary missing, non-zero exit or timeout
     * @throws ParseError output is not a device listing
     */
    [[nodiscard]] DeviceCatalog generateCatalog() const;

    /**
     * @brief generateCatalog() followed by writeCatalog()
     *
     * On any failure the file at outputPath is left untouched.
     */
    void generateDevicesFile(const std::filesystem::path& outputPath = std::filesystem::path(kDefaultOutputPath),
                             CatalogFormat format = CatalogFormat::Text) const;

    /**
     * @brief Writes the catalog through a temporary sibling renamed over outputPath
     * @throws IoError
     */
    static void writeCatalog(const DeviceCatalog& catalog,
                             const std::filesystem::path& outputPath,
                             CatalogFormat format = CatalogFormat::Text);

    [[nodiscard]] const std::string& qemuPath() const noexcept { return qemu; }

private:
    std::string qemu;
    std::shared_ptr<IProcessRunner> runner;
    std::optional<std::chrono::milliseconds> timeout;
};

} // namespace QEMUKIT
