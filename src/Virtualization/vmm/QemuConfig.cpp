#include "Virtualization/vmm/QemuConfig.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace QEMUKIT {

namespace {

using json = nlohmann::json;

// Raised while walking the document, turned into the std::expected error by parse()
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void rejectUnknownKeys(const json& object, const std::set<std::string>& known, const std::string& where) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (!known.contains(it.key())) {
            throw ConfigError("unknown key '" + it.key() + "' in " + where);
        }
    }
}

void requireObject(const json& value, const std::string& key) {
    if (!value.is_object()) throw ConfigError("'" + key + "' must be an object");
}

std::string requireString(const json& value, const std::string& key) {
    if (!value.is_string()) throw ConfigError("'" + key + "' must be a string");
    return value.get<std::string>();
}

long long requireInteger(const json& value, const std::string& key) {
    if (!value.is_number_integer()) throw ConfigError("'" + key + "' must be an integer");
    if (value.is_number_unsigned() &&
        value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        throw ConfigError("'" + key + "' is out of range");
    }
    return value.get<long long>();
}

int requireInt(const json& value, const std::string& key) {
    const long long v = requireInteger(value, key);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError("'" + key + "' is out of range");
    }
    return static_cast<int>(v);
}

QemuDriveKind parseDriveKind(const std::string& type) {
    for (const auto& row : kDriveKindTokens) {
        if (row.media == type) return row.kind;
    }
    throw ConfigError("unknown drive type '" + type + "' (expected \"cdrom\" or \"disk\")");
}

DriveConfig parseDrive(const json& node, std::size_t index) {
    const std::string where = "drives[" + std::to_string(index) + "]";
    requireObject(node, where);
    rejectUnknownKeys(node, { "type", "path", "boot_index" }, where);
    if (!node.contains("type") || !node.contains("path")) {
        throw ConfigError(where + " needs \"type\" and \"path\"");
    }

    DriveConfig drive{ parseDriveKind(requireString(node["type"], where + ".type")),
                       requireString(node["path"], where + ".path"),
                       std::nullopt };
    if (node.contains("boot_index")) {
        drive.bootIndex = requireInt(node["boot_index"], where + ".boot_index");
    }
    return drive;
}

CatalogConfig parseCatalog(const json& node) {
    requireObject(node, "catalog");
    rejectUnknownKeys(node, { "output", "format", "timeout_seconds" }, "catalog");

    CatalogConfig catalog;
    if (node.contains("output")) {
        catalog.output = requireString(node["output"], "catalog.output");
    }
    if (node.contains("format")) {
        const auto name = requireString(node["format"], "catalog.format");
        auto format = catalogFormatFromString(name);
        if (!format) throw ConfigError("unknown catalog format '" + name + "'");
        catalog.format = *format;
    }
    if (node.contains("timeout_seconds")) {
        const long long seconds = requireInteger(node["timeout_seconds"], "catalog.timeout_seconds");
        if (seconds <= 0) throw ConfigError("'catalog.timeout_seconds' must be positive");
        catalog.timeout = std::chrono::seconds(seconds);
    }
    return catalog;
}

LoggingConfig parseLogging(const json& node) {
    requireObject(node, "logging");
    rejectUnknownKeys(node, { "level", "file" }, "logging");

    LoggingConfig logging;
    if (node.contains("level")) {
        const auto name = requireString(node["level"], "logging.level");
        logging.level = BoostLogger::ParseLevel(name);
        if (!logging.level) throw ConfigError("unknown log level '" + name + "'");
    }
    if (node.contains("file")) {
        logging.file = requireString(node["file"], "logging.file");
    }
    return logging;
}

} // namespace

std::expected<QemuConfig, std::string> QemuConfig::parse(std::string_view text) noexcept {
    try {
        const json root = json::parse(text.begin(), text.end());
        if (!root.is_object()) {
            return std::unexpected(std::string("configuration root must be a JSON object"));
        }
        rejectUnknownKeys(root, { "qemu", "ram_megabytes", "ram_gigabytes", "cpus", "cpu",
                                  "acceleration", "drives", "catalog", "logging" }, "configuration");

        QemuConfig cfg;
        if (root.contains("qemu")) {
            cfg.qemu = requireString(root["qemu"], "qemu");
        }
        if (root.contains("ram_megabytes") && root.contains("ram_gigabytes")) {
            throw ConfigError("'ram_megabytes' and 'ram_gigabytes' are mutually exclusive");
        }
        if (root.contains("ram_megabytes")) {
            cfg.ramMegabytes = requireInteger(root["ram_megabytes"], "ram_megabytes");
        }
        if (root.contains("ram_gigabytes")) {
            cfg.ramGigabytes = requireInteger(root["ram_gigabytes"], "ram_gigabytes");
        }
        if (root.contains("cpus")) {
            cfg.cpus = requireInt(root["cpus"], "cpus");
        }
        if (root.contains("cpu")) {
            cfg.cpuModel = requireString(root["cpu"], "cpu");
        }
        if (root.contains("acceleration")) {
            const auto name = requireString(root["acceleration"], "acceleration");
            cfg.acceleration = accelerationModeFromString(name);
            if (!cfg.acceleration) throw ConfigError("unknown acceleration mode '" + name + "'");
        }
        if (root.contains("drives")) {
            const json& drives = root["drives"];
            if (!drives.is_array()) throw ConfigError("'drives' must be an array");
            for (std::size_t i = 0; i < drives.size(); ++i) {
                cfg.drives.push_back(parseDrive(drives[i], i));
            }
        }
        if (root.contains("catalog")) {
            cfg.catalog = parseCatalog(root["catalog"]);
        }
        if (root.contains("logging")) {
            cfg.logging = parseLogging(root["logging"]);
        }
        return cfg;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid JSON: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::expected<QemuConfig, std::string> QemuConfig::fromFile(const std::filesystem::path& path) noexcept {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected("cannot read configuration file " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    auto cfg = parse(content.str());
    if (!cfg) {
        return std::unexpected(path.string() + ": " + cfg.error());
    }
    return cfg;
}

QemuOptions QemuConfig::toOptions() const {
    QemuOptions options(qemu);
    if (ramMegabytes) options.setRamMegabytes(*ramMegabytes);
    if (ramGigabytes) options.setRamGigabytes(*ramGigabytes);
    if (cpuModel) options.setCpuModel(*cpuModel);
    if (cpus) options.setCpuCount(*cpus);
    if (acceleration) options.setAccelerationMode(*acceleration);

    for (const auto& drive : drives) {
        const AttachmentId id = drive.kind == QemuDriveKind::CdRom ? options.addCdrom(drive.path)
                                                                   : options.addHardDrive(drive.path);
        if (drive.bootIndex) {
            options.setBootOrder(id, *drive.bootIndex);
        }
    }
    return options;
}

BoostLogger::Config QemuConfig::loggerConfig() const {
    BoostLogger::Config config;
    if (logging.level) {
        config.console_level = *logging.level;
    }
    if (logging.file) {
        config.enable_file = true;
        config.file_path = *logging.file;
    }
    return config;
}

} // namespace QEMUKIT
