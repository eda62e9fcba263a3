#include "Virtualization/catalog/DeviceCatalogGenerator.hpp"
#include "Core/process/BoostProcessRunner.hpp"
#include "Virtualization/builder/DeviceCatalogXmlBuilder.hpp"
#include "Virtualization/catalog/DeviceListParser.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>
#include <utility>

namespace QEMUKIT {

namespace {

const std::vector<std::string> kIntrospectionArgs{ "-device", "help" };

std::filesystem::path temporarySibling(const std::filesystem::path& target) {
    boost::uuids::random_generator gen;
    auto name = target.filename().string() + "." + boost::uuids::to_string(gen()) + ".tmp";
    return target.parent_path() / name;
}

// first line of stderr, enough to tell why qemu refused
std::string firstLine(const std::string& text) {
    auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

DeviceCatalogGenerator::DeviceCatalogGenerator(std::string qemuPath,
                                               std::shared_ptr<IProcessRunner> runner,
                                               std::optional<std::chrono::milliseconds> timeout)
    : qemu(std::move(qemuPath)),
      runner(runner ? std::move(runner) : std::make_shared<BoostProcessRunner>()),
      timeout(timeout) {}

DeviceCatalog DeviceCatalogGenerator::generateCatalog() const {
    BoostLogger::Info("querying devices from " + qemu);
    ProcessResult result = runner->run(qemu, kIntrospectionArgs, timeout);
    if (result.exitCode != 0) {
        std::string msg = qemu + " -device help exited with status " + std::to_string(result.exitCode);
        if (!result.err.empty()) msg += ": " + firstLine(result.err);
        BoostLogger::Warn(msg);
        throw ExternalToolError(msg);
    }

    DeviceCatalog catalog;
    try {
        catalog = DeviceListParser::parse(result.out);
    } catch (const ParseError& e) {
        BoostLogger::Warn(std::string("device listing rejected: ") + e.what());
        throw;
    }
    BoostLogger::Info("found " + std::to_string(catalog.deviceCount()) + " devices in " +
                      std::to_string(catalog.classCount()) + " classes");
    return catalog;
}

void DeviceCatalogGenerator::generateDevicesFile(const std::filesystem::path& outputPath, CatalogFormat format) const {
    writeCatalog(generateCatalog(), outputPath, format);
}

void DeviceCatalogGenerator::writeCatalog(const DeviceCatalog& catalog,
                                          const std::filesystem::path& outputPath,
                                          CatalogFormat format) {
    std::string payload;
    if (format == CatalogFormat::Xml) {
        DeviceCatalogXmlBuilder builder;
        payload = builder.setCatalog(catalog).build();
    } else {
        payload = catalog.toText();
    }

    const auto tmp = temporarySibling(outputPath);
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw IoError("cannot open " + tmp.string() + " for writing");
        }
        file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        file.close();
        if (!file) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw IoError("failed writing " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, outputPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw IoError("cannot replace " + outputPath.string() + ": " + ec.message());
    }
    BoostLogger::Info("device catalog written to " + outputPath.string());
}

} // namespace QEMUKIT
