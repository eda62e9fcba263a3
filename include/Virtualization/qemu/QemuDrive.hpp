#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace QEMUKIT {

using AttachmentId = std::uint32_t;

enum class QemuDriveKind { CdRom, HardDrive };

struct QemuDriveKindTokens {
    QemuDriveKind kind;
    std::string_view media;        // "-drive ...,media=<media>"
    std::string_view deviceModel;  // "-device <model>,drive=...,bootindex=N"
};

inline constexpr std::array<QemuDriveKindTokens, 2> kDriveKindTokens{{
    { QemuDriveKind::CdRom,     "cdrom", "ide-cd" },
    { QemuDriveKind::HardDrive, "disk",  "ide-hd" },
}};

[[nodiscard]] constexpr const QemuDriveKindTokens& tokensFor(QemuDriveKind kind) noexcept {
    for (const auto& row : kDriveKindTokens) {
        if (row.kind == kind) return row;
    }
    return kDriveKindTokens.front();
}

// A drive attached to the VM; immutable once created
struct QemuDrive {
    AttachmentId id;
    QemuDriveKind kind;
    std::string sourcePath;

    // id linking "-drive" to its "-device" on the QEMU command line
    [[nodiscard]] std::string qemuId() const { return "drive" + std::to_string(id); }
};

} // namespace QEMUKIT
