#pragma once
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace QEMUKIT {

enum class QemuAccelerationMode { Kvm, Xen, Hax, Hvf, Nvmm, Whpx, Tcg };

// Values accepted by "-accel". A new mode needs its row here.
inline constexpr std::array<std::pair<QemuAccelerationMode, std::string_view>, 7> kAccelerationTokens{{
    { QemuAccelerationMode::Kvm,  "kvm"  },
    { QemuAccelerationMode::Xen,  "xen"  },
    { QemuAccelerationMode::Hax,  "hax"  },
    { QemuAccelerationMode::Hvf,  "hvf"  },
    { QemuAccelerationMode::Nvmm, "nvmm" },
    { QemuAccelerationMode::Whpx, "whpx" },
    { QemuAccelerationMode::Tcg,  "tcg"  },
}};

[[nodiscard]] constexpr std::string_view toQemuString(QemuAccelerationMode mode) noexcept {
    for (const auto& [m, token] : kAccelerationTokens) {
        if (m == mode) return token;
    }
    return {};
}

[[nodiscard]] constexpr std::optional<QemuAccelerationMode> accelerationModeFromString(std::string_view token) noexcept {
    for (const auto& [m, t] : kAccelerationTokens) {
        if (t == token) return m;
    }
    return std::nullopt;
}

} // namespace QEMUKIT
