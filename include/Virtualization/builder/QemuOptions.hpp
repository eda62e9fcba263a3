#pragma once

#include "Virtualization/qemu/QemuAccelerationMode.hpp"
#include "Virtualization/qemu/QemuDrive.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace QEMUKIT {

/**
 * @brief Accumulates the hardware of a QEMU virtual machine and renders it
 *        into a qemu-system invocation
 *
 * Every setter validates its input and throws at the offending call;
 * rendering never throws for state reachable through the public API and
 * does not modify the object.
 */
class QemuOptions {
public:
  enum class RamUnit { Megabytes, Gigabytes };

  struct RamSize {
    long long amount;
    RamUnit unit;
  };

  static constexpr std::string_view kDefaultQemuBinary = "qemu-system-x86_64";

  /**
   * @param qemuPath Binary placed first on the command line; taken as given
   * @throws InvalidArgumentError if qemuPath is empty
   */
  explicit QemuOptions(std::string_view qemuPath = kDefaultQemuBinary);

  /**
   * @brief Attaches an ISO image as a CD-ROM
   * @return id usable with setBootOrder(); ids start at 0 and increase by one
   * @throws InvalidArgumentError if path is empty
   */
  AttachmentId addCdrom(std::string_view path);

  /**
   * @brief Attaches a disk image as a hard drive
   * @return id usable with setBootOrder()
   * @throws InvalidArgumentError if path is empty
   */
  AttachmentId addHardDrive(std::string_view path);

  /**
   * @brief Records the boot priority of an attachment (lower boots first)
   *
   * Calling it again for the same id overwrites the priority.
   *
   * @throws UnknownAttachmentError if id was not issued by this instance
   * @throws InvalidArgumentError if priority is negative
   */
  QemuOptions& setBootOrder(AttachmentId id, int priority);

  QemuOptions& setAccelerationMode(QemuAccelerationMode mode);

  /// @throws InvalidArgumentError unless megabytes > 0
  QemuOptions& setRamMegabytes(long long megabytes);
  /// @throws InvalidArgumentError unless gigabytes > 0
  QemuOptions& setRamGigabytes(long long gigabytes);

  /// @throws InvalidArgumentError unless cpus > 0
  QemuOptions& setCpuCount(int cpus);
  /// @throws InvalidArgumentError if model is empty
  QemuOptions& setCpuModel(std::string_view model);

  /**
   * @brief Renders the invocation as one space separated string
   *
   * Paths are not shell-quoted. A path containing spaces or shell
   * metacharacters produces a string that a shell splits incorrectly;
   * use toArguments() when handing the command to an exec-style launcher.
   */
  [[nodiscard]] std::string toCommandLine() const;

  /// @brief Same rendering as toCommandLine(), one argv element per token
  [[nodiscard]] std::vector<std::string> toArguments() const;

  [[nodiscard]] const std::string& qemuPath() const noexcept { return qemuBinary; }
  [[nodiscard]] const std::vector<QemuDrive>& drives() const noexcept { return attachments; }
  [[nodiscard]] std::optional<int> bootPriority(AttachmentId id) const;
  [[nodiscard]] std::optional<QemuAccelerationMode> accelerationMode() const noexcept { return acceleration; }
  [[nodiscard]] std::optional<RamSize> ramSize() const noexcept { return ram; }

private:
  std::string qemuBinary;
  std::vector<QemuDrive> attachments;
  std::map<AttachmentId, int> bootOrder;
  std::optional<QemuAccelerationMode> acceleration;
  std::optional<RamSize> ram;
  std::optional<int> cpuCount;
  std::optional<std::string> cpuModel;
  AttachmentId nextId{ 0 };

  AttachmentId attach(QemuDriveKind kind, std::string_view path);
  [[nodiscard]] bool hasAttachment(AttachmentId id) const noexcept;
  [[nodiscard]] std::vector<const QemuDrive*> bootSequence() const;

  void appendMemory(std::vector<std::string>& args) const;
  void appendAcceleration(std::vector<std::string>& args) const;
  void appendCpu(std::vector<std::string>& args) const;
  void appendDrives(std::vector<std::string>& args) const;
};

} // namespace QEMUKIT
