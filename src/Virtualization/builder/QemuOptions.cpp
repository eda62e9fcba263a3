#include "Virtualization/builder/QemuOptions.hpp"
#include "Core/interfaces/IAttribute.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include <algorithm>

namespace QEMUKIT {

namespace {

template<AttributeType A>
void append(std::vector<std::string>& args, const A& attribute) {
  auto tokens = attribute.to_args();
  args.insert(args.end(), std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end()));
}

} // namespace

QemuOptions::QemuOptions(std::string_view qemuPath) : qemuBinary(qemuPath) {
  if (qemuBinary.empty()) {
    throw InvalidArgumentError("qemu binary path must not be empty");
  }
}

AttachmentId QemuOptions::addCdrom(std::string_view path) {
  return attach(QemuDriveKind::CdRom, path);
}

AttachmentId QemuOptions::addHardDrive(std::string_view path) {
  return attach(QemuDriveKind::HardDrive, path);
}

AttachmentId QemuOptions::attach(QemuDriveKind kind, std::string_view path) {
  if (path.empty()) {
    throw InvalidArgumentError(std::string("empty path for ") + std::string(tokensFor(kind).media) + " drive");
  }
  const AttachmentId id = nextId++;
  attachments.push_back(QemuDrive{ id, kind, std::string(path) });
  BoostLogger::Debug("attached " + std::string(tokensFor(kind).media) + " drive" + std::to_string(id) + ": " +
                     std::string(path));
  return id;
}

bool QemuOptions::hasAttachment(AttachmentId id) const noexcept {
  return std::ranges::any_of(attachments, [id](const QemuDrive& d) { return d.id == id; });
}

QemuOptions& QemuOptions::setBootOrder(AttachmentId id, int priority) {
  if (!hasAttachment(id)) {
    throw UnknownAttachmentError("no attachment with id " + std::to_string(id));
  }
  if (priority < 0) {
    throw InvalidArgumentError("boot priority must be non-negative, got " + std::to_string(priority));
  }
  bootOrder[id] = priority;
  return *this;
}

QemuOptions& QemuOptions::setAccelerationMode(QemuAccelerationMode mode) {
  acceleration = mode;
  return *this;
}

QemuOptions& QemuOptions::setRamMegabytes(long long megabytes) {
  if (megabytes <= 0) {
    throw InvalidArgumentError("RAM size must be positive, got " + std::to_string(megabytes) + "M");
  }
  ram = RamSize{ megabytes, RamUnit::Megabytes };
  return *this;
}

QemuOptions& QemuOptions::setRamGigabytes(long long gigabytes) {
  if (gigabytes <= 0) {
    throw InvalidArgumentError("RAM size must be positive, got " + std::to_string(gigabytes) + "G");
  }
  ram = RamSize{ gigabytes, RamUnit::Gigabytes };
  return *this;
}

QemuOptions& QemuOptions::setCpuCount(int cpus) {
  if (cpus <= 0) {
    throw InvalidArgumentError("CPU count must be positive, got " + std::to_string(cpus));
  }
  cpuCount = cpus;
  return *this;
}

QemuOptions& QemuOptions::setCpuModel(std::string_view model) {
  if (model.empty()) {
    throw InvalidArgumentError("CPU model must not be empty");
  }
  cpuModel = std::string(model);
  return *this;
}

std::optional<int> QemuOptions::bootPriority(AttachmentId id) const {
  auto it = bootOrder.find(id);
  if (it == bootOrder.end()) return std::nullopt;
  return it->second;
}

// Boot-ordered drives by ascending priority, then the rest; insertion order breaks ties
std::vector<const QemuDrive*> QemuOptions::bootSequence() const {
  std::vector<const QemuDrive*> sequence;
  sequence.reserve(attachments.size());
  for (const auto& drive : attachments) {
    sequence.push_back(&drive);
  }

  std::ranges::stable_sort(sequence, [this](const QemuDrive* lhs, const QemuDrive* rhs) {
    auto l = bootOrder.find(lhs->id);
    auto r = bootOrder.find(rhs->id);
    const bool lBoot = l != bootOrder.end();
    const bool rBoot = r != bootOrder.end();
    if (lBoot != rBoot) return lBoot;
    if (!lBoot) return false;
    return l->second < r->second;
  });
  return sequence;
}

void QemuOptions::appendMemory(std::vector<std::string>& args) const {
  if (!ram) return;
  const char unit = ram->unit == RamUnit::Gigabytes ? 'G' : 'M';
  append(args, SingleAttribute("m", std::to_string(ram->amount) + unit));
}

void QemuOptions::appendAcceleration(std::vector<std::string>& args) const {
  if (!acceleration) return;
  append(args, SingleAttribute("accel", toQemuString(*acceleration)));
}

void QemuOptions::appendCpu(std::vector<std::string>& args) const {
  if (cpuModel) {
    append(args, SingleAttribute("cpu", *cpuModel));
  }
  if (cpuCount) {
    append(args, SingleAttribute("smp", std::to_string(*cpuCount)));
  }
}

void QemuOptions::appendDrives(std::vector<std::string>& args) const {
  for (const QemuDrive* drive : bootSequence()) {
    const auto& tokens = tokensFor(drive->kind);
    const std::string qemuId = drive->qemuId();
    const auto priority = bootPriority(drive->id);

    VectorAttribute driveOption("drive");
    driveOption.add("file", drive->sourcePath)
               .add("id", qemuId)
               .add("media", tokens.media);
    if (!priority) {
      append(args, driveOption);
      continue;
    }

    // a bootindex needs an explicit front-end device, so detach the drive from the default bus
    driveOption.add("if", "none");
    append(args, driveOption);

    VectorAttribute device("device");
    device.add(tokens.deviceModel)
          .add("drive", qemuId)
          .add("bootindex", std::to_string(*priority));
    append(args, device);
  }
}

std::vector<std::string> QemuOptions::toArguments() const {
  std::vector<std::string> args{ qemuBinary };
  appendMemory(args);
  appendAcceleration(args);
  appendCpu(args);
  appendDrives(args);
  return args;
}

std::string QemuOptions::toCommandLine() const {
  std::string line;
  for (const auto& arg : toArguments()) {
    if (!line.empty()) line += ' ';
    line += arg;
  }
  return line;
}

} // namespace QEMUKIT
