#include <catch2/catch.hpp>
#include "Virtualization/builder/QemuOptions.hpp"
#include "Utils/Exception.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace QEMUKIT;
using std::string;
using std::vector;

static size_t indexOf(const vector<string>& args, const string& token)
{
	auto it = std::find(args.begin(), args.end(), token);
	REQUIRE(it != args.end());
	return static_cast<size_t>(it - args.begin());
}

static bool contains(const string& haystack, const string& needle)
{
	return haystack.find(needle) != string::npos;
}

TEST_CASE("QemuOptions: attachment ids")
{
	QemuOptions options;
	SECTION("sequential and distinct") {
		CHECK(options.addCdrom("/a.iso") == 0);
		CHECK(options.addHardDrive("/b.img") == 1);
		CHECK(options.addCdrom("/c.iso") == 2);
		CHECK(options.addHardDrive("/d.img") == 3);
		CHECK(options.drives().size() == 4);
	}
	SECTION("empty path") {
		CHECK_THROWS_AS(options.addCdrom(""), InvalidArgumentError);
		CHECK_THROWS_AS(options.addHardDrive(""), InvalidArgumentError);
		CHECK(options.drives().empty());
		// a failed call does not consume an id
		CHECK(options.addCdrom("/a.iso") == 0);
	}
}

TEST_CASE("QemuOptions: empty binary")
{
	CHECK_THROWS_AS(QemuOptions(""), InvalidArgumentError);
}

TEST_CASE("QemuOptions: bare binary")
{
	QemuOptions options;
	CHECK(options.toCommandLine() == "qemu-system-x86_64");
	CHECK(options.toArguments() == vector<string>{"qemu-system-x86_64"});

	QemuOptions custom("/opt/qemu/bin/qemu-system-aarch64");
	CHECK(custom.toCommandLine() == "/opt/qemu/bin/qemu-system-aarch64");
}

TEST_CASE("QemuOptions: boot order")
{
	QemuOptions options;
	SECTION("unknown id") {
		CHECK_THROWS_AS(options.setBootOrder(0, 0), UnknownAttachmentError);
		auto id = options.addCdrom("/a.iso");
		CHECK_NOTHROW(options.setBootOrder(id, 0));
		CHECK_THROWS_AS(options.setBootOrder(id + 1, 0), UnknownAttachmentError);
		CHECK_THROWS_AS(options.setBootOrder(12345, 1), UnknownAttachmentError);
	}
	SECTION("negative priority") {
		auto id = options.addCdrom("/a.iso");
		CHECK_THROWS_AS(options.setBootOrder(id, -1), InvalidArgumentError);
		CHECK_FALSE(options.bootPriority(id));
	}
	SECTION("ascending priority, unordered drives last") {
		auto hd0 = options.addHardDrive("/hd0.img");
		auto cd1 = options.addCdrom("/cd1.iso");
		auto hd2 = options.addHardDrive("/hd2.img");
		auto cd3 = options.addCdrom("/cd3.iso");
		(void)hd0;
		(void)cd3;
		options.setBootOrder(cd1, 3).setBootOrder(hd2, 1);

		auto args = options.toArguments();
		auto p2 = indexOf(args, "file=/hd2.img,id=drive2,media=disk,if=none");
		auto p1 = indexOf(args, "file=/cd1.iso,id=drive1,media=cdrom,if=none");
		auto p0 = indexOf(args, "file=/hd0.img,id=drive0,media=disk");
		auto p3 = indexOf(args, "file=/cd3.iso,id=drive3,media=cdrom");
		CHECK(p2 < p1);
		CHECK(p1 < p0);
		CHECK(p0 < p3);
		CHECK(args[p2 + 1] == "-device");
		CHECK(args[p2 + 2] == "ide-hd,drive=drive2,bootindex=1");
		CHECK(args[p1 + 2] == "ide-cd,drive=drive1,bootindex=3");
	}
	SECTION("last assignment wins") {
		auto a = options.addCdrom("/a.iso");
		auto b = options.addHardDrive("/b.img");
		options.setBootOrder(a, 0).setBootOrder(b, 1);
		auto args = options.toArguments();
		CHECK(indexOf(args, "file=/a.iso,id=drive0,media=cdrom,if=none") <
		      indexOf(args, "file=/b.img,id=drive1,media=disk,if=none"));

		options.setBootOrder(a, 5);
		CHECK(options.bootPriority(a) == 5);
		args = options.toArguments();
		CHECK(indexOf(args, "file=/b.img,id=drive1,media=disk,if=none") <
		      indexOf(args, "file=/a.iso,id=drive0,media=cdrom,if=none"));
		CHECK(contains(options.toCommandLine(), "ide-cd,drive=drive0,bootindex=5"));
		CHECK_FALSE(contains(options.toCommandLine(), "bootindex=0"));
	}
	SECTION("equal priorities keep insertion order") {
		auto a = options.addHardDrive("/a.img");
		auto b = options.addCdrom("/b.iso");
		auto c = options.addHardDrive("/c.img");
		options.setBootOrder(c, 2).setBootOrder(a, 2).setBootOrder(b, 2);
		auto args = options.toArguments();
		auto pa = indexOf(args, "file=/a.img,id=drive0,media=disk,if=none");
		auto pb = indexOf(args, "file=/b.iso,id=drive1,media=cdrom,if=none");
		auto pc = indexOf(args, "file=/c.img,id=drive2,media=disk,if=none");
		CHECK(pa < pb);
		CHECK(pb < pc);
	}
}

TEST_CASE("QemuOptions: RAM")
{
	QemuOptions options;
	CHECK_THROWS_AS(options.setRamMegabytes(0), InvalidArgumentError);
	CHECK_THROWS_AS(options.setRamMegabytes(-5), InvalidArgumentError);
	CHECK_THROWS_AS(options.setRamGigabytes(0), InvalidArgumentError);
	CHECK_FALSE(options.ramSize());
	CHECK_FALSE(contains(options.toCommandLine(), "-m"));

	options.setRamMegabytes(4096);
	CHECK(options.toCommandLine() == "qemu-system-x86_64 -m 4096M");

	// a later call replaces the earlier one, unit included
	options.setRamGigabytes(8);
	CHECK(options.toCommandLine() == "qemu-system-x86_64 -m 8G");
	REQUIRE(options.ramSize());
	CHECK(options.ramSize()->amount == 8);
	CHECK(options.ramSize()->unit == QemuOptions::RamUnit::Gigabytes);
}

TEST_CASE("QemuOptions: acceleration")
{
	QemuOptions options;
	CHECK_FALSE(options.accelerationMode());

	options.setAccelerationMode(QemuAccelerationMode::Kvm);
	options.setAccelerationMode(QemuAccelerationMode::Tcg);
	CHECK(options.accelerationMode() == QemuAccelerationMode::Tcg);
	CHECK(options.toCommandLine() == "qemu-system-x86_64 -accel tcg");

	for (const auto& [mode, token] : kAccelerationTokens) {
		CHECK(accelerationModeFromString(token) == mode);
		options.setAccelerationMode(mode);
		CHECK(options.toCommandLine() == "qemu-system-x86_64 -accel " + string(token));
	}
	CHECK_FALSE(accelerationModeFromString("KVM"));
	CHECK_FALSE(accelerationModeFromString(""));
}

TEST_CASE("QemuOptions: cpu")
{
	QemuOptions options;
	CHECK_THROWS_AS(options.setCpuCount(0), InvalidArgumentError);
	CHECK_THROWS_AS(options.setCpuCount(-2), InvalidArgumentError);
	CHECK_THROWS_AS(options.setCpuModel(""), InvalidArgumentError);

	options.addHardDrive("/disk.img");
	options.setCpuCount(2).setCpuModel("host").setAccelerationMode(QemuAccelerationMode::Kvm).setRamGigabytes(2);
	CHECK(options.toCommandLine() ==
	      "qemu-system-x86_64 -m 2G -accel kvm -cpu host -smp 2 -drive file=/disk.img,id=drive0,media=disk");
}

TEST_CASE("QemuOptions: installer VM")
{
	QemuOptions options;
	options.setRamMegabytes(4096);
	options.setAccelerationMode(QemuAccelerationMode::Hax);
	auto iso = options.addCdrom("/iso/install.iso");
	auto disk = options.addHardDrive("/disk/img.qcow2");
	options.setBootOrder(iso, 0);
	options.setBootOrder(disk, 1);

	const string expected =
		"qemu-system-x86_64 -m 4096M -accel hax"
		" -drive file=/iso/install.iso,id=drive0,media=cdrom,if=none"
		" -device ide-cd,drive=drive0,bootindex=0"
		" -drive file=/disk/img.qcow2,id=drive1,media=disk,if=none"
		" -device ide-hd,drive=drive1,bootindex=1";
	CHECK(options.toCommandLine() == expected);

	SECTION("rendering is repeatable") {
		CHECK(options.toCommandLine() == options.toCommandLine());
		CHECK(options.toArguments() == options.toArguments());
	}
	SECTION("argument vector joins to the command line") {
		auto args = options.toArguments();
		string joined;
		for (const auto& arg : args) {
			if (!joined.empty()) joined += ' ';
			joined += arg;
		}
		CHECK(joined == expected);
		CHECK(args.size() == 13);
	}
}

TEST_CASE("QemuOptions: paths")
{
	QemuOptions options;
	SECTION("commas are doubled") {
		options.addHardDrive("/vm/a,b.img");
		CHECK(options.toCommandLine() ==
		      "qemu-system-x86_64 -drive file=/vm/a,,b.img,id=drive0,media=disk");
		CHECK(options.drives().front().sourcePath == "/vm/a,b.img");
	}
	SECTION("spaces are not shell quoted") {
		options.addCdrom("/my isos/install.iso");
		CHECK(options.toCommandLine() ==
		      "qemu-system-x86_64 -drive file=/my isos/install.iso,id=drive0,media=cdrom");
		// but the argument vector keeps the path in one element
		CHECK(options.toArguments() ==
		      vector<string>{"qemu-system-x86_64", "-drive", "file=/my isos/install.iso,id=drive0,media=cdrom"});
	}
}
