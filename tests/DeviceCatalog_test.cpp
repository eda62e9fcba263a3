#include <catch2/catch.hpp>
#include "Virtualization/catalog/DeviceCatalog.hpp"
#include "Virtualization/builder/DeviceCatalogXmlBuilder.hpp"
#include "Utils/Exception.hpp"
#include <pugixml.hpp>
#include <string>

using namespace QEMUKIT;
using std::string;

static DeviceCatalog sampleCatalog()
{
	DeviceCatalog catalog;
	catalog.addDevice("USB devices", {"usb-kbd", std::nullopt, "usb-bus", std::nullopt});
	catalog.addDevice("USB devices", {"usb-tablet", std::nullopt, "usb-bus", std::nullopt});
	catalog.addDevice("Network devices", {"e1000", "Intel Gigabit Ethernet", "PCI", "e1000-82540em"});
	catalog.addClass("Watchdog devices");
	return catalog;
}

TEST_CASE("DeviceCatalog: lookup")
{
	auto catalog = sampleCatalog();
	CHECK(catalog.classCount() == 3);
	CHECK(catalog.deviceCount() == 3);
	CHECK(catalog.classNames() == std::vector<string>{"USB devices", "Network devices", "Watchdog devices"});
	CHECK(catalog.contains("Watchdog devices"));
	CHECK_FALSE(catalog.contains("Sound devices"));
	CHECK(catalog.find("Sound devices") == nullptr);

	SECTION("by name or alias") {
		auto byName = catalog.findDevice("e1000");
		auto byAlias = catalog.findDevice("e1000-82540em");
		REQUIRE(byName);
		REQUIRE(byAlias);
		CHECK(*byName == *byAlias);
		CHECK_FALSE(catalog.findDevice("virtio-blk"));
	}
	SECTION("addClass does not reset a class") {
		catalog.addClass("USB devices");
		CHECK(catalog.find("USB devices")->size() == 2);
		CHECK(catalog.classCount() == 3);
	}
	SECTION("buses are distinct and sorted") {
		CHECK(catalog.buses() == std::set<string>{"PCI", "usb-bus"});
		CHECK(DeviceCatalog().buses().empty());
	}
	SECTION("format names") {
		CHECK(catalogFormatFromString("text") == CatalogFormat::Text);
		CHECK(catalogFormatFromString("xml") == CatalogFormat::Xml);
		CHECK_FALSE(catalogFormatFromString("json"));
	}
}

TEST_CASE("DeviceCatalog: text form")
{
	auto catalog = sampleCatalog();
	const string expected =
		"# qemukit device catalog v1\n"
		"class\tUSB devices\n"
		"device\tUSB devices\tusb-kbd\tusb-bus\t\t\n"
		"device\tUSB devices\tusb-tablet\tusb-bus\t\t\n"
		"class\tNetwork devices\n"
		"device\tNetwork devices\te1000\tPCI\te1000-82540em\tIntel Gigabit Ethernet\n"
		"class\tWatchdog devices\n";
	CHECK(catalog.toText() == expected);
	CHECK(DeviceCatalog::fromText(expected) == catalog);
	CHECK(DeviceCatalog().toText() == "# qemukit device catalog v1\n");

	SECTION("escaped fields") {
		DeviceCatalog odd;
		odd.addDevice("Misc devices", {"weird", "tab\there\nnewline \\ backslash", std::nullopt, std::nullopt});
		auto text = odd.toText();
		CHECK(text.find("tab\\there\\nnewline \\\\ backslash") != string::npos);
		CHECK(DeviceCatalog::fromText(text) == odd);
	}
	SECTION("comments, blank lines and CRLF") {
		auto parsed = DeviceCatalog::fromText(
			"# comment\r\n\r\nclass\tUSB devices\r\ndevice\tUSB devices\tusb-kbd\tusb-bus\t\t\r\n");
		REQUIRE(parsed.find("USB devices"));
		CHECK(parsed.find("USB devices")->front() ==
		      DeviceDescriptor{"usb-kbd", std::nullopt, "usb-bus", std::nullopt});
	}
}

TEST_CASE("DeviceCatalog: malformed text")
{
	auto lineOf = [](const string& text) -> size_t {
		try {
			(void)DeviceCatalog::fromText(text);
		} catch (const ParseError& e) {
			return e.line();
		}
		return 0;
	};
	CHECK(lineOf("class\tA\nwidget\tA\n") == 2);
	CHECK(lineOf("device\tA\tx\t\t\t\n") == 1);
	CHECK(lineOf("class\tA\ndevice\tA\tx\t\t\n") == 2);
	CHECK(lineOf("class\tA\ndevice\tA\t\tPCI\t\t\n") == 2);
	CHECK(lineOf("class\n") == 1);
	CHECK(lineOf("class\tA\tB\n") == 1);
	CHECK(lineOf("class\tA\ndevice\tA\tx\\q\t\t\t\n") == 2);
	CHECK(lineOf("class\tA\ndevice\tA\tx\\\t\t\t\n") == 2);
}

TEST_CASE("DeviceCatalog: XML form")
{
	auto catalog = sampleCatalog();
	DeviceCatalogXmlBuilder builder;
	const string xml = builder.setCatalog(catalog).build();

	SECTION("document layout") {
		pugi::xml_document doc;
		REQUIRE(doc.load_string(xml.c_str()));
		auto root = doc.child("deviceCatalog");
		REQUIRE(root);

		auto bus = root.child("buses").child("bus");
		CHECK(string(bus.attribute("name").value()) == "PCI");
		CHECK(string(bus.next_sibling("bus").attribute("name").value()) == "usb-bus");

		auto network = root.find_child_by_attribute("class", "name", "Network devices");
		REQUIRE(network);
		auto e1000 = network.child("device");
		CHECK(string(e1000.attribute("name").value()) == "e1000");
		CHECK(string(e1000.attribute("bus").value()) == "PCI");
		CHECK(string(e1000.attribute("alias").value()) == "e1000-82540em");
		CHECK(string(e1000.attribute("desc").value()) == "Intel Gigabit Ethernet");

		auto kbd = root.find_child_by_attribute("class", "name", "USB devices").child("device");
		CHECK_FALSE(kbd.attribute("alias"));
		CHECK_FALSE(kbd.attribute("desc"));
	}
	SECTION("read back") {
		CHECK(DeviceCatalog::fromXml(xml) == catalog);
	}
	SECTION("repeated builds are identical") {
		CHECK(builder.build() == xml);
	}
	SECTION("rejected documents") {
		CHECK_THROWS_AS(DeviceCatalog::fromXml("<deviceCatalog>"), ParseError);
		CHECK_THROWS_AS(DeviceCatalog::fromXml("<catalog/>"), ParseError);
		CHECK_THROWS_AS(DeviceCatalog::fromXml("<deviceCatalog><class/></deviceCatalog>"), ParseError);
		CHECK_THROWS_AS(DeviceCatalog::fromXml(
			"<deviceCatalog><class name=\"A\"><device bus=\"PCI\"/></class></deviceCatalog>"), ParseError);
	}
}
