#include <catch2/catch.hpp>
#include "Virtualization/catalog/DevicePropertiesExtractor.hpp"
#include "Utils/Exception.hpp"
#include <string>
#include <vector>

using namespace QEMUKIT;
using Properties = std::vector<DevicePropertiesExtractor::Property>;

static Properties extract(std::string_view line)
{
	return DevicePropertiesExtractor(line).run();
}

TEST_CASE("DevicePropertiesExtractor")
{
	SECTION("quoted and bare values") {
		CHECK(extract(R"(name "usb-kbd", bus usb-bus)") ==
		      Properties{{"name", "usb-kbd"}, {"bus", "usb-bus"}});
		CHECK(extract(R"(name "e1000", bus PCI, alias "e1000-82540em", desc "Intel Gigabit Ethernet")") ==
		      Properties{{"name", "e1000"}, {"bus", "PCI"},
		                 {"alias", "e1000-82540em"}, {"desc", "Intel Gigabit Ethernet"}});
	}
	SECTION("commas inside quotes") {
		CHECK(extract(R"(name "virtio-net-pci", desc "Virtio, network, card")") ==
		      Properties{{"name", "virtio-net-pci"}, {"desc", "Virtio, network, card"}});
	}
	SECTION("whitespace") {
		CHECK(extract(R"(name  "a" ,  bus PCI  )") ==
		      Properties{{"name", "a"}, {"bus", "PCI"}});
		CHECK(extract(R"(name "")") == Properties{{"name", ""}});
		CHECK(extract("").empty());
		CHECK(extract("   ").empty());
	}
	SECTION("order is kept") {
		auto props = extract(R"(desc "d", name "n", bus b)");
		REQUIRE(props.size() == 3);
		CHECK(props[0].first == "desc");
		CHECK(props[1].first == "name");
		CHECK(props[2].first == "bus");
	}
	SECTION("malformed") {
		CHECK_THROWS_AS(extract("name"), ParseError);
		CHECK_THROWS_AS(extract("name "), ParseError);
		CHECK_THROWS_AS(extract("name , bus PCI"), ParseError);
		CHECK_THROWS_AS(extract(R"(name "usb-kbd)"), ParseError);
		CHECK_THROWS_AS(extract(R"(name "usb-kbd"x, bus PCI)"), ParseError);
		CHECK_THROWS_AS(extract(R"(name "a",, bus PCI)"), ParseError);
		CHECK_THROWS_AS(extract(R"(name,bus PCI)"), ParseError);
	}
	SECTION("reusable") {
		DevicePropertiesExtractor extractor(R"(name "a", bus b)");
		auto first = extractor.run();
		CHECK(extractor.run() == first);
	}
}
