#include "Virtualization/builder/DeviceCatalogXmlBuilder.hpp"
#include <pugixml.hpp>
#include <utility>

namespace QEMUKIT {

void DeviceCatalogXmlBuilder::buildDocument() {
  doc.append_child("deviceCatalog");
  buildBusesSection();
  buildClassSections();
}

void DeviceCatalogXmlBuilder::buildBusesSection() {
  auto buses = doc.child("deviceCatalog").append_child("buses");
  for (const auto& bus : catalog.buses()) {
    buses.append_child("bus").append_attribute("name") = bus.c_str();
  }
}

void DeviceCatalogXmlBuilder::buildClassSections() {
  auto root = doc.child("deviceCatalog");
  for (const auto& [className, devices] : catalog) {
    auto cls = root.append_child("class");
    cls.append_attribute("name") = className.c_str();

    for (const auto& device : devices) {
      auto node = cls.append_child("device");
      node.append_attribute("name") = device.name.c_str();
      if (device.bus) {
        node.append_attribute("bus") = device.bus->c_str();
      }
      if (device.alias) {
        node.append_attribute("alias") = device.alias->c_str();
      }
      if (device.description) {
        node.append_attribute("desc") = device.description->c_str();
      }
    }
  }
}

DeviceCatalogXmlBuilder& DeviceCatalogXmlBuilder::setCatalog(DeviceCatalog value) {
  this->catalog = std::move(value);
  return *this;
}

} // namespace QEMUKIT
