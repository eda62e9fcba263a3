#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/catalog/DeviceCatalog.hpp"
#include <string>

namespace QEMUKIT {

/**
 * @brief Builder for the XML form of a device catalog
 *
 * @code
 * <deviceCatalog>
 *   <buses>
 *     <bus name="PCI" />
 *   </buses>
 *   <class name="Network devices">
 *     <device name="e1000" bus="PCI" alias="e1000-82540em" desc="Intel Gigabit Ethernet" />
 *   </class>
 * </deviceCatalog>
 * @endcode
 * Absent optional values are left out. DeviceCatalog::fromXml reads it back.
 */
class DeviceCatalogXmlBuilder : public IXmlBuilderBase {
private:
  DeviceCatalog catalog;

  void buildDocument() override;

  void buildBusesSection();
  void buildClassSections();

public:
  DeviceCatalogXmlBuilder() = default;
  ~DeviceCatalogXmlBuilder() override = default;

  DeviceCatalogXmlBuilder& setCatalog(DeviceCatalog value);

  [[nodiscard]] std::string build() { return IXmlBuilderBase::build(); }
};

} // namespace QEMUKIT
