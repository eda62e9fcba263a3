#pragma once

#include <pugixml.hpp>
#include <cstddef>
#include <string>

namespace QEMUKIT {

/**
 * @brief Abstract base class for building XML documents
 *
 * Provides common interface and functionality for XML document construction.
 * Derived classes must implement the specific document structure.
 */
class IXmlBuilderBase {
protected:
    pugi::xml_document doc;     ///< Underlying XML document

    /**
     * @brief Constructs the XML document structure
     *
     * Pure virtual function that derived classes must implement
     * to define the specific XML structure. Called on an empty document.
     */
    virtual void buildDocument() = 0;

public:
    IXmlBuilderBase() = default;

    // Non-copyable
    IXmlBuilderBase(const IXmlBuilderBase&) = delete;
    IXmlBuilderBase& operator=(const IXmlBuilderBase&) = delete;

    // Movable
    IXmlBuilderBase(IXmlBuilderBase&&) noexcept = default;
    IXmlBuilderBase& operator=(IXmlBuilderBase&&) noexcept = default;

    /**
     * @brief Builds and returns the formatted XML document
     *
     * The document is rebuilt from scratch on every call, so repeated
     * calls yield identical output.
     *
     * @return std::string Formatted XML content
     */
    [[nodiscard]] std::string build() {
        doc.reset();
        buildDocument(); // Delegate to derived implementation

        struct xml_string_writer : pugi::xml_writer {
            std::string result;
            void write(const void* data, std::size_t size) override {
                result.append(static_cast<const char*>(data), size);
            }
        };

        xml_string_writer writer;
        doc.save(writer, "  ", pugi::format_default | pugi::format_indent, pugi::encoding_utf8);
        return writer.result;
    }

    virtual ~IXmlBuilderBase() = default;
};

} // namespace QEMUKIT
