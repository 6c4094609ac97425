#ifndef LIBAPK_AXML_H
#define LIBAPK_AXML_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <pugixml.hpp>

#include "chunk.hpp"
#include "errors.hpp"

/**
 * @file axml.hpp
 * @brief Decoder for compiled ("binary") XML documents such as
 *        AndroidManifest.xml.
 *
 * The document is a RES_XML_TYPE chunk containing a string pool, an
 * optional resource map, and a flat sequence of namespace and element
 * start/end chunks. The decoder replays that sequence into an XmlNode tree.
 *
 * ### Decode a manifest
 * @code
 * std::vector<uint8_t> bytes = archive.read(*archive.find("AndroidManifest.xml"));
 * libapk::XmlDocument doc = libapk::parseBinaryXml(bytes.data(), bytes.size());
 * std::cout << doc.root.tag << std::endl;   // "manifest"
 * @endcode
 *
 * ### Print it as text XML
 * @code
 * std::cout << libapk::toXmlString(doc, true);
 * @endcode
 */
namespace libapk {

/// Namespace URI of framework attributes ("android:").
constexpr std::string_view kAndroidNamespace = "http://schemas.android.com/apk/res/android";

/**
 * @struct XmlNamespace
 * @brief A namespace declaration (xmlns:prefix="uri").
 */
struct XmlNamespace {
    std::string prefix;
    std::string uri;
};

/**
 * @struct XmlAttribute
 * @brief One attribute of an element.
 *
 * @c value keeps the typed encoding; @c text is its resolved textual form
 * (the pooled string for string values, the formatted number, "@0x..." for
 * references, ...).
 */
struct XmlAttribute {
    std::string namespaceUri;
    std::string name;
    uint32_t resourceId = 0;  ///< framework attribute id from the resource map, or 0
    std::string rawValue;     ///< original string if the compiler kept one
    TypedValue value;
    std::string text;

    bool isAndroid() const noexcept { return namespaceUri == kAndroidNamespace; }
};

/**
 * @struct XmlNode
 * @brief An element with its attributes and children, in declaration order.
 *
 * Children are owned by value; a tree is owned exclusively by the
 * XmlDocument it belongs to.
 */
struct XmlNode {
    std::string tag;
    std::string namespaceUri;
    std::vector<XmlNamespace> namespaces;  ///< declared on this element
    std::vector<XmlAttribute> attributes;
    std::vector<XmlNode> children;
    std::string text;  ///< concatenated character data
    uint32_t lineNumber = 0;

    /**
     * @brief Find an attribute by name.
     *
     * When @p resource_id is non-zero an attribute carrying that framework
     * id matches even if its pooled name was stripped.
     */
    const XmlAttribute* findAttribute(std::string_view name, uint32_t resource_id = 0) const;

    /// First direct child with the given tag, or nullptr.
    const XmlNode* findChild(std::string_view tag) const;

    /// All direct children with the given tag, in order.
    std::vector<const XmlNode*> findChildren(std::string_view tag) const;
};

/**
 * @struct XmlDocument
 * @brief Result of decoding a binary XML stream.
 */
struct XmlDocument {
    XmlNode root;
    std::vector<std::string> diagnostics;  ///< non-fatal oddities seen while decoding
};

/**
 * @struct ParseOptions
 * @brief Options shared by the binary XML and resource table decoders.
 */
struct ParseOptions {
    /**
     * @brief Optional callback for non-fatal diagnostics (skipped chunks,
     *        mismatched end tags).
     *
     * Default: nullptr (diagnostics are only collected in the result)
     */
    WarningCallback warning_callback = nullptr;
};

/**
 * @class BinaryXmlParser
 * @brief Replays the chunk stream of a binary XML document into a tree.
 *
 * Interior chunks are dispatched by type through a fixed handler table.
 * Unknown chunk types are skipped by their declared size.
 *
 * A parser instance holds the state of one decode and is not reusable;
 * use parseBinaryXml() for the common case.
 */
class BinaryXmlParser {
   public:
    /// Deepest element nesting accepted before the document is rejected.
    static constexpr size_t kMaxDepth = 4096;

    explicit BinaryXmlParser(const ParseOptions& options = {});

    /**
     * @brief Decode @p size bytes at @p data.
     *
     * The input is never modified.
     *
     * @throws FormatError if the first chunk is not an XML chunk, a chunk
     *         header is malformed, a second string pool appears, a pool
     *         index is out of range, a namespace/element end has no start,
     *         the document has no or several root elements, or elements
     *         nest deeper than kMaxDepth
     * @throws TruncatedInputError if the stream ends inside a chunk or
     *         with open namespace/element scopes
     */
    XmlDocument parse(const uint8_t* data, size_t size);

   private:
    using Handler = void (BinaryXmlParser::*)(const Chunk&);
    struct HandlerEntry {
        ChunkType type;
        Handler handler;
    };
    static const HandlerEntry kHandlers[];

    void handleStringPool(const Chunk& chunk);
    void handleResourceMap(const Chunk& chunk);
    void handleStartNamespace(const Chunk& chunk);
    void handleEndNamespace(const Chunk& chunk);
    void handleStartElement(const Chunk& chunk);
    void handleEndElement(const Chunk& chunk);
    void handleCdata(const Chunk& chunk);

    void warn(const std::string& message);
    const StringPool& pool() const;
    std::string attributeName(uint32_t index, uint32_t* resource_id) const;

    ParseOptions mOptions;
    XmlDocument mDocument;
    StringPool mPool;
    bool mHasPool = false;
    std::vector<uint32_t> mResourceMap;
    std::vector<XmlNamespace> mNamespaces;
    std::vector<XmlNamespace> mPendingNamespaces;
    std::vector<XmlNode> mOpen;
    bool mHasRoot = false;
};

/**
 * @brief Decode a binary XML document.
 * @see BinaryXmlParser::parse
 */
XmlDocument parseBinaryXml(const uint8_t* data, size_t size, const ParseOptions& options = {});

/**
 * @brief Name of a well-known framework attribute id (0x0101xxxx), or an
 *        empty view when the id is not in the built-in table.
 */
std::string_view frameworkAttributeName(uint32_t resource_id);

/**
 * @brief Append @p node (recursively) as a child of @p parent.
 *
 * Attributes in a declared namespace get the declared prefix; namespace
 * declarations become xmlns attributes.
 */
void appendToXml(const XmlNode& node, pugi::xml_node parent);

/**
 * @brief Render a decoded document as text XML.
 *
 * @param doc Decoded document
 * @param pretty_print Indent nested elements with two spaces
 */
std::string toXmlString(const XmlDocument& doc, bool pretty_print = true);

}  // namespace libapk

#endif  // LIBAPK_AXML_H
