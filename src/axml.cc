#include "axml.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace libapk {

// ============================================================================
// FRAMEWORK ATTRIBUTE NAMES
// ============================================================================

namespace {

struct FrameworkAttribute {
  uint32_t id;
  const char *name;
};

// Sorted by id. Release builds strip attribute names from the string pool
// and leave only the resource map, so the names are recovered from here.
const FrameworkAttribute kFrameworkAttributes[] = {
    {0x01010000, "theme"},
    {0x01010001, "label"},
    {0x01010002, "icon"},
    {0x01010003, "name"},
    {0x01010004, "manageSpaceActivity"},
    {0x01010005, "allowClearUserData"},
    {0x01010006, "permission"},
    {0x01010007, "readPermission"},
    {0x01010008, "writePermission"},
    {0x01010009, "protectionLevel"},
    {0x0101000a, "permissionGroup"},
    {0x0101000b, "sharedUserId"},
    {0x0101000c, "hasCode"},
    {0x0101000d, "persistent"},
    {0x0101000e, "enabled"},
    {0x0101000f, "debuggable"},
    {0x01010010, "exported"},
    {0x01010011, "process"},
    {0x01010012, "taskAffinity"},
    {0x01010013, "multiprocess"},
    {0x01010014, "finishOnTaskLaunch"},
    {0x01010015, "clearTaskOnLaunch"},
    {0x01010016, "stateNotNeeded"},
    {0x01010017, "excludeFromRecents"},
    {0x01010018, "authorities"},
    {0x01010019, "syncable"},
    {0x0101001a, "initOrder"},
    {0x0101001b, "grantUriPermissions"},
    {0x0101001c, "priority"},
    {0x0101001d, "launchMode"},
    {0x0101001e, "screenOrientation"},
    {0x0101001f, "configChanges"},
    {0x01010020, "description"},
    {0x01010021, "targetPackage"},
    {0x01010022, "handleProfiling"},
    {0x01010023, "functionalTest"},
    {0x01010024, "value"},
    {0x01010025, "resource"},
    {0x01010026, "mimeType"},
    {0x01010027, "scheme"},
    {0x01010028, "host"},
    {0x01010029, "port"},
    {0x0101002a, "path"},
    {0x0101002b, "pathPrefix"},
    {0x0101002c, "pathPattern"},
    {0x0101002d, "action"},
    {0x0101002e, "data"},
    {0x0101002f, "targetClass"},
    {0x0101020c, "minSdkVersion"},
    {0x0101021b, "versionCode"},
    {0x0101021c, "versionName"},
    {0x01010270, "targetSdkVersion"},
    {0x01010271, "maxSdkVersion"},
    {0x010102b7, "installLocation"},
    {0x0101052c, "roundIcon"},
    {0x01010572, "compileSdkVersion"},
    {0x01010573, "compileSdkVersionCodename"},
};

} // namespace

std::string_view frameworkAttributeName(uint32_t resource_id) {
  auto it = std::lower_bound(
      std::begin(kFrameworkAttributes), std::end(kFrameworkAttributes),
      resource_id,
      [](const FrameworkAttribute &a, uint32_t id) { return a.id < id; });
  if (it == std::end(kFrameworkAttributes) || it->id != resource_id) {
    return std::string_view();
  }
  return it->name;
}

// ============================================================================
// XML NODE
// ============================================================================

const XmlAttribute *XmlNode::findAttribute(std::string_view name,
                                           uint32_t resource_id) const {
  for (const XmlAttribute &attr : attributes) {
    if (resource_id != 0 && attr.resourceId == resource_id) {
      return &attr;
    }
    if (attr.name == name) {
      return &attr;
    }
  }
  return nullptr;
}

const XmlNode *XmlNode::findChild(std::string_view tag) const {
  for (const XmlNode &child : children) {
    if (child.tag == tag) {
      return &child;
    }
  }
  return nullptr;
}

std::vector<const XmlNode *> XmlNode::findChildren(std::string_view tag) const {
  std::vector<const XmlNode *> found;
  for (const XmlNode &child : children) {
    if (child.tag == tag) {
      found.push_back(&child);
    }
  }
  return found;
}

// ============================================================================
// BINARY XML PARSER
// ============================================================================

const BinaryXmlParser::HandlerEntry BinaryXmlParser::kHandlers[] = {
    {ChunkType::StringPool, &BinaryXmlParser::handleStringPool},
    {ChunkType::XmlResourceMap, &BinaryXmlParser::handleResourceMap},
    {ChunkType::XmlStartNamespace, &BinaryXmlParser::handleStartNamespace},
    {ChunkType::XmlEndNamespace, &BinaryXmlParser::handleEndNamespace},
    {ChunkType::XmlStartElement, &BinaryXmlParser::handleStartElement},
    {ChunkType::XmlEndElement, &BinaryXmlParser::handleEndElement},
    {ChunkType::XmlCdata, &BinaryXmlParser::handleCdata},
};

BinaryXmlParser::BinaryXmlParser(const ParseOptions &options)
    : mOptions(options) {}

XmlDocument BinaryXmlParser::parse(const uint8_t *data, size_t size) {
  Chunk document = readChunk(data, size);
  if (document.type() != ChunkType::Xml) {
    std::ostringstream ss;
    ss << "Not a binary XML document: first chunk type is 0x" << std::hex
       << document.header.type;
    throw FormatError(ss.str());
  }
  if (document.header.size < size) {
    warn("Ignoring " + std::to_string(size - document.header.size) +
         " trailing bytes after the document chunk");
  }

  ChunkIterator iter(data + document.header.headerSize,
                     document.header.size - document.header.headerSize,
                     document.header.headerSize);
  while (iter.hasNext()) {
    Chunk chunk = iter.next();

    Handler handler = nullptr;
    for (const HandlerEntry &entry : kHandlers) {
      if (entry.type == chunk.type()) {
        handler = entry.handler;
        break;
      }
    }

    if (handler == nullptr) {
      std::ostringstream ss;
      ss << "Skipping unknown chunk type 0x" << std::hex << chunk.header.type
         << std::dec << " (" << chunk.header.size << " bytes) at offset "
         << chunk.offset;
      warn(ss.str());
      continue;
    }
    (this->*handler)(chunk);
  }

  if (!mOpen.empty()) {
    throw TruncatedInputError("Document ended with " +
                              std::to_string(mOpen.size()) +
                              " unclosed element(s), innermost <" +
                              mOpen.back().tag + ">");
  }
  if (!mNamespaces.empty()) {
    throw TruncatedInputError("Document ended with " +
                              std::to_string(mNamespaces.size()) +
                              " unclosed namespace scope(s)");
  }
  if (!mHasRoot) {
    throw FormatError("Document has no root element");
  }
  return std::move(mDocument);
}

void BinaryXmlParser::warn(const std::string &message) {
  mDocument.diagnostics.push_back(message);
  if (mOptions.warning_callback) {
    mOptions.warning_callback("xml", message);
  }
}

const StringPool &BinaryXmlParser::pool() const {
  if (!mHasPool) {
    throw FormatError("Element data appears before the string pool");
  }
  return mPool;
}

std::string BinaryXmlParser::attributeName(uint32_t index,
                                           uint32_t *resource_id) const {
  *resource_id = index < mResourceMap.size() ? mResourceMap[index] : 0;
  std::string name = pool().at(index);
  if (name.empty() && *resource_id != 0) {
    std::string_view known = frameworkAttributeName(*resource_id);
    name = known.empty() ? formatResourceId(*resource_id) : std::string(known);
  }
  return name;
}

void BinaryXmlParser::handleStringPool(const Chunk &chunk) {
  if (mHasPool) {
    throw FormatError("Second string pool at offset " +
                      std::to_string(chunk.offset));
  }
  mPool = StringPool::decode(chunk);
  mHasPool = true;
}

void BinaryXmlParser::handleResourceMap(const Chunk &chunk) {
  ByteReader in = chunk.body();
  mResourceMap.clear();
  mResourceMap.reserve(in.size() / 4);
  while (in.remaining() >= 4) {
    mResourceMap.push_back(in.readInt());
  }
}

void BinaryXmlParser::handleStartNamespace(const Chunk &chunk) {
  ByteReader in = chunk.body();
  const uint32_t prefix = in.readInt();
  const uint32_t uri = in.readInt();

  XmlNamespace ns;
  ns.prefix = prefix == kNoIndex ? std::string() : pool().at(prefix);
  ns.uri = pool().at(uri);
  mNamespaces.push_back(ns);
  mPendingNamespaces.push_back(std::move(ns));
}

void BinaryXmlParser::handleEndNamespace(const Chunk &chunk) {
  if (mNamespaces.empty()) {
    throw FormatError("Namespace end without matching start at offset " +
                      std::to_string(chunk.offset));
  }
  mNamespaces.pop_back();
}

void BinaryXmlParser::handleStartElement(const Chunk &chunk) {
  if (mOpen.empty() && mHasRoot) {
    throw FormatError("Second root element at offset " +
                      std::to_string(chunk.offset));
  }
  if (mOpen.size() >= kMaxDepth) {
    throw FormatError("Element nesting exceeds " + std::to_string(kMaxDepth) +
                      " levels at offset " + std::to_string(chunk.offset));
  }

  ByteReader header = chunk.headerReader();
  ByteReader in = chunk.body();
  const uint32_t ns = in.readInt();
  const uint32_t name = in.readInt();
  const uint16_t attribute_start = in.readShort();
  const uint16_t attribute_size = in.readShort();
  const uint16_t attribute_count = in.readShort();

  XmlNode node;
  node.lineNumber = header.remaining() >= 4 ? header.readInt() : 0;
  node.tag = pool().at(name);
  node.namespaceUri = ns == kNoIndex ? std::string() : pool().at(ns);
  node.namespaces = std::move(mPendingNamespaces);
  mPendingNamespaces.clear();

  if (attribute_count > 0 && attribute_size < 12 + TypedValue::kSize) {
    throw FormatError("Attribute size " + std::to_string(attribute_size) +
                      " is too small in element <" + node.tag + ">");
  }

  node.attributes.reserve(attribute_count);
  for (uint16_t i = 0; i < attribute_count; ++i) {
    ByteReader attr_in =
        in.slice(attribute_start + static_cast<size_t>(i) * attribute_size,
                 attribute_size);
    const uint32_t attr_ns = attr_in.readInt();
    const uint32_t attr_name = attr_in.readInt();
    const uint32_t raw_value = attr_in.readInt();

    XmlAttribute attr;
    attr.namespaceUri = attr_ns == kNoIndex ? std::string() : pool().at(attr_ns);
    attr.name = attributeName(attr_name, &attr.resourceId);
    if (raw_value != kNoIndex) {
      attr.rawValue = pool().at(raw_value);
    }
    attr.value = TypedValue::read(attr_in);

    if (attr.value.isString()) {
      attr.text = pool().at(attr.value.data);
    } else if (attr.value.isNull() && raw_value != kNoIndex) {
      attr.text = attr.rawValue;
    } else {
      attr.text = attr.value.format(&mPool);
    }
    node.attributes.push_back(std::move(attr));
  }

  mOpen.push_back(std::move(node));
}

void BinaryXmlParser::handleEndElement(const Chunk &chunk) {
  if (mOpen.empty()) {
    throw FormatError("Element end without matching start at offset " +
                      std::to_string(chunk.offset));
  }

  ByteReader in = chunk.body();
  /* ns */ in.readInt();
  const uint32_t name = in.readInt();

  XmlNode node = std::move(mOpen.back());
  mOpen.pop_back();

  const std::string end_name = mPool.get(name);
  if (end_name != node.tag) {
    warn("End tag </" + end_name + "> does not match <" + node.tag + ">");
  }

  if (mOpen.empty()) {
    mDocument.root = std::move(node);
    mHasRoot = true;
  } else {
    mOpen.back().children.push_back(std::move(node));
  }
}

void BinaryXmlParser::handleCdata(const Chunk &chunk) {
  ByteReader in = chunk.body();
  const uint32_t data = in.readInt();
  const std::string &text = pool().at(data);

  if (mOpen.empty()) {
    warn("Character data outside of any element at offset " +
         std::to_string(chunk.offset));
    return;
  }
  mOpen.back().text += text;
}

XmlDocument parseBinaryXml(const uint8_t *data, size_t size,
                           const ParseOptions &options) {
  BinaryXmlParser parser(options);
  return parser.parse(data, size);
}

// ============================================================================
// TEXT XML RENDERING
// ============================================================================

namespace {

std::string prefixFor(const std::vector<XmlNamespace> &scope,
                      const std::string &uri) {
  for (auto it = scope.rbegin(); it != scope.rend(); ++it) {
    if (it->uri == uri) {
      return it->prefix;
    }
  }
  return std::string();
}

std::string qualify(const std::vector<XmlNamespace> &scope,
                    const std::string &uri, const std::string &name) {
  if (uri.empty()) {
    return name;
  }
  std::string prefix = prefixFor(scope, uri);
  return prefix.empty() ? name : prefix + ":" + name;
}

void appendNode(const XmlNode &node, pugi::xml_node parent,
                std::vector<XmlNamespace> &scope) {
  const size_t scope_size = scope.size();
  scope.insert(scope.end(), node.namespaces.begin(), node.namespaces.end());

  pugi::xml_node element =
      parent.append_child(qualify(scope, node.namespaceUri, node.tag).c_str());

  for (const XmlNamespace &ns : node.namespaces) {
    std::string decl = ns.prefix.empty() ? "xmlns" : "xmlns:" + ns.prefix;
    element.append_attribute(decl.c_str()).set_value(ns.uri.c_str());
  }
  for (const XmlAttribute &attr : node.attributes) {
    std::string name = qualify(scope, attr.namespaceUri, attr.name);
    element.append_attribute(name.c_str()).set_value(attr.text.c_str());
  }
  if (!node.text.empty()) {
    element.append_child(pugi::node_pcdata).set_value(node.text.c_str());
  }
  for (const XmlNode &child : node.children) {
    appendNode(child, element, scope);
  }

  scope.resize(scope_size);
}

} // namespace

void appendToXml(const XmlNode &node, pugi::xml_node parent) {
  std::vector<XmlNamespace> scope;
  appendNode(node, parent, scope);
}

std::string toXmlString(const XmlDocument &doc, bool pretty_print) {
  pugi::xml_document xml;
  pugi::xml_node decl = xml.append_child(pugi::node_declaration);
  decl.append_attribute("version") = "1.0";
  decl.append_attribute("encoding") = "utf-8";
  appendToXml(doc.root, xml);

  std::ostringstream out;
  if (pretty_print) {
    xml.save(out, "  ", pugi::format_default | pugi::format_indent);
  } else {
    xml.save(out, "", pugi::format_raw);
  }
  return out.str();
}

} // namespace libapk
