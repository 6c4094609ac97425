#include "apk.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <utility>

#include "resolver.hpp"
#include "zip.hpp"

namespace libapk {

namespace {

constexpr uint32_t kAttrLabel = 0x01010001;
constexpr uint32_t kAttrIcon = 0x01010002;
constexpr uint32_t kAttrName = 0x01010003;
constexpr uint32_t kAttrProtectionLevel = 0x01010009;
constexpr uint32_t kAttrMinSdkVersion = 0x0101020c;
constexpr uint32_t kAttrVersionCode = 0x0101021b;
constexpr uint32_t kAttrVersionName = 0x0101021c;
constexpr uint32_t kAttrTargetSdkVersion = 0x01010270;
constexpr uint32_t kAttrRoundIcon = 0x0101052c;

bool startsWith(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parseInteger(const std::string &text, int64_t *out) {
  if (text.empty()) {
    return false;
  }
  errno = 0;
  char *end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return false;
  }
  *out = value;
  return true;
}

// Integer attributes are usually compiled to typed ints, but a literal
// string survives when the value was not recognised as a number.
int64_t integerAttribute(const XmlAttribute *attr, bool as_unsigned) {
  if (attr == nullptr) {
    return 0;
  }
  if (attr->value.isInteger()) {
    return as_unsigned ? static_cast<int64_t>(attr->value.data)
                       : static_cast<int64_t>(
                             static_cast<int32_t>(attr->value.data));
  }
  int64_t value = 0;
  return parseInteger(attr->text, &value) ? value : 0;
}

std::string textAttribute(const XmlAttribute *attr) {
  return attr == nullptr ? std::string() : attr->text;
}

std::string protectionLevelName(const XmlAttribute *attr) {
  if (attr == nullptr) {
    return std::string();
  }
  if (!attr->value.isInteger()) {
    return attr->text;
  }
  static const char *kBaseLevels[] = {"normal", "dangerous", "signature",
                                      "signatureOrSystem"};
  const uint32_t base = attr->value.data & 0xF;
  if (base < 4 && (attr->value.data & ~0xFu) == 0) {
    return kBaseLevels[base];
  }
  return attr->text;
}

void warn(const ExtractOptions &options, const std::string &category,
          const std::string &message) {
  if (options.warning_callback) {
    options.warning_callback(category, message);
  }
}

// ============================================================================
// BEST-EFFORT STEPS
// ============================================================================

Result<std::string> contentDigest(const std::string &path) {
  try {
    return Result<std::string>::success(md5File(path));
  } catch (const IOError &e) {
    return Result<std::string>::failure(e.what());
  }
}

Result<ResourceTable> loadResourceTable(const ZipArchive &archive,
                                        const ExtractOptions &options) {
  const ZipEntry *entry = archive.find(kResourceTableEntry);
  if (entry == nullptr) {
    return Result<ResourceTable>::failure("archive has no resources.arsc");
  }
  ParseOptions parse_options;
  parse_options.warning_callback = options.warning_callback;
  try {
    std::vector<uint8_t> bytes = archive.read(*entry);
    return Result<ResourceTable>::success(
        ResourceTable::decode(bytes.data(), bytes.size(), parse_options));
  } catch (const FormatError &e) {
    return Result<ResourceTable>::failure(e.what());
  } catch (const TruncatedInputError &e) {
    return Result<ResourceTable>::failure(e.what());
  } catch (const IOError &e) {
    return Result<ResourceTable>::failure(e.what());
  }
}

Result<std::string> resolveLabel(const ManifestFields &fields,
                                 const ResourceTable *table,
                                 const Configuration &request) {
  if (fields.label_id == 0) {
    return Result<std::string>::success(fields.label);
  }
  if (table == nullptr) {
    return Result<std::string>::failure(
        "label " + formatResourceId(fields.label_id) +
        " is a resource but no resource table is available");
  }
  try {
    return Result<std::string>::success(
        ResourceResolver(*table).resolveString(fields.label_id, request));
  } catch (const ResourceError &e) {
    return Result<std::string>::failure(e.what());
  }
}

Result<Icon> loadIcon(const ZipArchive &archive, const ManifestFields &fields,
                      const ResourceTable *table, uint16_t density) {
  if (fields.icon_id == 0) {
    return Result<Icon>::failure("manifest declares no icon");
  }
  if (table == nullptr) {
    return Result<Icon>::failure("icon " + formatResourceId(fields.icon_id) +
                                 " cannot be resolved without a resource table");
  }

  try {
    Icon icon;
    icon.path = ResourceResolver(*table)
                    .resolveString(fields.icon_id,
                                   Configuration::withDensity(density));
    const ZipEntry *entry = archive.find(icon.path);
    if (entry == nullptr) {
      return Result<Icon>::failure("icon entry " + icon.path +
                                   " is missing from the archive");
    }
    icon.bytes = archive.read(*entry);
    if (!isPng(icon.bytes.data(), icon.bytes.size())) {
      return Result<Icon>::failure("icon " + icon.path +
                                   " is not a PNG image");
    }
    icon.image = decodePng(icon.bytes.data(), icon.bytes.size());
    return Result<Icon>::success(std::move(icon));
  } catch (const ResourceError &e) {
    return Result<Icon>::failure(e.what());
  } catch (const FormatError &e) {
    return Result<Icon>::failure(e.what());
  } catch (const IOError &e) {
    return Result<Icon>::failure(e.what());
  }
}

} // namespace

// ============================================================================
// ARCHIVE SCAN
// ============================================================================

ArchiveScan scanArchive(const std::vector<std::string> &entry_names,
                        const ExtractOptions &options) {
  ArchiveScan scan;
  bool has64 = false;
  bool has32 = false;
  for (const std::string &name : entry_names) {
    if (name == kManifestEntry) {
      scan.has_manifest = true;
    } else if (name == kResourceTableEntry) {
      scan.has_resource_table = true;
    }
    if (endsWith(name, ".so")) {
      scan.has_native_code = true;
    }
    for (const std::string &prefix : options.abi64_prefixes) {
      has64 = has64 || startsWith(name, prefix);
    }
    for (const std::string &prefix : options.abi32_prefixes) {
      has32 = has32 || startsWith(name, prefix);
    }
  }

  if (!scan.has_native_code && !has64 && !has32) {
    scan.support_os64 = true;
    scan.support_os32 = true;
  } else {
    scan.support_os64 = has64;
    scan.support_os32 = has32;
  }
  return scan;
}

// ============================================================================
// MANIFEST FIELDS
// ============================================================================

ManifestFields readManifestFields(const XmlNode &root) {
  if (root.tag != "manifest") {
    throw FormatError("Manifest root element is <" + root.tag +
                      ">, expected <manifest>");
  }

  ManifestFields fields;
  fields.package = textAttribute(root.findAttribute("package"));
  fields.version_name =
      textAttribute(root.findAttribute("versionName", kAttrVersionName));

  const int64_t code =
      integerAttribute(root.findAttribute("versionCode", kAttrVersionCode), true);
  const int64_t major =
      integerAttribute(root.findAttribute("versionCodeMajor"), true);
  fields.version_code = static_cast<int64_t>(
      (static_cast<uint64_t>(major) << 32) |
      (static_cast<uint64_t>(code) & 0xFFFFFFFFu));

  if (const XmlNode *sdk = root.findChild("uses-sdk")) {
    fields.min_sdk_version = static_cast<int>(integerAttribute(
        sdk->findAttribute("minSdkVersion", kAttrMinSdkVersion), false));
    fields.target_sdk_version = static_cast<int>(integerAttribute(
        sdk->findAttribute("targetSdkVersion", kAttrTargetSdkVersion), false));
  }

  for (const XmlNode *node : root.findChildren("uses-permission")) {
    fields.uses_permissions.push_back(
        textAttribute(node->findAttribute("name", kAttrName)));
  }
  for (const XmlNode *node : root.findChildren("permission")) {
    DeclaredPermission permission;
    permission.name = textAttribute(node->findAttribute("name", kAttrName));
    permission.protection_level = protectionLevelName(
        node->findAttribute("protectionLevel", kAttrProtectionLevel));
    fields.permissions.push_back(std::move(permission));
  }

  if (const XmlNode *application = root.findChild("application")) {
    if (const XmlAttribute *label =
            application->findAttribute("label", kAttrLabel)) {
      if (label->value.isReference()) {
        fields.label_id = label->value.data;
      } else {
        fields.label = label->text;
      }
    }
    const XmlAttribute *icon = application->findAttribute("icon", kAttrIcon);
    if (icon == nullptr || !icon->value.isReference()) {
      icon = application->findAttribute("roundIcon", kAttrRoundIcon);
    }
    if (icon != nullptr && icon->value.isReference()) {
      fields.icon_id = icon->value.data;
    }
  }
  return fields;
}

Configuration localeConfiguration(const std::string &locale) {
  Configuration config;
  if (locale.empty()) {
    return config;
  }

  auto isLetters = [](const std::string &s) {
    for (char c : s) {
      if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))) {
        return false;
      }
    }
    return true;
  };

  std::string language = locale;
  std::string region;
  const size_t sep = locale.find_first_of("-_");
  if (sep != std::string::npos) {
    language = locale.substr(0, sep);
    region = locale.substr(sep + 1);
    if (region.size() == 3 && region[0] == 'r') {
      region = region.substr(1);
    }
    if (region.size() != 2 || !isLetters(region)) {
      throw FormatError("Invalid region in locale: " + locale);
    }
  }
  if (language.size() < 2 || language.size() > 3 || !isLetters(language)) {
    throw FormatError("Invalid language in locale: " + locale);
  }

  for (char &c : language) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  for (char &c : region) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  config.language = language;
  config.region = region;
  return config;
}

// ============================================================================
// EXTRACTION
// ============================================================================

ApkInfo parseApk(const std::string &path, const ExtractOptions &options,
                 SignatureExtractor *extractor) {
  if (std::filesystem::path(path).extension() != ".apk") {
    throw FormatError("unknown platform: " + path + " is not an .apk file");
  }
  const Configuration label_config = localeConfiguration(options.locale);

  ZipArchive archive(path);

  std::vector<std::string> names;
  names.reserve(archive.entries().size());
  for (const ZipEntry &entry : archive.entries()) {
    names.push_back(entry.name);
  }
  const ArchiveScan scan = scanArchive(names, options);
  if (!scan.has_manifest) {
    throw FormatError(std::string(kManifestEntry) + " not found in " + path);
  }

  ParseOptions parse_options;
  parse_options.warning_callback = options.warning_callback;
  const std::vector<uint8_t> manifest_bytes =
      archive.read(*archive.find(kManifestEntry));
  const XmlDocument manifest = parseBinaryXml(
      manifest_bytes.data(), manifest_bytes.size(), parse_options);
  ManifestFields fields = readManifestFields(manifest.root);

  ApkInfo info;
  info.bundle_id = std::move(fields.package);
  info.version = fields.version_name;
  info.build = fields.version_code;
  info.uses_permissions = fields.uses_permissions;
  info.permissions = fields.permissions;
  info.min_sdk_version = fields.min_sdk_version;
  info.target_sdk_version = fields.target_sdk_version;
  info.support_os64 = scan.support_os64;
  info.support_os32 = scan.support_os32;
  info.size = archive.fileSize();

  Result<std::string> md5 = contentDigest(path);
  if (md5) {
    info.md5 = md5.value();
  } else {
    warn(options, "md5", md5.error());
  }

  std::unique_ptr<KeytoolSignatureExtractor> keytool;
  if (extractor == nullptr && !options.keytool_path.empty()) {
    keytool = std::make_unique<KeytoolSignatureExtractor>(options.keytool_path,
                                                          options.tool_timeout);
    extractor = keytool.get();
  }
  if (extractor != nullptr) {
    Result<SignatureDigests> digests = extractor->extractDigests(path);
    if (digests) {
      info.signature_md5 = digests.value().md5;
      info.signature_sha1 = digests.value().sha1;
      info.signature_sha256 = digests.value().sha256;
    } else {
      warn(options, "signature", digests.error());
    }
  }

  std::optional<ResourceTable> table;
  if (scan.has_resource_table) {
    Result<ResourceTable> loaded = loadResourceTable(archive, options);
    if (loaded) {
      table = std::move(loaded.value());
    } else {
      warn(options, "resources", loaded.error());
    }
  }
  const ResourceTable *table_ptr = table ? &*table : nullptr;

  Result<std::string> label = resolveLabel(fields, table_ptr, label_config);
  if (label) {
    info.name = label.value();
  } else {
    warn(options, "label", label.error());
    info.name = fields.label;
  }

  if (options.decode_icon) {
    Result<Icon> icon =
        loadIcon(archive, fields, table_ptr, options.icon_density);
    if (icon) {
      info.icon = std::move(icon.value());
    } else {
      warn(options, "icon", icon.error());
    }
  }
  return info;
}

} // namespace libapk
