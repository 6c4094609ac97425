#include "arsc.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <tuple>
#include <utility>

#include <boost/locale/encoding_utf.hpp>

namespace libapk {

// ============================================================================
// CONFIGURATION
// ============================================================================

namespace {

// Fields of ResTable_config that are decoded, by byte offset.
constexpr size_t kConfigModelledSize = 36;

uint16_t u16At(const uint8_t *p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

// Two ASCII characters, or three 5-bit letters packed into two bytes when
// the high bit of the first byte is set.
std::string unpackLanguageOrRegion(const uint8_t in[2], char base) {
  if (in[0] & 0x80) {
    const uint8_t first = in[1] & 0x1f;
    const uint8_t second = ((in[1] & 0xe0) >> 5) + ((in[0] & 0x03) << 3);
    const uint8_t third = (in[0] & 0x7c) >> 2;
    std::string out;
    out += static_cast<char>(first + base);
    out += static_cast<char>(second + base);
    out += static_cast<char>(third + base);
    return out;
  }
  if (in[0] == 0) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(in), 2);
}

std::string densityName(uint16_t density) {
  switch (density) {
  case Configuration::kDensityLow:
    return "ldpi";
  case Configuration::kDensityMedium:
    return "mdpi";
  case Configuration::kDensityTv:
    return "tvdpi";
  case Configuration::kDensityHigh:
    return "hdpi";
  case Configuration::kDensityXHigh:
    return "xhdpi";
  case Configuration::kDensityXXHigh:
    return "xxhdpi";
  case Configuration::kDensityXXXHigh:
    return "xxxhdpi";
  case Configuration::kDensityAny:
    return "anydpi";
  case Configuration::kDensityNone:
    return "nodpi";
  default:
    return std::to_string(density) + "dpi";
  }
}

} // namespace

Configuration Configuration::read(ByteReader &in) {
  const size_t start = in.tell();
  const uint32_t size = in.readInt();
  if (size < 4) {
    throw FormatError("ResTable_config size " + std::to_string(size) +
                      " is too small");
  }
  in.seek(start);
  std::vector<uint8_t> bytes = in.readBytes(size);

  uint8_t raw[kConfigModelledSize] = {};
  std::memcpy(raw, bytes.data(), std::min<size_t>(size, sizeof(raw)));

  Configuration config;
  config.mcc = u16At(raw + 4);
  config.mnc = u16At(raw + 6);
  config.language = unpackLanguageOrRegion(raw + 8, 'a');
  config.region = unpackLanguageOrRegion(raw + 10, '0');
  config.orientation = raw[12];
  config.touchscreen = raw[13];
  config.density = u16At(raw + 14);
  config.keyboard = raw[16];
  config.navigation = raw[17];
  config.inputFlags = raw[18];
  config.screenWidth = u16At(raw + 20);
  config.screenHeight = u16At(raw + 22);
  config.sdkVersion = u16At(raw + 24);
  config.minorVersion = u16At(raw + 26);
  config.screenLayout = raw[28];
  config.uiMode = raw[29];
  config.smallestScreenWidthDp = u16At(raw + 30);
  config.screenWidthDp = u16At(raw + 32);
  config.screenHeightDp = u16At(raw + 34);
  return config;
}

Configuration Configuration::withDensity(uint16_t density) {
  Configuration config;
  config.density = density;
  return config;
}

bool Configuration::isDefault() const { return specificity() == 0; }

int Configuration::specificity() const {
  int count = 0;
  count += mcc != 0;
  count += mnc != 0;
  count += !language.empty();
  count += !region.empty();
  count += orientation != 0;
  count += touchscreen != 0;
  count += density != 0;
  count += keyboard != 0;
  count += navigation != 0;
  count += inputFlags != 0;
  count += (screenWidth != 0 || screenHeight != 0);
  count += sdkVersion != 0;
  count += screenLayout != 0;
  count += uiMode != 0;
  count += smallestScreenWidthDp != 0;
  count += screenWidthDp != 0;
  count += screenHeightDp != 0;
  return count;
}

bool Configuration::matches(const Configuration &request) const {
  if (mcc != 0 && mcc != request.mcc) {
    return false;
  }
  if (mnc != 0 && mnc != request.mnc) {
    return false;
  }
  if (!language.empty() && language != request.language) {
    return false;
  }
  if (!region.empty() && region != request.region) {
    return false;
  }

  auto conflicts = [](uint32_t mine, uint32_t theirs) {
    return mine != 0 && theirs != 0 && mine != theirs;
  };
  if (conflicts(orientation, request.orientation) ||
      conflicts(touchscreen, request.touchscreen) ||
      conflicts(keyboard, request.keyboard) ||
      conflicts(navigation, request.navigation) ||
      conflicts(screenLayout, request.screenLayout) ||
      conflicts(uiMode, request.uiMode)) {
    return false;
  }

  auto exceeds = [](uint32_t mine, uint32_t theirs) {
    return mine != 0 && theirs != 0 && mine > theirs;
  };
  if (exceeds(smallestScreenWidthDp, request.smallestScreenWidthDp) ||
      exceeds(screenWidthDp, request.screenWidthDp) ||
      exceeds(screenHeightDp, request.screenHeightDp) ||
      exceeds(screenWidth, request.screenWidth) ||
      exceeds(screenHeight, request.screenHeight) ||
      exceeds(sdkVersion, request.sdkVersion)) {
    return false;
  }
  return true;
}

int Configuration::compare(const Configuration &other) const {
  auto key = [](const Configuration &c) {
    return std::tie(c.mcc, c.mnc, c.language, c.region, c.orientation,
                    c.touchscreen, c.density, c.keyboard, c.navigation,
                    c.inputFlags, c.screenWidth, c.screenHeight, c.sdkVersion,
                    c.minorVersion, c.screenLayout, c.uiMode,
                    c.smallestScreenWidthDp, c.screenWidthDp,
                    c.screenHeightDp);
  };
  if (key(*this) < key(other)) {
    return -1;
  }
  if (key(other) < key(*this)) {
    return 1;
  }
  return 0;
}

std::string Configuration::toString() const {
  std::vector<std::string> parts;
  if (mcc != 0) {
    parts.push_back("mcc" + std::to_string(mcc));
  }
  if (mnc != 0) {
    parts.push_back("mnc" + std::to_string(mnc));
  }
  if (!language.empty()) {
    parts.push_back(language);
  }
  if (!region.empty()) {
    parts.push_back("r" + region);
  }
  if (smallestScreenWidthDp != 0) {
    parts.push_back("sw" + std::to_string(smallestScreenWidthDp) + "dp");
  }
  if (screenWidthDp != 0) {
    parts.push_back("w" + std::to_string(screenWidthDp) + "dp");
  }
  if (screenHeightDp != 0) {
    parts.push_back("h" + std::to_string(screenHeightDp) + "dp");
  }
  switch (orientation) {
  case kOrientationPort:
    parts.push_back("port");
    break;
  case kOrientationLand:
    parts.push_back("land");
    break;
  case kOrientationSquare:
    parts.push_back("square");
    break;
  default:
    break;
  }
  switch (uiMode & kUiModeNightMask) {
  case kUiModeNightNo:
    parts.push_back("notnight");
    break;
  case kUiModeNightYes:
    parts.push_back("night");
    break;
  default:
    break;
  }
  if (density != 0) {
    parts.push_back(densityName(density));
  }
  if (screenWidth != 0 || screenHeight != 0) {
    parts.push_back(std::to_string(screenWidth) + "x" +
                    std::to_string(screenHeight));
  }
  if (sdkVersion != 0) {
    parts.push_back("v" + std::to_string(sdkVersion));
  }

  if (parts.empty()) {
    return "default";
  }
  std::string out = parts[0];
  for (size_t i = 1; i < parts.size(); ++i) {
    out += "-" + parts[i];
  }
  return out;
}

// ============================================================================
// TABLE DECODER
// ============================================================================

class ResourceTable::Decoder {
public:
  Decoder(ResourceTable &table, const ParseOptions &options)
      : mTable(table), mOptions(options) {}

  void decodeTable(const Chunk &chunk);

private:
  struct PackageState {
    ResourcePackage *package = nullptr;
    StringPool typeStrings;
    StringPool keyStrings;
    uint32_t typeIdOffset = 0;
  };

  void decodePackage(const Chunk &chunk);
  void decodeTypeSpec(const Chunk &chunk, PackageState &state);
  void decodeType(const Chunk &chunk, PackageState &state);
  void decodeLibrary(const Chunk &chunk);
  ResourceEntry decodeEntry(ByteReader &in, const PackageState &state);
  void checkValue(const TypedValue &value) const;
  ResourceType &typeFor(uint8_t id, PackageState &state);
  void warn(const std::string &message);

  ResourceTable &mTable;
  const ParseOptions &mOptions;
  bool mHasValuePool = false;
};

void ResourceTable::Decoder::warn(const std::string &message) {
  if (mOptions.warning_callback) {
    mOptions.warning_callback("arsc", message);
  }
}

void ResourceTable::Decoder::decodeTable(const Chunk &chunk) {
  ByteReader header = chunk.headerReader();
  const uint32_t package_count = header.readInt();

  ByteReader body = chunk.body();
  ChunkIterator iter(body.data(), body.size(), chunk.header.headerSize);
  uint32_t packages_seen = 0;
  while (iter.hasNext()) {
    Chunk child = iter.next();
    switch (child.type()) {
    case ChunkType::StringPool:
      if (mHasValuePool) {
        throw FormatError("Second value string pool at offset " +
                          std::to_string(child.offset));
      }
      mTable.mValueStrings = StringPool::decode(child);
      mHasValuePool = true;
      break;
    case ChunkType::TablePackage:
      decodePackage(child);
      ++packages_seen;
      break;
    default: {
      std::ostringstream ss;
      ss << "Skipping unknown table chunk 0x" << std::hex << child.header.type
         << std::dec << " at offset " << child.offset;
      warn(ss.str());
      break;
    }
    }
  }

  if (packages_seen != package_count) {
    warn("Table declares " + std::to_string(package_count) +
         " package(s) but contains " + std::to_string(packages_seen));
  }
}

void ResourceTable::Decoder::decodePackage(const Chunk &chunk) {
  ByteReader header = chunk.headerReader();
  const uint32_t id = header.readInt();
  std::u16string name;
  for (int i = 0; i < 128; ++i) {
    char16_t c = static_cast<char16_t>(header.readShort());
    if (c == 0) {
      header.skip(static_cast<size_t>(127 - i) * 2);
      break;
    }
    name.push_back(c);
  }
  const uint32_t type_strings = header.readInt();
  /* lastPublicType */ header.readInt();
  const uint32_t key_strings = header.readInt();
  /* lastPublicKey */ header.readInt();

  if (id > 0xFF) {
    throw FormatError("Package id " + std::to_string(id) + " is out of range");
  }

  ResourcePackage &package = mTable.mPackages[static_cast<uint8_t>(id)];
  package.id = id;
  package.name = boost::locale::conv::utf_to_utf<char>(name);

  PackageState state;
  state.package = &package;
  state.typeIdOffset = header.remaining() >= 4 ? header.readInt() : 0;

  ByteReader body = chunk.body();
  ChunkIterator iter(body.data(), body.size(), chunk.header.headerSize);
  size_t pools_seen = 0;
  size_t relative = chunk.header.headerSize;
  while (iter.hasNext()) {
    Chunk child = iter.next();
    const size_t child_offset = relative;
    relative += child.header.size;

    switch (child.type()) {
    case ChunkType::StringPool: {
      // Pools are normally addressed by their offset inside the package;
      // fall back to declaration order (types first) otherwise.
      bool is_types = child_offset == type_strings ||
                      (child_offset != key_strings && pools_seen == 0);
      if (is_types) {
        state.typeStrings = StringPool::decode(child);
      } else {
        state.keyStrings = StringPool::decode(child);
      }
      ++pools_seen;
      break;
    }
    case ChunkType::TableTypeSpec:
      decodeTypeSpec(child, state);
      break;
    case ChunkType::TableType:
      decodeType(child, state);
      break;
    case ChunkType::TableLibrary:
      decodeLibrary(child);
      break;
    default: {
      std::ostringstream ss;
      ss << "Skipping unknown package chunk 0x" << std::hex
         << child.header.type << std::dec << " in package " << package.name;
      warn(ss.str());
      break;
    }
    }
  }
}

ResourceType &ResourceTable::Decoder::typeFor(uint8_t id, PackageState &state) {
  if (id == 0) {
    throw FormatError("Type id 0 in package " + state.package->name);
  }
  ResourceType &type = state.package->types[id];
  if (type.id == 0) {
    type.id = id;
    const uint32_t name_index = static_cast<uint32_t>(id) - 1 - state.typeIdOffset;
    if (!state.typeStrings.contains(name_index)) {
      throw FormatError("Type id " + std::to_string(id) +
                        " has no name in the type string pool");
    }
    type.name = state.typeStrings.at(name_index);
  }
  return type;
}

void ResourceTable::Decoder::decodeTypeSpec(const Chunk &chunk,
                                            PackageState &state) {
  ByteReader header = chunk.headerReader();
  const uint8_t id = header.readByte();
  /* res0 */ header.readByte();
  /* res1 */ header.readShort();
  const uint32_t entry_count = header.readInt();

  ResourceType &type = typeFor(id, state);
  ByteReader body = chunk.body();
  if (entry_count > body.size() / 4) {
    throw FormatError("Type spec " + type.name + " declares " +
                      std::to_string(entry_count) + " entries but holds " +
                      std::to_string(body.size() / 4));
  }
  type.specFlags.clear();
  type.specFlags.reserve(entry_count);
  for (uint32_t i = 0; i < entry_count; ++i) {
    type.specFlags.push_back(body.readInt());
  }
}

void ResourceTable::Decoder::decodeType(const Chunk &chunk,
                                        PackageState &state) {
  constexpr uint8_t kFlagSparse = 0x01;
  constexpr uint8_t kFlagOffset16 = 0x02;
  constexpr uint32_t kNoEntry = 0xFFFFFFFF;
  constexpr uint16_t kNoEntry16 = 0xFFFF;

  ByteReader header = chunk.headerReader();
  const uint8_t id = header.readByte();
  const uint8_t flags = header.readByte();
  /* reserved */ header.readShort();
  const uint32_t entry_count = header.readInt();
  const uint32_t entries_start = header.readInt();
  Configuration config = Configuration::read(header);

  if (entries_start < chunk.header.headerSize ||
      entries_start > chunk.header.size) {
    throw FormatError("Entries start " + std::to_string(entries_start) +
                      " is outside of type chunk at offset " +
                      std::to_string(chunk.offset));
  }

  ResourceType &type = typeFor(id, state);
  ByteReader all = chunk.all();
  ByteReader offsets =
      all.slice(chunk.header.headerSize, entries_start - chunk.header.headerSize);
  ByteReader entries =
      all.slice(entries_start, chunk.header.size - entries_start);

  auto record = [&](uint32_t index, uint32_t offset) {
    if (index > 0xFFFF) {
      throw FormatError("Entry index " + std::to_string(index) +
                        " is out of range in type " + type.name);
    }
    if (offset >= entries.size()) {
      throw FormatError("Entry offset " + std::to_string(offset) +
                        " is outside of type " + type.name);
    }
    entries.seek(offset);
    ConfigValue value;
    value.config = config;
    value.entry = decodeEntry(entries, state);
    type.entries[static_cast<uint16_t>(index)].push_back(std::move(value));
  };

  for (uint32_t i = 0; i < entry_count; ++i) {
    if (flags & kFlagSparse) {
      const uint16_t index = offsets.readShort();
      const uint16_t offset = offsets.readShort();
      record(index, static_cast<uint32_t>(offset) * 4);
    } else if (flags & kFlagOffset16) {
      const uint16_t offset = offsets.readShort();
      if (offset != kNoEntry16) {
        record(i, static_cast<uint32_t>(offset) * 4);
      }
    } else {
      const uint32_t offset = offsets.readInt();
      if (offset != kNoEntry) {
        record(i, offset);
      }
    }
  }
}

ResourceEntry ResourceTable::Decoder::decodeEntry(ByteReader &in,
                                                  const PackageState &state) {
  const size_t start = in.tell();
  const uint16_t size = in.readShort();
  const uint16_t flags = in.readShort();
  const uint32_t key = in.readInt();

  ResourceEntry entry;
  entry.flags = flags;

  if (flags & ResourceEntry::kFlagCompact) {
    // Compact entries hold the key in place of the size and the data type in
    // the upper byte of the flags.
    entry.key = state.keyStrings.at(size);
    entry.flags = flags & 0xFF;
    entry.value.dataType = static_cast<uint8_t>(flags >> 8);
    entry.value.data = key;
    checkValue(entry.value);
    return entry;
  }

  if (key != kNoIndex) {
    entry.key = state.keyStrings.at(key);
  }

  if (flags & ResourceEntry::kFlagComplex) {
    entry.parent = in.readInt();
    const uint32_t count = in.readInt();
    in.seek(start + size);
    entry.bag.reserve(std::min<uint32_t>(count, in.remaining() / 12));
    for (uint32_t i = 0; i < count; ++i) {
      ResourceEntry::BagItem item;
      item.name = in.readInt();
      item.value = TypedValue::read(in);
      checkValue(item.value);
      entry.bag.push_back(item);
    }
  } else {
    in.seek(start + size);
    entry.value = TypedValue::read(in);
    checkValue(entry.value);
  }
  return entry;
}

void ResourceTable::Decoder::checkValue(const TypedValue &value) const {
  if (value.isString() && !mTable.mValueStrings.contains(value.data)) {
    throw FormatError("String value index " + std::to_string(value.data) +
                      " is out of range (pool size " +
                      std::to_string(mTable.mValueStrings.size()) + ")");
  }
}

void ResourceTable::Decoder::decodeLibrary(const Chunk &chunk) {
  ByteReader header = chunk.headerReader();
  const uint32_t count = header.readInt();
  ByteReader body = chunk.body();
  for (uint32_t i = 0; i < count; ++i) {
    const uint32_t package_id = body.readInt();
    std::u16string name;
    for (int c = 0; c < 128; ++c) {
      char16_t ch = static_cast<char16_t>(body.readShort());
      if (ch == 0) {
        body.skip(static_cast<size_t>(127 - c) * 2);
        break;
      }
      name.push_back(ch);
    }
    mTable.mLibraries[package_id] = boost::locale::conv::utf_to_utf<char>(name);
  }
}

// ============================================================================
// RESOURCE TABLE
// ============================================================================

ResourceTable ResourceTable::decode(const uint8_t *data, size_t size,
                                    const ParseOptions &options) {
  Chunk chunk = readChunk(data, size);
  if (chunk.type() != ChunkType::Table) {
    std::ostringstream ss;
    ss << "Not a resource table: first chunk type is 0x" << std::hex
       << chunk.header.type;
    throw FormatError(ss.str());
  }

  ResourceTable table;
  Decoder decoder(table, options);
  decoder.decodeTable(chunk);
  return table;
}

const std::vector<ConfigValue> *ResourceTable::find(uint32_t id) const {
  const ResourceId rid{id};
  auto package = mPackages.find(rid.packageId());
  if (package == mPackages.end()) {
    return nullptr;
  }
  auto type = package->second.types.find(rid.typeId());
  if (type == package->second.types.end()) {
    return nullptr;
  }
  auto entry = type->second.entries.find(rid.entryIndex());
  if (entry == type->second.entries.end()) {
    return nullptr;
  }
  return &entry->second;
}

std::string ResourceTable::resourceName(uint32_t id) const {
  const std::vector<ConfigValue> *values = find(id);
  if (values == nullptr || values->empty()) {
    return std::string();
  }
  const ResourceId rid{id};
  const ResourcePackage &package = mPackages.at(rid.packageId());
  const ResourceType &type = package.types.at(rid.typeId());
  return package.name + ":" + type.name + "/" + values->front().entry.key;
}

} // namespace libapk
