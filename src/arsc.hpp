#ifndef LIBAPK_ARSC_H
#define LIBAPK_ARSC_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "axml.hpp"
#include "chunk.hpp"

/**
 * @file arsc.hpp
 * @brief Decoder for the compiled resource table (resources.arsc).
 *
 * The table is a RES_TABLE_TYPE chunk holding one global string pool for
 * values and one package chunk per package. Each package holds a pool of
 * type names, a pool of entry key names, and for every resource type a
 * type-spec chunk followed by one type chunk per configuration.
 *
 * The decoded table maps a resource id to every (configuration, value)
 * pair recorded for it, in table order. It is immutable once built.
 */
namespace libapk {

// ============================================================================
// RESOURCE IDS
// ============================================================================

/**
 * @struct ResourceId
 * @brief A packed 0xPPTTEEEE resource identifier.
 */
struct ResourceId {
    uint32_t id = 0;

    uint8_t packageId() const noexcept { return static_cast<uint8_t>(id >> 24); }
    uint8_t typeId() const noexcept { return static_cast<uint8_t>((id >> 16) & 0xFF); }
    uint16_t entryIndex() const noexcept { return static_cast<uint16_t>(id & 0xFFFF); }

    static constexpr uint32_t make(uint8_t package_id, uint8_t type_id, uint16_t entry) {
        return (static_cast<uint32_t>(package_id) << 24) |
               (static_cast<uint32_t>(type_id) << 16) | entry;
    }
};

// ============================================================================
// CONFIGURATION
// ============================================================================

/**
 * @struct Configuration
 * @brief The qualifier set (ResTable_config) a value was compiled for.
 *
 * A zero field means "not specified". Language and region are kept as the
 * decoded two or three letter codes.
 */
struct Configuration {
    static constexpr uint16_t kDensityDefault = 0;
    static constexpr uint16_t kDensityLow = 120;
    static constexpr uint16_t kDensityMedium = 160;
    static constexpr uint16_t kDensityTv = 213;
    static constexpr uint16_t kDensityHigh = 240;
    static constexpr uint16_t kDensityXHigh = 320;
    static constexpr uint16_t kDensityXXHigh = 480;
    static constexpr uint16_t kDensityXXXHigh = 640;
    static constexpr uint16_t kDensityAny = 0xFFFE;
    static constexpr uint16_t kDensityNone = 0xFFFF;

    static constexpr uint8_t kOrientationPort = 1;
    static constexpr uint8_t kOrientationLand = 2;
    static constexpr uint8_t kOrientationSquare = 3;

    static constexpr uint8_t kUiModeNightMask = 0x30;
    static constexpr uint8_t kUiModeNightNo = 0x10;
    static constexpr uint8_t kUiModeNightYes = 0x20;

    uint16_t mcc = 0;
    uint16_t mnc = 0;
    std::string language;
    std::string region;
    uint8_t orientation = 0;
    uint8_t touchscreen = 0;
    uint16_t density = 0;
    uint8_t keyboard = 0;
    uint8_t navigation = 0;
    uint8_t inputFlags = 0;
    uint16_t screenWidth = 0;
    uint16_t screenHeight = 0;
    uint16_t sdkVersion = 0;
    uint16_t minorVersion = 0;
    uint8_t screenLayout = 0;
    uint8_t uiMode = 0;
    uint16_t smallestScreenWidthDp = 0;
    uint16_t screenWidthDp = 0;
    uint16_t screenHeightDp = 0;

    /**
     * @brief Read a size-prefixed ResTable_config.
     *
     * Older, shorter configs leave the missing fields zero; fields of newer,
     * longer configs that are not modelled here are skipped.
     *
     * @throws FormatError if the declared size is smaller than 4
     * @throws TruncatedInputError if the declared size exceeds the reader
     */
    static Configuration read(ByteReader& in);

    /// A configuration with only the density set.
    static Configuration withDensity(uint16_t density);

    /// True if no qualifier is set.
    bool isDefault() const;

    /// Number of qualifiers that are set.
    int specificity() const;

    /**
     * @brief Whether a value compiled for this configuration may be used for
     *        @p request.
     *
     * Locale, mcc and mnc must equal the request whenever this configuration
     * sets them. Other axes conflict only when both sides set them and they
     * differ. The sdk version must not exceed a request that sets one.
     * Density never disqualifies; it is ranked by the resolver.
     */
    bool matches(const Configuration& request) const;

    /// Total order over all fields; returns <0, 0 or >0.
    int compare(const Configuration& other) const;

    /// Qualifier string such as "en-rUS-xhdpi-v21", or "default".
    std::string toString() const;

    bool operator==(const Configuration& other) const { return compare(other) == 0; }
    bool operator!=(const Configuration& other) const { return compare(other) != 0; }
};

// ============================================================================
// TABLE MODEL
// ============================================================================

/**
 * @struct ResourceEntry
 * @brief One decoded entry: either a single value or a bag (map) of values.
 */
struct ResourceEntry {
    static constexpr uint16_t kFlagComplex = 0x0001;
    static constexpr uint16_t kFlagPublic = 0x0002;
    static constexpr uint16_t kFlagWeak = 0x0004;
    static constexpr uint16_t kFlagCompact = 0x0008;

    struct BagItem {
        uint32_t name = 0;  ///< attribute resource id
        TypedValue value;
    };

    std::string key;
    uint16_t flags = 0;
    TypedValue value;  ///< valid for simple entries
    uint32_t parent = 0;  ///< valid for complex entries
    std::vector<BagItem> bag;  ///< valid for complex entries

    bool isComplex() const noexcept { return (flags & kFlagComplex) != 0; }
    bool isPublic() const noexcept { return (flags & kFlagPublic) != 0; }
};

/**
 * @struct ConfigValue
 * @brief An entry together with the configuration it was compiled for.
 */
struct ConfigValue {
    Configuration config;
    ResourceEntry entry;
};

/**
 * @struct ResourceType
 * @brief All entries of one resource type ("string", "mipmap", ...).
 */
struct ResourceType {
    uint8_t id = 0;
    std::string name;
    std::vector<uint32_t> specFlags;  ///< per entry, from the type-spec chunk
    std::map<uint16_t, std::vector<ConfigValue>> entries;  ///< in table order
};

/**
 * @struct ResourcePackage
 * @brief A package chunk.
 */
struct ResourcePackage {
    uint32_t id = 0;
    std::string name;
    std::map<uint8_t, ResourceType> types;
};

/**
 * @class ResourceTable
 * @brief Decoded resources.arsc index: package, then type, then entry.
 *
 * @code
 * libapk::ResourceTable table = libapk::ResourceTable::decode(bytes.data(), bytes.size());
 * if (const auto* values = table.find(0x7f0b0001)) {
 *     for (const auto& cv : *values) {
 *         std::cout << cv.config.toString() << std::endl;
 *     }
 * }
 * @endcode
 */
class ResourceTable {
   private:
    StringPool mValueStrings;
    std::map<uint8_t, ResourcePackage> mPackages;
    std::map<uint32_t, std::string> mLibraries;

    class Decoder;

   public:
    ResourceTable() = default;

    /**
     * @brief Decode a resource table.
     *
     * @throws FormatError if the outer chunk is not a table, a chunk is
     *         malformed, or a string index (key, type name, string value) is
     *         out of range of its pool
     * @throws TruncatedInputError if a chunk is cut short
     */
    static ResourceTable decode(const uint8_t* data, size_t size,
                                const ParseOptions& options = {});

    /**
     * @brief Every (configuration, entry) recorded for @p id, in table order.
     * @return nullptr for unknown packages, types or entries
     */
    const std::vector<ConfigValue>* find(uint32_t id) const;

    /// Printable name "package:type/key", or an empty string if unknown.
    std::string resourceName(uint32_t id) const;

    const StringPool& valueStrings() const noexcept { return mValueStrings; }
    const std::map<uint8_t, ResourcePackage>& packages() const noexcept { return mPackages; }

    /// Shared library packages referenced by dynamic ids (package id to name).
    const std::map<uint32_t, std::string>& libraries() const noexcept { return mLibraries; }
};

}  // namespace libapk

#endif  // LIBAPK_ARSC_H
