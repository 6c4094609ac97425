#ifndef LIBAPK_APK_H
#define LIBAPK_APK_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "arsc.hpp"
#include "axml.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "icon.hpp"

/**
 * @file apk.hpp
 * @brief Metadata extraction from an Android application package.
 *
 * This is the main entry point of libapk. parseApk() opens the archive,
 * decodes the binary manifest, resolves the display name and icon through
 * the resource table, and attaches the content and certificate digests.
 *
 * @section usage_overview Quick Start
 *
 * ### Read the metadata of an APK
 * @code
 * libapk::ExtractOptions options;
 * options.keytool_path = "keytool";
 * libapk::ApkInfo info = libapk::parseApk("app.apk", options);
 * std::cout << info.bundle_id << " " << info.version << std::endl;
 * @endcode
 *
 * ### Also decode the launcher icon
 * @code
 * libapk::ExtractOptions options;
 * options.decode_icon = true;
 * options.warning_callback = [](const std::string& cat, const std::string& msg) {
 *     std::cerr << "Warning [" << cat << "]: " << msg << std::endl;
 * };
 * libapk::ApkInfo info = libapk::parseApk("app.apk", options);
 * if (info.icon) {
 *     std::cout << info.icon->image.width << "x" << info.icon->image.height << std::endl;
 * }
 * @endcode
 *
 * Archive and manifest failures throw. Label, icon, content digest and
 * signature failures only leave their fields empty and are reported through
 * ExtractOptions::warning_callback.
 */
namespace libapk {

/// Name of the binary manifest inside the archive.
constexpr const char* kManifestEntry = "AndroidManifest.xml";

/// Name of the compiled resource table inside the archive.
constexpr const char* kResourceTableEntry = "resources.arsc";

/**
 * @struct ExtractOptions
 * @brief Options controlling parseApk().
 */
struct ExtractOptions {
    /**
     * @brief keytool executable used to read the signing certificate.
     *
     * Default: empty (no signature extraction, digest fields stay empty)
     */
    std::string keytool_path;

    /**
     * @brief Resolve, read and decode the launcher icon.
     *
     * Default: false
     */
    bool decode_icon = false;

    /**
     * @brief Screen density (dpi) requested when resolving the icon.
     *
     * Default: 720, which selects the largest bitmap the package ships.
     */
    uint16_t icon_density = 720;

    /**
     * @brief Locale used to resolve the display name, as "en" or "en-rUS".
     *
     * Default: empty (the unlocalized name)
     */
    std::string locale;

    /// Entry prefixes identifying 64-bit native code.
    std::vector<std::string> abi64_prefixes = {"lib/arm64-v8a"};

    /// Entry prefixes identifying 32-bit native code.
    std::vector<std::string> abi32_prefixes = {"lib/armeabi"};

    /**
     * @brief Upper bound for the keytool run.
     *
     * Default: 0 (wait until keytool exits)
     */
    std::chrono::milliseconds tool_timeout{0};

    /// Receives every non-fatal condition. Default: nullptr (discard)
    WarningCallback warning_callback = nullptr;
};

/**
 * @struct Icon
 * @brief The resolved launcher icon.
 */
struct Icon {
    std::string path;            ///< archive entry the icon resolved to
    std::vector<uint8_t> bytes;  ///< raw entry contents
    Image image;                 ///< decoded pixels
};

/**
 * @struct DeclaredPermission
 * @brief A <permission> declared by the package itself.
 */
struct DeclaredPermission {
    std::string name;
    std::string protection_level;
};

/**
 * @struct ApkInfo
 * @brief Extracted metadata record.
 */
struct ApkInfo {
    std::string name;       ///< display name
    std::string bundle_id;  ///< package name
    std::string version;    ///< versionName
    int64_t build = 0;      ///< versionCode, with versionCodeMajor in the upper 32 bits
    std::optional<Icon> icon;
    uint64_t size = 0;  ///< archive size in bytes
    std::string signature_md5;
    std::string signature_sha1;
    std::string signature_sha256;
    std::string md5;  ///< whole-file digest
    std::vector<std::string> uses_permissions;
    bool support_os64 = false;
    bool support_os32 = false;
    int min_sdk_version = 0;
    int target_sdk_version = 0;
    std::vector<DeclaredPermission> permissions;
};

// ============================================================================
// ARCHIVE SCAN
// ============================================================================

/**
 * @struct ArchiveScan
 * @brief What the entry list of an archive says about its contents.
 */
struct ArchiveScan {
    bool has_manifest = false;
    bool has_resource_table = false;
    bool has_native_code = false;  ///< any entry ending in ".so"
    bool support_os64 = false;
    bool support_os32 = false;
};

/**
 * @brief Classify the entries of an archive.
 *
 * An archive without any native code runs on every ABI, so both support
 * flags are set. Otherwise each flag is set when some entry starts with one
 * of the configured prefixes for that word size.
 */
ArchiveScan scanArchive(const std::vector<std::string>& entry_names,
                        const ExtractOptions& options = {});

// ============================================================================
// MANIFEST FIELDS
// ============================================================================

/**
 * @struct ManifestFields
 * @brief Fields read directly from the decoded manifest tree.
 */
struct ManifestFields {
    std::string package;
    std::string version_name;
    int64_t version_code = 0;
    std::string label;       ///< literal android:label, if not a reference
    uint32_t label_id = 0;   ///< android:label resource id, if a reference
    uint32_t icon_id = 0;    ///< android:icon (or roundIcon) resource id
    int min_sdk_version = 0;
    int target_sdk_version = 0;
    std::vector<std::string> uses_permissions;
    std::vector<DeclaredPermission> permissions;
};

/**
 * @brief Extract the metadata fields from a manifest tree.
 * @throws FormatError if the root element is not <manifest>
 */
ManifestFields readManifestFields(const XmlNode& root);

/**
 * @brief Build the configuration for a locale string.
 *
 * Accepts "", "en", "en-rUS", "en-US" and "en_US".
 *
 * @throws FormatError for anything else
 */
Configuration localeConfiguration(const std::string& locale);

// ============================================================================
// EXTRACTION
// ============================================================================

/**
 * @brief Extract the metadata of an application package.
 *
 * @param path Path of the package; must end in ".apk"
 * @param options Extraction options
 * @param extractor Signature source; when null and options.keytool_path is
 *        set, a KeytoolSignatureExtractor is used
 *
 * @throws FormatError for a wrong extension (checked before the file is
 *         opened), a file that is not a zip archive, a missing or malformed
 *         manifest, or an invalid locale option
 * @throws TruncatedInputError if the manifest stream is cut short
 * @throws IOError if the archive cannot be opened or read
 */
ApkInfo parseApk(const std::string& path, const ExtractOptions& options = {},
                 SignatureExtractor* extractor = nullptr);

}  // namespace libapk

#endif  // LIBAPK_APK_H
