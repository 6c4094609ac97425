#include "apk.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_builders.hpp"

using apktest::Bytes;
using apktest::TableBuilder;
using apktest::XmlBuilder;
using apktest::ZipFile;
using namespace libapk;

static const uint32_t kLabelId = 0x7f020000;
static const uint32_t kIconId = 0x7f010000;

namespace {

class FakeSignatureExtractor : public SignatureExtractor {
 public:
  explicit FakeSignatureExtractor(bool fail = false) : mFail(fail) {}

  Result<SignatureDigests> extractDigests(const std::string& path) override {
    mPath = path;
    if (mFail) {
      return Result<SignatureDigests>::failure("Cannot run keytool");
    }
    SignatureDigests digests;
    digests.md5 = "abcdef01";
    digests.sha1 = "0123456789";
    digests.sha256 = "ffee";
    return Result<SignatureDigests>::success(digests);
  }

  const std::string& path() const { return mPath; }

 private:
  bool mFail;
  std::string mPath;
};

struct Warnings {
  std::vector<std::string> messages;

  WarningCallback callback() {
    return [this](const std::string& category, const std::string& message) {
      messages.push_back(category + ": " + message);
    };
  }

  bool has(const std::string& category) const {
    for (const std::string& m : messages) {
      if (m.compare(0, category.size() + 1, category + ":") == 0) return true;
    }
    return false;
  }
};

}  // namespace

static Bytes sampleManifest() {
  return apktest::manifestBuilder("com.example.app", "1.2.3", 45,
                                  {apktest::androidRef("label", 0x01010001, kLabelId),
                                   apktest::androidRef("icon", 0x01010002, kIconId)},
                                  {"android.permission.CAMERA", "android.permission.INTERNET"})
      .build();
}

static Bytes sampleTable() {
  Configuration en;
  en.language = "en";
  TableBuilder b;
  b.typeName(1, "mipmap").typeName(2, "string");
  b.string(2, 0, "app_name", Configuration(), "Example");
  b.string(2, 0, "app_name", en, "Example (en)");
  b.string(1, 0, "ic_launcher", apktest::density(480), "res/mipmap-xxhdpi/ic_launcher.png");
  b.string(1, 0, "ic_launcher", apktest::density(640), "res/mipmap-xxxhdpi/ic_launcher.png");
  return b.build();
}

static std::string writeApk(const std::string& name, const std::vector<ZipFile>& files) {
  std::string path = apktest::tempPath(name);
  apktest::writeFile(path, apktest::makeZip(files));
  return path;
}

static std::vector<ZipFile> sampleFiles() {
  return {{"AndroidManifest.xml", sampleManifest(), true},
          {"resources.arsc", sampleTable(), false},
          {"res/mipmap-xxhdpi/ic_launcher.png", apktest::makePng(144, 144), false},
          {"res/mipmap-xxxhdpi/ic_launcher.png", apktest::makePng(192, 192, 0x00FF00FF), false},
          {"lib/arm64-v8a/libnative.so", Bytes(16, 0x7f), true}};
}

// ============================================================================
// ARCHIVE SCAN
// ============================================================================

TEST(apk, ScanManifestOnly) {
  ArchiveScan scan = scanArchive({"AndroidManifest.xml", "classes.dex"});
  ASSERT_TRUE(scan.has_manifest);
  ASSERT_FALSE(scan.has_resource_table);
  ASSERT_FALSE(scan.has_native_code);
  ASSERT_TRUE(scan.support_os64);
  ASSERT_TRUE(scan.support_os32);
}

TEST(apk, Scan64BitOnly) {
  ArchiveScan scan = scanArchive({"AndroidManifest.xml", "lib/arm64-v8a/libx.so"});
  ASSERT_TRUE(scan.has_native_code);
  ASSERT_TRUE(scan.support_os64);
  ASSERT_FALSE(scan.support_os32);
}

TEST(apk, Scan32BitOnly) {
  ArchiveScan scan = scanArchive({"AndroidManifest.xml", "lib/armeabi-v7a/libx.so"});
  ASSERT_FALSE(scan.support_os64);
  ASSERT_TRUE(scan.support_os32);
}

TEST(apk, ScanBothAbis) {
  ArchiveScan scan = scanArchive({"lib/armeabi/liba.so", "lib/arm64-v8a/liba.so", "resources.arsc"});
  ASSERT_FALSE(scan.has_manifest);
  ASSERT_TRUE(scan.has_resource_table);
  ASSERT_TRUE(scan.support_os64);
  ASSERT_TRUE(scan.support_os32);
}

TEST(apk, ScanUnknownAbi) {
  ArchiveScan scan = scanArchive({"AndroidManifest.xml", "lib/x86_64/libx.so"});
  ASSERT_TRUE(scan.has_native_code);
  ASSERT_FALSE(scan.support_os64);
  ASSERT_FALSE(scan.support_os32);
}

TEST(apk, ScanConfiguredPrefixes) {
  ExtractOptions options;
  options.abi64_prefixes = {"lib/arm64-v8a", "lib/x86_64"};
  options.abi32_prefixes = {"lib/armeabi", "lib/x86/"};
  ArchiveScan scan = scanArchive({"AndroidManifest.xml", "lib/x86_64/libx.so"}, options);
  ASSERT_TRUE(scan.support_os64);
  ASSERT_FALSE(scan.support_os32);
}

// ============================================================================
// MANIFEST FIELDS
// ============================================================================

TEST(apk, ManifestFields) {
  Bytes bytes = sampleManifest();
  XmlDocument doc = parseBinaryXml(bytes.data(), bytes.size());
  ManifestFields fields = readManifestFields(doc.root);

  ASSERT_EQ("com.example.app", fields.package);
  ASSERT_EQ("1.2.3", fields.version_name);
  ASSERT_EQ(45, fields.version_code);
  ASSERT_EQ(21, fields.min_sdk_version);
  ASSERT_EQ(33, fields.target_sdk_version);
  ASSERT_EQ(kLabelId, fields.label_id);
  ASSERT_EQ("", fields.label);
  ASSERT_EQ(kIconId, fields.icon_id);
  ASSERT_EQ((std::vector<std::string>{"android.permission.CAMERA", "android.permission.INTERNET"}),
            fields.uses_permissions);
}

TEST(apk, ManifestLiteralLabelAndRoundIcon) {
  Bytes bytes = apktest::manifestBuilder("com.example.lite", "2.0", 7,
                                         {apktest::androidString("label", 0x01010001, "Lite"),
                                          apktest::androidRef("roundIcon", 0x0101052c, 0x7f010001)})
                    .build();
  XmlDocument doc = parseBinaryXml(bytes.data(), bytes.size());
  ManifestFields fields = readManifestFields(doc.root);
  ASSERT_EQ("Lite", fields.label);
  ASSERT_EQ(0u, fields.label_id);
  ASSERT_EQ(0x7f010001u, fields.icon_id);
  ASSERT_TRUE(fields.uses_permissions.empty());
}

TEST(apk, ManifestVersionCodeMajor) {
  XmlBuilder b;
  b.startNamespace("android", apktest::kAndroidNs)
      .startElement("manifest", {apktest::androidInt("versionCode", 0x0101021b, 5),
                                 apktest::androidInt("versionCodeMajor", 0x01010576, 1),
                                 apktest::plainString("package", "com.example.major")})
      .endElement("manifest")
      .endNamespace("android", apktest::kAndroidNs);
  Bytes bytes = b.build();
  XmlDocument doc = parseBinaryXml(bytes.data(), bytes.size());
  ManifestFields fields = readManifestFields(doc.root);
  ASSERT_EQ((int64_t{1} << 32) | 5, fields.version_code);
  ASSERT_EQ(0, fields.min_sdk_version);
}

TEST(apk, ManifestVersionCodeMajorHighBit) {
  XmlBuilder b;
  b.startNamespace("android", apktest::kAndroidNs)
      .startElement("manifest", {apktest::androidTyped("versionCode", 0x0101021b, TypedValue::TYPE_INT_DEC, 0xFFFFFFFFu),
                                 apktest::androidTyped("versionCodeMajor", 0x01010576, TypedValue::TYPE_INT_DEC, 0x80000000u),
                                 apktest::plainString("package", "com.example.major")})
      .endElement("manifest")
      .endNamespace("android", apktest::kAndroidNs);
  Bytes bytes = b.build();
  XmlDocument doc = parseBinaryXml(bytes.data(), bytes.size());
  ManifestFields fields = readManifestFields(doc.root);
  ASSERT_EQ(0x80000000FFFFFFFFull, static_cast<uint64_t>(fields.version_code));
}

TEST(apk, ManifestDeclaredPermissions) {
  XmlBuilder b;
  b.startNamespace("android", apktest::kAndroidNs)
      .startElement("manifest", {apktest::plainString("package", "com.example.perm")})
      .startElement("permission",
                    {apktest::androidString("name", 0x01010003, "com.example.perm.READ"),
                     apktest::androidTyped("protectionLevel", 0x01010009, TypedValue::TYPE_INT_HEX, 2)})
      .endElement("permission")
      .startElement("permission", {apktest::androidString("name", 0x01010003, "com.example.perm.WRITE")})
      .endElement("permission")
      .endElement("manifest")
      .endNamespace("android", apktest::kAndroidNs);
  Bytes bytes = b.build();
  XmlDocument doc = parseBinaryXml(bytes.data(), bytes.size());
  ManifestFields fields = readManifestFields(doc.root);

  ASSERT_EQ(2u, fields.permissions.size());
  ASSERT_EQ("com.example.perm.READ", fields.permissions[0].name);
  ASSERT_EQ("signature", fields.permissions[0].protection_level);
  ASSERT_EQ("com.example.perm.WRITE", fields.permissions[1].name);
  ASSERT_EQ("", fields.permissions[1].protection_level);
}

TEST(apk, ManifestWrongRoot) {
  XmlBuilder b;
  b.startElement("resources").endElement("resources");
  Bytes bytes = b.build();
  XmlDocument doc = parseBinaryXml(bytes.data(), bytes.size());
  ASSERT_THROW(readManifestFields(doc.root), FormatError);
}

TEST(apk, LocaleConfiguration) {
  ASSERT_TRUE(localeConfiguration("").isDefault());
  ASSERT_EQ("en", localeConfiguration("en").language);
  ASSERT_EQ("", localeConfiguration("en").region);
  for (const char* locale : {"en-rUS", "en-US", "en_US", "EN_us"}) {
    Configuration config = localeConfiguration(locale);
    ASSERT_EQ("en", config.language) << locale;
    ASSERT_EQ("US", config.region) << locale;
  }
  ASSERT_THROW(localeConfiguration("e"), FormatError);
  ASSERT_THROW(localeConfiguration("en-USA"), FormatError);
  ASSERT_THROW(localeConfiguration("e1"), FormatError);
}

// ============================================================================
// EXTRACTION
// ============================================================================

TEST(apk, ParseApk) {
  std::string path = writeApk("sample.apk", sampleFiles());
  FakeSignatureExtractor extractor;
  Warnings warnings;
  ExtractOptions options;
  options.decode_icon = true;
  options.warning_callback = warnings.callback();

  ApkInfo info = parseApk(path, options, &extractor);

  ASSERT_EQ("Example", info.name);
  ASSERT_EQ("com.example.app", info.bundle_id);
  ASSERT_EQ("1.2.3", info.version);
  ASSERT_EQ(45, info.build);
  ASSERT_EQ(21, info.min_sdk_version);
  ASSERT_EQ(33, info.target_sdk_version);
  ASSERT_EQ((std::vector<std::string>{"android.permission.CAMERA", "android.permission.INTERNET"}),
            info.uses_permissions);
  ASSERT_TRUE(info.support_os64);
  ASSERT_FALSE(info.support_os32);
  ASSERT_EQ(md5File(path), info.md5);
  ASSERT_EQ(32u, info.md5.size());

  ASSERT_EQ(path, extractor.path());
  ASSERT_EQ("abcdef01", info.signature_md5);
  ASSERT_EQ("0123456789", info.signature_sha1);
  ASSERT_EQ("ffee", info.signature_sha256);

  ASSERT_TRUE(info.icon.has_value());
  ASSERT_EQ("res/mipmap-xxxhdpi/ic_launcher.png", info.icon->path);
  ASSERT_EQ(192u, info.icon->image.width);
  ASSERT_EQ(192u, info.icon->image.height);
  ASSERT_EQ(192u * 192u * 4u, info.icon->image.pixels.size());
  ASSERT_EQ(0x00, info.icon->image.pixels[0]);
  ASSERT_EQ(0xFF, info.icon->image.pixels[1]);

  ASSERT_TRUE(warnings.messages.empty());
}

TEST(apk, ParseApkSize) {
  Bytes zip = apktest::makeZip(sampleFiles());
  std::string path = apktest::tempPath("size.apk");
  apktest::writeFile(path, zip);
  ASSERT_EQ(zip.size(), parseApk(path).size);
}

TEST(apk, ParseApkIconDensity) {
  std::string path = writeApk("density.apk", sampleFiles());
  ExtractOptions options;
  options.decode_icon = true;
  options.icon_density = 480;
  ApkInfo info = parseApk(path, options);
  ASSERT_EQ("res/mipmap-xxhdpi/ic_launcher.png", info.icon->path);
  ASSERT_EQ(144u, info.icon->image.width);
}

TEST(apk, ParseApkWithoutIcon) {
  std::string path = writeApk("no-icon.apk", sampleFiles());
  ApkInfo info = parseApk(path);
  ASSERT_FALSE(info.icon.has_value());
  ASSERT_EQ("", info.signature_md5);
}

TEST(apk, ParseApkLocale) {
  std::string path = writeApk("locale.apk", sampleFiles());
  ExtractOptions options;
  options.locale = "en-rUS";
  ASSERT_EQ("Example (en)", parseApk(path, options).name);
}

TEST(apk, NotAnApk) {
  // The archive is never opened, so the file does not need to exist.
  ASSERT_THROW(parseApk(apktest::tempPath("missing.ipa")), FormatError);
  ASSERT_THROW(parseApk(apktest::tempPath("missing.apk.zip")), FormatError);
}

TEST(apk, MissingFile) {
  ASSERT_THROW(parseApk(apktest::tempPath("missing.apk")), IOError);
}

TEST(apk, MissingManifest) {
  std::string path = writeApk("no-manifest.apk", {{"resources.arsc", sampleTable(), false}});
  ASSERT_THROW(parseApk(path), FormatError);
}

TEST(apk, ManifestOnly) {
  Bytes manifest = apktest::manifestBuilder("com.example.bare", "0.1", 1,
                                            {apktest::androidString("label", 0x01010001, "Bare")})
                       .build();
  std::string path = writeApk("bare.apk", {{"AndroidManifest.xml", manifest, false}});
  Warnings warnings;
  ExtractOptions options;
  options.decode_icon = true;
  options.warning_callback = warnings.callback();

  ApkInfo info = parseApk(path, options);
  ASSERT_EQ("Bare", info.name);
  ASSERT_EQ("com.example.bare", info.bundle_id);
  ASSERT_TRUE(info.support_os64);
  ASSERT_TRUE(info.support_os32);
  ASSERT_TRUE(info.uses_permissions.empty());
  ASSERT_FALSE(info.icon.has_value());
  ASSERT_TRUE(warnings.has("icon"));
}

TEST(apk, SignatureFailureIsWarning) {
  std::string path = writeApk("unsigned.apk", sampleFiles());
  FakeSignatureExtractor extractor(true);
  Warnings warnings;
  ExtractOptions options;
  options.warning_callback = warnings.callback();

  ApkInfo info = parseApk(path, options, &extractor);
  ASSERT_EQ("", info.signature_md5);
  ASSERT_EQ("", info.signature_sha1);
  ASSERT_EQ("", info.signature_sha256);
  ASSERT_EQ("com.example.app", info.bundle_id);
  ASSERT_TRUE(warnings.has("signature"));
}

TEST(apk, BrokenResourceTable) {
  Bytes table = sampleTable();
  table.resize(table.size() - 16);
  std::string path = writeApk("broken-table.apk", {{"AndroidManifest.xml", sampleManifest(), false},
                                                    {"resources.arsc", table, false}});
  Warnings warnings;
  ExtractOptions options;
  options.warning_callback = warnings.callback();

  ApkInfo info = parseApk(path, options);
  ASSERT_EQ("", info.name);
  ASSERT_EQ("1.2.3", info.version);
  ASSERT_TRUE(warnings.has("resources"));
  ASSERT_TRUE(warnings.has("label"));
}

TEST(apk, IconNotPng) {
  std::vector<ZipFile> files = sampleFiles();
  files[3].data = Bytes(64, 0x42);
  std::string path = writeApk("bad-icon.apk", files);
  Warnings warnings;
  ExtractOptions options;
  options.decode_icon = true;
  options.warning_callback = warnings.callback();

  ApkInfo info = parseApk(path, options);
  ASSERT_FALSE(info.icon.has_value());
  ASSERT_TRUE(warnings.has("icon"));
  ASSERT_EQ("Example", info.name);
}

TEST(apk, CorruptManifest) {
  Bytes manifest = sampleManifest();
  manifest.resize(manifest.size() - 8);
  std::string path = writeApk("corrupt.apk", {{"AndroidManifest.xml", manifest, false}});
  ASSERT_THROW(parseApk(path), FormatError);
}
