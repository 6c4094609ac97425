#ifndef LIBAPK_ZIP_H
#define LIBAPK_ZIP_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"

struct zip;

/**
 * @file zip.hpp
 * @brief Read-only access to the entries of a zip archive, backed by libzip.
 *
 * The central directory is listed once when the archive is opened. Entry
 * contents are extracted on demand and verified against the recorded
 * CRC-32 and size while they are read.
 */
namespace libapk {

/**
 * @struct ZipEntry
 * @brief A central directory record.
 */
struct ZipEntry {
    static constexpr uint16_t kStored = 0;
    static constexpr uint16_t kDeflated = 8;

    std::string name;
    uint64_t index = 0;  ///< position in the central directory
    uint16_t method = kStored;
    uint32_t crc32 = 0;
    uint64_t compressedLength = 0;
    uint64_t uncompressedLength = 0;

    bool isDirectory() const { return !name.empty() && name.back() == '/'; }
};

/**
 * @class ZipArchive
 * @brief An open archive file.
 *
 * The libzip handle is held for the lifetime of the object and discarded by
 * the destructor on every path, including exceptions thrown while reading.
 *
 * @code
 * libapk::ZipArchive archive("app.apk");
 * if (const libapk::ZipEntry* entry = archive.find("AndroidManifest.xml")) {
 *     std::vector<uint8_t> bytes = archive.read(*entry);
 * }
 * @endcode
 */
class ZipArchive {
   private:
    struct Discard {
        void operator()(zip* archive) const;
    };

    std::string mPath;
    std::unique_ptr<zip, Discard> mArchive;
    uint64_t mFileSize = 0;
    std::vector<ZipEntry> mEntries;

    void readCentralDirectory();

   public:
    /**
     * @brief Open @p path and list its central directory.
     * @throws IOError if the file cannot be opened or read
     * @throws FormatError if the file is not a zip archive or its central
     *         directory is inconsistent
     */
    explicit ZipArchive(const std::string& path);
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    /// Entries in central directory order.
    const std::vector<ZipEntry>& entries() const noexcept { return mEntries; }

    /// Entry named exactly @p name, or nullptr.
    const ZipEntry* find(const std::string& name) const;

    /**
     * @brief Extract and verify the contents of @p entry.
     * @throws IOError if reading fails
     * @throws FormatError for an unsupported method, a corrupt deflate
     *         stream, a size mismatch or a CRC-32 mismatch
     */
    std::vector<uint8_t> read(const ZipEntry& entry) const;

    uint64_t fileSize() const noexcept { return mFileSize; }
    const std::string& path() const noexcept { return mPath; }
};

}  // namespace libapk

#endif  // LIBAPK_ZIP_H
