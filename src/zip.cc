#include "zip.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <zip.h>

namespace libapk {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

std::string zipErrorString(int code) {
  zip_error_t error;
  zip_error_init_with_code(&error, code);
  std::string message = zip_error_strerror(&error);
  zip_error_fini(&error);
  return message;
}

// libzip reports every failure as a ZIP_ER_* code. Failures of the
// underlying file are I/O errors, everything else means the archive itself
// is broken.
[[noreturn]] void throwZipError(int code, const std::string &context) {
  const std::string message = context + ": " + zipErrorString(code);
  switch (code) {
  case ZIP_ER_NOENT:
  case ZIP_ER_OPEN:
  case ZIP_ER_READ:
  case ZIP_ER_SEEK:
  case ZIP_ER_CLOSE:
    throw IOError(message);
  default:
    throw FormatError(message);
  }
}

struct FileCloser {
  void operator()(zip_file_t *file) const { zip_fclose(file); }
};

} // namespace

void ZipArchive::Discard::operator()(zip *archive) const {
  zip_discard(archive);
}

ZipArchive::ZipArchive(const std::string &path) : mPath(path) {
  int zerr = ZIP_ER_OK;
  mArchive.reset(zip_open(path.c_str(), ZIP_RDONLY, &zerr));
  if (!mArchive) {
    throwZipError(zerr, "Cannot open archive " + path);
  }

  std::error_code ec;
  mFileSize = std::filesystem::file_size(path, ec);
  if (ec) {
    throw IOError("Cannot determine size of archive " + path + ": " +
                  ec.message());
  }
  readCentralDirectory();
}

ZipArchive::~ZipArchive() = default;

void ZipArchive::readCentralDirectory() {
  const zip_int64_t count = zip_get_num_entries(mArchive.get(), 0);
  if (count < 0) {
    throwZipError(zip_error_code_zip(zip_get_error(mArchive.get())),
                  "Cannot list " + mPath);
  }

  mEntries.reserve(static_cast<size_t>(count));
  for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(count); ++i) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(mArchive.get(), i, 0, &st) != 0) {
      throwZipError(zip_error_code_zip(zip_get_error(mArchive.get())),
                    "Central directory entry " + std::to_string(i) +
                        " of " + mPath);
    }
    if ((st.valid & ZIP_STAT_NAME) == 0) {
      throw FormatError("Central directory entry " + std::to_string(i) +
                        " has no name");
    }

    ZipEntry entry;
    entry.name = st.name;
    entry.index = i;
    if (st.valid & ZIP_STAT_COMP_METHOD) {
      entry.method = static_cast<uint16_t>(st.comp_method);
    }
    if (st.valid & ZIP_STAT_CRC) {
      entry.crc32 = st.crc;
    }
    if (st.valid & ZIP_STAT_COMP_SIZE) {
      entry.compressedLength = st.comp_size;
    }
    if (st.valid & ZIP_STAT_SIZE) {
      entry.uncompressedLength = st.size;
    }
    mEntries.push_back(std::move(entry));
  }
}

const ZipEntry *ZipArchive::find(const std::string &name) const {
  const zip_int64_t index = zip_name_locate(mArchive.get(), name.c_str(), 0);
  if (index < 0 || static_cast<zip_uint64_t>(index) >= mEntries.size()) {
    return nullptr;
  }
  return &mEntries[static_cast<size_t>(index)];
}

std::vector<uint8_t> ZipArchive::read(const ZipEntry &entry) const {
  if (entry.method == ZipEntry::kStored &&
      entry.compressedLength != entry.uncompressedLength) {
    throw FormatError("Stored entry " + entry.name + " has mismatched lengths");
  }

  std::unique_ptr<zip_file_t, FileCloser> file(
      zip_fopen_index(mArchive.get(), entry.index, 0));
  if (!file) {
    throwZipError(zip_error_code_zip(zip_get_error(mArchive.get())),
                  "Cannot open entry " + entry.name);
  }

  // Grow with the data actually produced. The recorded size is untrusted
  // and libzip fails the read if the stream disagrees with it.
  std::vector<uint8_t> data;
  std::vector<uint8_t> buffer(kReadChunk);
  for (;;) {
    const zip_int64_t n = zip_fread(file.get(), buffer.data(), buffer.size());
    if (n < 0) {
      throwZipError(zip_error_code_zip(zip_file_get_error(file.get())),
                    "Cannot read entry " + entry.name);
    }
    if (n == 0) {
      break;
    }
    data.insert(data.end(), buffer.begin(), buffer.begin() + n);
  }
  return data;
}

} // namespace libapk
