#include "chunk.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

#include <boost/locale/encoding_utf.hpp>

namespace libapk {

// ============================================================================
// BYTE READER
// ============================================================================

ByteReader::ByteReader(const uint8_t *data, size_t size)
    : mData(data), mSize(size) {}

void ByteReader::require(size_t count) const {
  if (count > mSize - mPos) {
    throw TruncatedInputError("Unexpected end of data: need " +
                              std::to_string(count) + " bytes at offset " +
                              std::to_string(mPos) + ", have " +
                              std::to_string(mSize - mPos));
  }
}

uint8_t ByteReader::readByte() {
  require(1);
  return mData[mPos++];
}

uint16_t ByteReader::readShort() {
  require(2);
  uint16_t value =
      static_cast<uint16_t>(mData[mPos] | (mData[mPos + 1] << 8));
  mPos += 2;
  return value;
}

uint32_t ByteReader::readInt() {
  require(4);
  uint32_t value = static_cast<uint32_t>(mData[mPos]) |
                   (static_cast<uint32_t>(mData[mPos + 1]) << 8) |
                   (static_cast<uint32_t>(mData[mPos + 2]) << 16) |
                   (static_cast<uint32_t>(mData[mPos + 3]) << 24);
  mPos += 4;
  return value;
}

std::vector<uint8_t> ByteReader::readBytes(size_t length) {
  require(length);
  std::vector<uint8_t> bytes(mData + mPos, mData + mPos + length);
  mPos += length;
  return bytes;
}

void ByteReader::skip(size_t count) {
  require(count);
  mPos += count;
}

void ByteReader::seek(size_t pos) {
  if (pos > mSize) {
    throw TruncatedInputError("Seek past end of data: " + std::to_string(pos) +
                              " > " + std::to_string(mSize));
  }
  mPos = pos;
}

ByteReader ByteReader::slice(size_t offset, size_t length) const {
  if (offset > mSize || length > mSize - offset) {
    throw TruncatedInputError("Range [" + std::to_string(offset) + ", +" +
                              std::to_string(length) +
                              ") exceeds data of size " +
                              std::to_string(mSize));
  }
  return ByteReader(mData + offset, length);
}

// ============================================================================
// CHUNKS
// ============================================================================

ByteReader Chunk::headerReader() const {
  return ByteReader(data + ChunkHeader::kSize,
                    header.headerSize - ChunkHeader::kSize);
}

ByteReader Chunk::body() const {
  return ByteReader(data + header.headerSize, header.size - header.headerSize);
}

ByteReader Chunk::all() const { return ByteReader(data, header.size); }

Chunk readChunk(const uint8_t *data, size_t available, size_t offset) {
  if (available < ChunkHeader::kSize) {
    throw TruncatedInputError("Not enough space for chunk header at offset " +
                              std::to_string(offset));
  }

  ByteReader in(data, ChunkHeader::kSize);
  Chunk chunk;
  chunk.header.type = in.readShort();
  chunk.header.headerSize = in.readShort();
  chunk.header.size = in.readInt();
  chunk.data = data;
  chunk.offset = offset;

  std::ostringstream where;
  where << "chunk 0x" << std::hex << chunk.header.type << std::dec
        << " at offset " << offset;

  if (chunk.header.headerSize < ChunkHeader::kSize) {
    throw FormatError("Header size too small for " + where.str());
  }
  if (chunk.header.headerSize > chunk.header.size) {
    throw FormatError("Header size is larger than entire " + where.str());
  }
  if (chunk.header.size > available) {
    throw FormatError("Size of " + where.str() + " (" +
                      std::to_string(chunk.header.size) +
                      ") is bigger than remaining data (" +
                      std::to_string(available) + ")");
  }
  return chunk;
}

ChunkIterator::ChunkIterator(const uint8_t *data, size_t size,
                             size_t base_offset)
    : mNext(data), mRemaining(size), mOffset(base_offset) {}

Chunk ChunkIterator::next() {
  Chunk chunk = readChunk(mNext, mRemaining, mOffset);
  mNext += chunk.header.size;
  mRemaining -= chunk.header.size;
  mOffset += chunk.header.size;
  return chunk;
}

// ============================================================================
// STRING POOL
// ============================================================================

namespace {

// UTF-8 pools prefix each string with its length in characters and in
// bytes; each length is one byte, or two when the high bit is set.
size_t decodeLength8(ByteReader &in) {
  size_t len = in.readByte();
  if (len & 0x80) {
    len = ((len & 0x7F) << 8) | in.readByte();
  }
  return len;
}

// UTF-16 pools use one 16-bit unit, or two when the high bit is set.
size_t decodeLength16(ByteReader &in) {
  size_t len = in.readShort();
  if (len & 0x8000) {
    len = ((len & 0x7FFF) << 16) | in.readShort();
  }
  return len;
}

} // namespace

StringPool StringPool::decode(const Chunk &chunk) {
  ByteReader header = chunk.headerReader();
  const uint32_t string_count = header.readInt();
  /* style_count */ header.readInt();
  const uint32_t flags = header.readInt();
  const uint32_t strings_start = header.readInt();
  /* styles_start */ header.readInt();

  StringPool pool;
  pool.mUtf8 = (flags & kUtf8Flag) != 0;

  if (string_count == 0) {
    return pool;
  }

  ByteReader whole = chunk.all();
  const size_t index_size = static_cast<size_t>(string_count) * 4;
  if (index_size > whole.size() - chunk.header.headerSize) {
    throw FormatError("String pool index (" + std::to_string(string_count) +
                      " entries) exceeds chunk size");
  }
  if (strings_start < chunk.header.headerSize + index_size ||
      strings_start > chunk.header.size) {
    throw FormatError("String pool data start " +
                      std::to_string(strings_start) + " is out of range");
  }

  ByteReader offsets = whole.slice(chunk.header.headerSize, index_size);
  ByteReader strings =
      whole.slice(strings_start, chunk.header.size - strings_start);

  pool.mStrings.reserve(string_count);
  for (uint32_t i = 0; i < string_count; ++i) {
    const uint32_t offset = offsets.readInt();
    if (offset >= strings.size()) {
      throw FormatError("String " + std::to_string(i) + " offset " +
                        std::to_string(offset) + " is out of range");
    }
    strings.seek(offset);

    try {
      if (pool.mUtf8) {
        /* char count */ decodeLength8(strings);
        const size_t byte_len = decodeLength8(strings);
        std::vector<uint8_t> bytes = strings.readBytes(byte_len);
        pool.mStrings.emplace_back(bytes.begin(), bytes.end());
      } else {
        const size_t len = decodeLength16(strings);
        std::u16string units;
        units.reserve(std::min(len, strings.remaining() / 2));
        for (size_t c = 0; c < len; ++c) {
          units.push_back(static_cast<char16_t>(strings.readShort()));
        }
        pool.mStrings.push_back(
            boost::locale::conv::utf_to_utf<char>(units));
      }
    } catch (const TruncatedInputError &) {
      throw FormatError("String " + std::to_string(i) +
                        " runs past the end of the string pool");
    }
  }
  return pool;
}

const std::string &StringPool::at(uint32_t index) const {
  if (index >= mStrings.size()) {
    throw FormatError("String pool index " + std::to_string(index) +
                      " out of range (pool size " +
                      std::to_string(mStrings.size()) + ")");
  }
  return mStrings[index];
}

std::string StringPool::get(uint32_t index) const {
  if (index >= mStrings.size()) {
    return std::string();
  }
  return mStrings[index];
}

// ============================================================================
// TYPED VALUES
// ============================================================================

TypedValue TypedValue::read(ByteReader &in) {
  const uint16_t size = in.readShort();
  if (size < kSize) {
    throw FormatError("Res_value size " + std::to_string(size) +
                      " is too small");
  }
  /* res0 */ in.readByte();
  TypedValue value;
  value.dataType = in.readByte();
  value.data = in.readInt();
  // Newer producers may append fields; skip what we do not know.
  if (size > kSize) {
    in.skip(size - kSize);
  }
  return value;
}

float complexToFloat(uint32_t complex) {
  static const float kRadixMults[] = {
      1.0f / (1 << 8), 1.0f / (1 << 15), 1.0f / (1 << 23), 1.0f / (1u << 31)};
  const int32_t mantissa = static_cast<int32_t>(complex & 0xFFFFFF00);
  return static_cast<float>(mantissa) * kRadixMults[(complex >> 4) & 0x3];
}

std::string formatResourceId(uint32_t id) {
  std::ostringstream ss;
  ss << "0x" << std::hex << std::setw(8) << std::setfill('0') << id;
  return ss.str();
}

std::string TypedValue::format(const StringPool *pool) const {
  std::ostringstream ss;
  switch (dataType) {
  case TYPE_NULL:
    break;
  case TYPE_REFERENCE:
  case TYPE_DYNAMIC_REFERENCE:
    ss << "@" << formatResourceId(data);
    break;
  case TYPE_ATTRIBUTE:
  case TYPE_DYNAMIC_ATTRIBUTE:
    ss << "?" << formatResourceId(data);
    break;
  case TYPE_STRING:
    if (pool != nullptr) {
      ss << pool->get(data);
    }
    break;
  case TYPE_FLOAT: {
    float f;
    std::memcpy(&f, &data, sizeof(f));
    ss << f;
    break;
  }
  case TYPE_DIMENSION: {
    static const char *kUnits[] = {"px", "dip", "sp", "pt", "in", "mm"};
    const uint32_t unit = data & 0xF;
    ss << std::fixed << std::setprecision(1) << complexToFloat(data);
    if (unit < sizeof(kUnits) / sizeof(kUnits[0])) {
      ss << kUnits[unit];
    }
    break;
  }
  case TYPE_FRACTION: {
    const uint32_t unit = data & 0xF;
    ss << std::fixed << std::setprecision(1) << complexToFloat(data) * 100;
    ss << (unit == 1 ? "%p" : "%");
    break;
  }
  case TYPE_INT_HEX:
    ss << "0x" << std::hex << data;
    break;
  case TYPE_INT_BOOLEAN:
    ss << (data != 0 ? "true" : "false");
    break;
  case TYPE_INT_COLOR_ARGB8:
  case TYPE_INT_COLOR_RGB8:
  case TYPE_INT_COLOR_ARGB4:
  case TYPE_INT_COLOR_RGB4:
    ss << "#" << std::hex << std::setw(8) << std::setfill('0') << data;
    break;
  default:
    if (isInteger()) {
      ss << static_cast<int32_t>(data);
    } else {
      ss << "type0x" << std::hex << static_cast<int>(dataType) << "/0x"
         << data;
    }
    break;
  }
  return ss.str();
}

} // namespace libapk
