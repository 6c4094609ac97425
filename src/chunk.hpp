#ifndef LIBAPK_CHUNK_H
#define LIBAPK_CHUNK_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

/**
 * @file chunk.hpp
 * @brief Building blocks shared by the binary XML and resource table
 *        decoders: a bounds-checked reader, chunk iteration, the string
 *        pool and typed values.
 *
 * Every compiled resource file is a tree of chunks. Each chunk starts with
 * an 8-byte header (type, header size, total size); the header size tells
 * where the chunk payload starts and the total size tells where the next
 * sibling starts. All integers are little-endian.
 */
namespace libapk {

// ============================================================================
// CHUNK TYPES
// ============================================================================

/**
 * @brief Chunk type identifiers.
 */
enum class ChunkType : uint16_t {
    Null = 0x0000,
    StringPool = 0x0001,
    Table = 0x0002,
    Xml = 0x0003,

    XmlStartNamespace = 0x0100,
    XmlEndNamespace = 0x0101,
    XmlStartElement = 0x0102,
    XmlEndElement = 0x0103,
    XmlCdata = 0x0104,
    XmlResourceMap = 0x0180,

    TablePackage = 0x0200,
    TableType = 0x0201,
    TableTypeSpec = 0x0202,
    TableLibrary = 0x0203,
};

/// Index value meaning "no string".
constexpr uint32_t kNoIndex = 0xFFFFFFFF;

/**
 * @struct ChunkHeader
 * @brief The common header of every chunk.
 *
 * Invariant once validated: 8 <= headerSize <= size.
 */
struct ChunkHeader {
    uint16_t type = 0;
    uint16_t headerSize = 0;
    uint32_t size = 0;

    static constexpr size_t kSize = 8;
};

// ============================================================================
// BYTE READER
// ============================================================================

/**
 * @class ByteReader
 * @brief Little-endian reader over a borrowed byte range.
 *
 * The reader never owns the bytes and never reads outside of
 * [data, data + size). Any attempt to do so throws TruncatedInputError.
 */
class ByteReader {
   private:
    const uint8_t* mData;
    size_t mSize;
    size_t mPos = 0;

    void require(size_t count) const;

   public:
    ByteReader(const uint8_t* data, size_t size);

    /**
     * @brief Read a single unsigned byte.
     * @throws TruncatedInputError if no byte is left
     */
    uint8_t readByte();

    /**
     * @brief Read a 16-bit little-endian unsigned integer.
     * @throws TruncatedInputError if fewer than 2 bytes are left
     */
    uint16_t readShort();

    /**
     * @brief Read a 32-bit little-endian unsigned integer.
     * @throws TruncatedInputError if fewer than 4 bytes are left
     */
    uint32_t readInt();

    /**
     * @brief Copy @p length raw bytes.
     * @throws TruncatedInputError if fewer than @p length bytes are left
     */
    std::vector<uint8_t> readBytes(size_t length);

    void skip(size_t count);
    void seek(size_t pos);

    /**
     * @brief Sub-reader over [offset, offset + length) of this reader.
     * @throws TruncatedInputError if the range exceeds this reader
     */
    ByteReader slice(size_t offset, size_t length) const;

    size_t tell() const noexcept { return mPos; }
    size_t size() const noexcept { return mSize; }
    size_t remaining() const noexcept { return mSize - mPos; }
    bool eof() const noexcept { return mPos >= mSize; }
    const uint8_t* data() const noexcept { return mData; }
};

// ============================================================================
// CHUNKS
// ============================================================================

/**
 * @struct Chunk
 * @brief A validated chunk inside a byte buffer.
 */
struct Chunk {
    ChunkHeader header;
    const uint8_t* data = nullptr;  ///< first byte of the chunk header
    size_t offset = 0;              ///< offset of the chunk in the outer stream

    ChunkType type() const noexcept { return static_cast<ChunkType>(header.type); }

    /// Reader over the type specific header, i.e. bytes [8, headerSize).
    ByteReader headerReader() const;

    /// Reader over the payload, i.e. bytes [headerSize, size).
    ByteReader body() const;

    /// Reader over the whole chunk, i.e. bytes [0, size).
    ByteReader all() const;
};

/**
 * @brief Read and validate the chunk header at the start of a buffer.
 *
 * @param data Start of the chunk
 * @param available Number of bytes available from @p data to the end of the
 *        enclosing stream
 * @param offset Offset of @p data in the outer stream, used in messages
 * @return The validated chunk
 *
 * @throws TruncatedInputError if fewer than 8 bytes are available
 * @throws FormatError if headerSize < 8, headerSize > size or size exceeds
 *         @p available
 */
Chunk readChunk(const uint8_t* data, size_t available, size_t offset = 0);

/**
 * @class ChunkIterator
 * @brief Iterates sibling chunks laid out back to back.
 *
 * Each chunk's start depends on the previous chunk's declared size, so the
 * walk is strictly sequential.
 *
 * @code
 * ChunkIterator iter(payload, payload_size);
 * while (iter.hasNext()) {
 *     Chunk chunk = iter.next();
 *     ...
 * }
 * @endcode
 */
class ChunkIterator {
   private:
    const uint8_t* mNext;
    size_t mRemaining;
    size_t mOffset;

   public:
    ChunkIterator(const uint8_t* data, size_t size, size_t base_offset = 0);

    bool hasNext() const noexcept { return mRemaining != 0; }

    /**
     * @brief Validate and return the next chunk.
     * @throws TruncatedInputError, FormatError (see readChunk)
     */
    Chunk next();
};

// ============================================================================
// STRING POOL
// ============================================================================

/**
 * @class StringPool
 * @brief Decoded string pool chunk.
 *
 * Both UTF-8 and UTF-16 encoded pools are normalised to UTF-8 std::string.
 * Style spans are not decoded.
 */
class StringPool {
   private:
    std::vector<std::string> mStrings;
    bool mUtf8 = false;

   public:
    static constexpr uint32_t kSortedFlag = 1 << 0;
    static constexpr uint32_t kUtf8Flag = 1 << 8;

    StringPool() = default;

    /**
     * @brief Decode a RES_STRING_POOL_TYPE chunk.
     * @throws FormatError if offsets or lengths point outside of the chunk
     * @throws TruncatedInputError if the chunk header is cut short
     */
    static StringPool decode(const Chunk& chunk);

    /**
     * @brief String at @p index.
     * @throws FormatError if @p index is out of range
     */
    const std::string& at(uint32_t index) const;

    /// String at @p index, or an empty string for kNoIndex / out of range.
    std::string get(uint32_t index) const;

    bool contains(uint32_t index) const noexcept { return index < mStrings.size(); }
    size_t size() const noexcept { return mStrings.size(); }
    bool empty() const noexcept { return mStrings.empty(); }
    bool isUtf8() const noexcept { return mUtf8; }
};

// ============================================================================
// TYPED VALUES
// ============================================================================

/**
 * @struct TypedValue
 * @brief A Res_value: a data type tag and 32 bits of data.
 *
 * The meaning of @c data depends on @c dataType: a string pool index, an
 * integer, a boolean, a packed dimension, or a resource id.
 */
struct TypedValue {
    enum Type : uint8_t {
        TYPE_NULL = 0x00,
        TYPE_REFERENCE = 0x01,
        TYPE_ATTRIBUTE = 0x02,
        TYPE_STRING = 0x03,
        TYPE_FLOAT = 0x04,
        TYPE_DIMENSION = 0x05,
        TYPE_FRACTION = 0x06,
        TYPE_DYNAMIC_REFERENCE = 0x07,
        TYPE_DYNAMIC_ATTRIBUTE = 0x08,
        TYPE_FIRST_INT = 0x10,
        TYPE_INT_DEC = 0x10,
        TYPE_INT_HEX = 0x11,
        TYPE_INT_BOOLEAN = 0x12,
        TYPE_FIRST_COLOR_INT = 0x1c,
        TYPE_INT_COLOR_ARGB8 = 0x1c,
        TYPE_INT_COLOR_RGB8 = 0x1d,
        TYPE_INT_COLOR_ARGB4 = 0x1e,
        TYPE_INT_COLOR_RGB4 = 0x1f,
        TYPE_LAST_INT = 0x1f,
    };

    static constexpr size_t kSize = 8;

    uint8_t dataType = TYPE_NULL;
    uint32_t data = 0;

    /**
     * @brief Read a Res_value (size, res0, dataType, data).
     * @throws FormatError if the declared size is smaller than 8
     * @throws TruncatedInputError if the reader runs out
     */
    static TypedValue read(ByteReader& in);

    bool isNull() const noexcept { return dataType == TYPE_NULL; }
    bool isString() const noexcept { return dataType == TYPE_STRING; }
    bool isReference() const noexcept {
        return dataType == TYPE_REFERENCE || dataType == TYPE_DYNAMIC_REFERENCE;
    }
    bool isInteger() const noexcept {
        return dataType >= TYPE_FIRST_INT && dataType <= TYPE_LAST_INT;
    }

    /**
     * @brief Textual form of the value.
     *
     * Strings are looked up in @p pool (empty if no pool or bad index),
     * references print as "@0x7f010000", attributes as "?0x7f010000",
     * dimensions as "16.0dip", colours as "#aarrggbb".
     */
    std::string format(const StringPool* pool = nullptr) const;
};

/// Decode a complex (dimension or fraction) value to its float magnitude.
float complexToFloat(uint32_t complex);

/// Hex string "0x7f010000" for a resource id.
std::string formatResourceId(uint32_t id);

}  // namespace libapk

#endif  // LIBAPK_CHUNK_H
