#ifndef LIBAPK_ICON_H
#define LIBAPK_ICON_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "errors.hpp"

namespace libapk {

/**
 * @struct Image
 * @brief A decoded bitmap, 8-bit RGBA, rows top to bottom without padding.
 */
struct Image {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;  ///< width * height * 4 bytes
};

/// True if @p data starts with the PNG signature.
bool isPng(const uint8_t* data, size_t size);

/**
 * @brief Decode a PNG stream into RGBA.
 *
 * Palette, grayscale, 16-bit and interlaced images are expanded to 8-bit
 * RGBA; images without alpha get an opaque alpha channel.
 *
 * @throws FormatError if the stream is not a valid PNG
 */
Image decodePng(const uint8_t* data, size_t size);

}  // namespace libapk

#endif  // LIBAPK_ICON_H
