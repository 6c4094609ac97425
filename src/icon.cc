#include "icon.hpp"

#include <csetjmp>
#include <cstring>
#include <string>

#include <png.h>

namespace libapk {

namespace {

constexpr size_t kPngSignatureSize = 8;

struct PngSource {
  const uint8_t *data;
  size_t size;
  size_t pos;
  char error[256];
};

void readDataFromBuffer(png_structp readPtr, png_bytep out,
                        png_size_t length) {
  PngSource *source = reinterpret_cast<PngSource *>(png_get_io_ptr(readPtr));
  if (length > source->size - source->pos) {
    png_error(readPtr, "unexpected end of png data");
  }
  std::memcpy(out, source->data + source->pos, length);
  source->pos += length;
}

void recordError(png_structp readPtr, png_const_charp message) {
  PngSource *source = reinterpret_cast<PngSource *>(png_get_error_ptr(readPtr));
  std::strncpy(source->error, message, sizeof(source->error) - 1);
  source->error[sizeof(source->error) - 1] = '\0';
  png_longjmp(readPtr, 1);
}

void ignoreWarning(png_structp, png_const_charp) {}

// Only trivially destructible locals live in this frame, so unwinding it
// with longjmp is safe. Row storage belongs to the caller.
bool readPng(png_structp readPtr, png_infop infoPtr, Image *out,
             std::vector<png_bytep> *rows) {
  if (setjmp(png_jmpbuf(readPtr))) {
    return false;
  }

  png_set_sig_bytes(readPtr, kPngSignatureSize);
  png_read_info(readPtr, infoPtr);

  png_uint_32 width = 0;
  png_uint_32 height = 0;
  int bitDepth, colorType, interlaceType, compressionType;
  png_get_IHDR(readPtr, infoPtr, &width, &height, &bitDepth, &colorType,
               &interlaceType, &compressionType, nullptr);

  if (colorType == PNG_COLOR_TYPE_PALETTE) {
    png_set_palette_to_rgb(readPtr);
  }
  if (colorType == PNG_COLOR_TYPE_GRAY && bitDepth < 8) {
    png_set_expand_gray_1_2_4_to_8(readPtr);
  }
  if (png_get_valid(readPtr, infoPtr, PNG_INFO_tRNS)) {
    png_set_tRNS_to_alpha(readPtr);
  }
  if (bitDepth == 16) {
    png_set_strip_16(readPtr);
  }
  if (!(colorType & PNG_COLOR_MASK_ALPHA)) {
    png_set_add_alpha(readPtr, 0xFF, PNG_FILLER_AFTER);
  }
  if (colorType == PNG_COLOR_TYPE_GRAY ||
      colorType == PNG_COLOR_TYPE_GRAY_ALPHA) {
    png_set_gray_to_rgb(readPtr);
  }

  png_set_interlace_handling(readPtr);
  png_read_update_info(readPtr, infoPtr);

  if (png_get_rowbytes(readPtr, infoPtr) != static_cast<size_t>(width) * 4) {
    png_error(readPtr, "unexpected row size after expansion to rgba");
  }

  out->width = width;
  out->height = height;
  out->pixels.resize(static_cast<size_t>(width) * height * 4);
  rows->resize(height);
  for (png_uint_32 y = 0; y < height; ++y) {
    (*rows)[y] = out->pixels.data() + static_cast<size_t>(y) * width * 4;
  }

  png_read_image(readPtr, rows->data());
  png_read_end(readPtr, infoPtr);
  return true;
}

} // namespace

bool isPng(const uint8_t *data, size_t size) {
  return size >= kPngSignatureSize &&
         png_sig_cmp(const_cast<png_bytep>(data), 0, kPngSignatureSize) == 0;
}

Image decodePng(const uint8_t *data, size_t size) {
  if (!isPng(data, size)) {
    throw FormatError("Not a PNG stream");
  }

  png_structp readPtr =
      png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!readPtr) {
    throw FormatError("Failed to allocate png read struct");
  }
  png_infop infoPtr = png_create_info_struct(readPtr);
  if (!infoPtr) {
    png_destroy_read_struct(&readPtr, nullptr, nullptr);
    throw FormatError("Failed to allocate png info struct");
  }

  PngSource source = {data, size, kPngSignatureSize, {0}};
  png_set_error_fn(readPtr, &source, recordError, ignoreWarning);
  png_set_read_fn(readPtr, &source, readDataFromBuffer);

  Image image;
  std::vector<png_bytep> rows;
  const bool ok = readPng(readPtr, infoPtr, &image, &rows);
  png_destroy_read_struct(&readPtr, &infoPtr, nullptr);

  if (!ok) {
    throw FormatError(std::string("Failed reading png: ") + source.error);
  }
  return image;
}

} // namespace libapk
