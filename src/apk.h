/**
 * @file apk.h
 * @brief C language binding for libapk.
 *
 * This header provides a C API for reading the metadata of an Android
 * application package and for converting binary XML documents to text.
 * It's suitable for use in C projects, C++ projects avoiding C++ exceptions,
 * or language bindings to other languages.
 *
 * @defgroup CBinding C Language Binding
 * @brief Complete C API for APK metadata extraction.
 *
 * The C API provides:
 * - Opaque handle to the extracted metadata
 * - Error codes for all operations
 * - Thread-safe error reporting via thread-local storage
 * - In-memory binary XML conversion
 *
 * @section usage_overview Quick Start
 *
 * ### Read the metadata of an APK:
 * @code
 * apk_error_t err;
 * apk_info_t* info = apk_parse("app.apk", NULL, &err);
 * if (err != APK_OK) {
 *     fprintf(stderr, "Error: %s\n", apk_get_last_error());
 *     return 1;
 * }
 * printf("%s %s\n", apk_info_bundle_id(info), apk_info_version(info));
 * apk_info_free(info);
 * @endcode
 *
 * ### Convert a binary XML buffer to text:
 * @code
 * apk_error_t err = APK_OK;
 * size_t needed = apk_convert_axml_buffer_to_xml(data, length, NULL, 0, &err);
 * char* xml = malloc(needed);
 * apk_convert_axml_buffer_to_xml(data, length, xml, needed, &err);
 * @endcode
 */

#ifndef LIBAPK_C_API_H
#define LIBAPK_C_API_H

/**
 * THREAD SAFETY:
 * ==============
 * - apk_info_t handles are immutable after apk_parse() and may be read from
 *   several threads
 * - Error messages are stored in thread-local storage
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @typedef apk_info_t
 * @brief Opaque handle to extracted metadata.
 *
 * Created with apk_parse(). Must be freed with apk_info_free().
 */
typedef struct apk_info apk_info_t;

/**
 * @defgroup ErrorHandling Error Codes and Handling
 * @{
 */

/**
 * @enum apk_error_t
 * @brief Error codes returned by libapk C functions.
 *
 * Success is APK_OK, errors are negative values.
 */
typedef enum {
    APK_OK = 0,                       ///< Operation completed successfully
    APK_ERROR_NULL_POINTER = -1,      ///< NULL pointer passed as argument
    APK_ERROR_INVALID_HANDLE = -2,    ///< Invalid handle
    APK_ERROR_FILE_NOT_FOUND = -3,    ///< File does not exist or cannot be read
    APK_ERROR_INVALID_FORMAT = -4,    ///< Not an APK, bad archive or malformed binary data
    APK_ERROR_TRUNCATED = -5,         ///< Binary data ended in the middle of a chunk
    APK_ERROR_BUFFER_TOO_SMALL = -6,  ///< Output buffer too small for result
    APK_ERROR_INDEX_OUT_OF_RANGE = -7,///< Index past the end of a list
    APK_ERROR_OUT_OF_MEMORY = -9,     ///< Memory allocation failed
    APK_ERROR_UNKNOWN = -100          ///< Unknown error (check apk_get_last_error() for details)
} apk_error_t;

/**
 * @brief Get the last error message.
 *
 * @return Pointer to error message string, or NULL if no error has occurred
 * @note The returned pointer is valid until the next libapk call on this thread
 */
const char* apk_get_last_error(void);

/** @} */

/**
 * @defgroup ExtractOptions Extraction Options
 * @{
 */

/**
 * @typedef apk_warning_callback_t
 * @brief Callback for non-fatal conditions during extraction.
 *
 * @param category Category of warning (e.g., "label", "icon", "signature")
 * @param message Descriptive message about the warning
 * @param user_data The apk_options_t::user_data pointer
 */
typedef void (*apk_warning_callback_t)(const char* category, const char* message, void* user_data);

/**
 * @struct apk_options_t
 * @brief Options for apk_parse(). NULL is equivalent to all fields zero.
 */
typedef struct {
    /** keytool executable; NULL or "" skips signature extraction. */
    const char* keytool_path;
    /** If non-zero, resolve and decode the launcher icon. */
    int decode_icon;
    /** Density requested for the icon; 0 means 720. */
    uint16_t icon_density;
    /** Locale for the display name ("en", "en-rUS"); NULL for none. */
    const char* locale;
    /** keytool timeout in milliseconds; 0 waits indefinitely. */
    long tool_timeout_ms;
    /** Optional warning callback. */
    apk_warning_callback_t warning_callback;
    /** Passed to warning_callback. */
    void* user_data;
} apk_options_t;

/** @} */

/**
 * @defgroup ParseAPI Metadata API
 * @{
 */

/**
 * @brief Extract the metadata of an APK.
 *
 * @param path Path of the package; must end in ".apk"
 * @param options Optional options, NULL for defaults
 * @param error Optional pointer to receive the error code
 * @return Handle on success, NULL on failure
 */
apk_info_t* apk_parse(const char* path, const apk_options_t* options, apk_error_t* error);

/** @brief Free a handle returned by apk_parse(). NULL is ignored. */
void apk_info_free(apk_info_t* info);

/** @name String fields
 * Each returns a NUL-terminated string owned by @p info ("" when empty),
 * or NULL for a NULL handle.
 * @{
 */
const char* apk_info_name(const apk_info_t* info);
const char* apk_info_bundle_id(const apk_info_t* info);
const char* apk_info_version(const apk_info_t* info);
const char* apk_info_md5(const apk_info_t* info);
const char* apk_info_signature_md5(const apk_info_t* info);
const char* apk_info_signature_sha1(const apk_info_t* info);
const char* apk_info_signature_sha256(const apk_info_t* info);
/** @} */

/** @brief Version code (versionCodeMajor in the upper 32 bits). */
int64_t apk_info_build(const apk_info_t* info);

/** @brief Archive size in bytes. */
uint64_t apk_info_size(const apk_info_t* info);

/** @brief Non-zero if the package runs on 64-bit ABIs. */
int apk_info_support_os64(const apk_info_t* info);

/** @brief Non-zero if the package runs on 32-bit ABIs. */
int apk_info_support_os32(const apk_info_t* info);

/** @brief Number of uses-permission entries. */
size_t apk_info_permission_count(const apk_info_t* info);

/**
 * @brief Permission name at @p index, in declaration order.
 * @return The name, or NULL if @p index is out of range
 */
const char* apk_info_permission(const apk_info_t* info, size_t index);

/**
 * @brief Decoded icon pixels (RGBA, 4 bytes per pixel).
 *
 * @param info Handle
 * @param width Optional pointer receiving the width
 * @param height Optional pointer receiving the height
 * @return Pixel data owned by @p info, or NULL if no icon was decoded
 */
const uint8_t* apk_info_icon_pixels(const apk_info_t* info, uint32_t* width, uint32_t* height);

/** @} */

/**
 * @defgroup ConvertAPI Binary XML Conversion
 * @{
 */

/**
 * @brief Convert a binary XML document to text XML.
 *
 * @param data Binary XML bytes
 * @param length Number of bytes
 * @param out_buffer Destination, or NULL to query the size
 * @param buffer_size Size of @p out_buffer
 * @param error Optional pointer to receive the error code
 * @return Bytes required including the NUL terminator, 0 on failure. The
 *         text is written only if @p buffer_size is large enough; otherwise
 *         @p error is set to APK_ERROR_BUFFER_TOO_SMALL.
 */
size_t apk_convert_axml_buffer_to_xml(const uint8_t* data, size_t length, char* out_buffer,
                                      size_t buffer_size, apk_error_t* error);

/** @} */

#ifdef __cplusplus
}
#endif

#endif  // LIBAPK_C_API_H
