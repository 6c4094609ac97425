#include "apk.h"
#include "apk.hpp"

#include <cstring>
#include <memory>
#include <new>
#include <string>


thread_local std::string g_last_error;


static apk_error_t set_error(apk_error_t code, const std::string& msg) {
    g_last_error = msg;
    return code;
}


static void clear_error() {
    g_last_error.clear();
}


static apk_error_t handle_exception(const std::exception& e) {
    g_last_error = e.what();
    if (dynamic_cast<const libapk::IOError*>(&e)) {
        return APK_ERROR_FILE_NOT_FOUND;
    }
    if (dynamic_cast<const libapk::TruncatedInputError*>(&e)) {
        return APK_ERROR_TRUNCATED;
    }
    if (dynamic_cast<const libapk::FormatError*>(&e)) {
        return APK_ERROR_INVALID_FORMAT;
    }
    if (dynamic_cast<const std::bad_alloc*>(&e)) {
        return APK_ERROR_OUT_OF_MEMORY;
    }
    return APK_ERROR_UNKNOWN;
}

// ============================================================================
// INTERNAL STRUCTURES
// ============================================================================

struct apk_info {
    libapk::ApkInfo info;
};

// ============================================================================
// ERROR HANDLING
// ============================================================================

extern "C" const char* apk_get_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

// ============================================================================
// METADATA
// ============================================================================

extern "C" apk_info_t* apk_parse(const char* path, const apk_options_t* options, apk_error_t* error) {
    if (!path) {
        apk_error_t code = set_error(APK_ERROR_NULL_POINTER, "path is null");
        if (error) *error = code;
        return nullptr;
    }

    try {
        clear_error();
        libapk::ExtractOptions opts;
        if (options) {
            if (options->keytool_path) opts.keytool_path = options->keytool_path;
            opts.decode_icon = options->decode_icon != 0;
            if (options->icon_density != 0) opts.icon_density = options->icon_density;
            if (options->locale) opts.locale = options->locale;
            opts.tool_timeout = std::chrono::milliseconds(options->tool_timeout_ms);
            if (options->warning_callback) {
                apk_warning_callback_t callback = options->warning_callback;
                void* user_data = options->user_data;
                opts.warning_callback = [callback, user_data](const std::string& category,
                                                              const std::string& message) {
                    callback(category.c_str(), message.c_str(), user_data);
                };
            }
        }

        std::unique_ptr<apk_info> handle(new apk_info);
        handle->info = libapk::parseApk(path, opts);

        if (error) *error = APK_OK;
        return handle.release();
    } catch (const std::exception& e) {
        apk_error_t code = handle_exception(e);
        if (error) *error = code;
        return nullptr;
    }
}

extern "C" void apk_info_free(apk_info_t* info) {
    delete info;
}

extern "C" const char* apk_info_name(const apk_info_t* info) {
    return info ? info->info.name.c_str() : nullptr;
}

extern "C" const char* apk_info_bundle_id(const apk_info_t* info) {
    return info ? info->info.bundle_id.c_str() : nullptr;
}

extern "C" const char* apk_info_version(const apk_info_t* info) {
    return info ? info->info.version.c_str() : nullptr;
}

extern "C" const char* apk_info_md5(const apk_info_t* info) {
    return info ? info->info.md5.c_str() : nullptr;
}

extern "C" const char* apk_info_signature_md5(const apk_info_t* info) {
    return info ? info->info.signature_md5.c_str() : nullptr;
}

extern "C" const char* apk_info_signature_sha1(const apk_info_t* info) {
    return info ? info->info.signature_sha1.c_str() : nullptr;
}

extern "C" const char* apk_info_signature_sha256(const apk_info_t* info) {
    return info ? info->info.signature_sha256.c_str() : nullptr;
}

extern "C" int64_t apk_info_build(const apk_info_t* info) {
    return info ? info->info.build : 0;
}

extern "C" uint64_t apk_info_size(const apk_info_t* info) {
    return info ? info->info.size : 0;
}

extern "C" int apk_info_support_os64(const apk_info_t* info) {
    return info && info->info.support_os64 ? 1 : 0;
}

extern "C" int apk_info_support_os32(const apk_info_t* info) {
    return info && info->info.support_os32 ? 1 : 0;
}

extern "C" size_t apk_info_permission_count(const apk_info_t* info) {
    return info ? info->info.uses_permissions.size() : 0;
}

extern "C" const char* apk_info_permission(const apk_info_t* info, size_t index) {
    if (!info) {
        set_error(APK_ERROR_INVALID_HANDLE, "Invalid info handle");
        return nullptr;
    }
    if (index >= info->info.uses_permissions.size()) {
        set_error(APK_ERROR_INDEX_OUT_OF_RANGE, "Permission index out of range");
        return nullptr;
    }
    return info->info.uses_permissions[index].c_str();
}

extern "C" const uint8_t* apk_info_icon_pixels(const apk_info_t* info, uint32_t* width, uint32_t* height) {
    if (!info || !info->info.icon) {
        if (width) *width = 0;
        if (height) *height = 0;
        return nullptr;
    }
    const libapk::Image& image = info->info.icon->image;
    if (width) *width = image.width;
    if (height) *height = image.height;
    return image.pixels.data();
}

// ============================================================================
// BINARY XML CONVERSION
// ============================================================================

extern "C" size_t apk_convert_axml_buffer_to_xml(const uint8_t* data, size_t length, char* out_buffer,
                                                 size_t buffer_size, apk_error_t* error) {
    if (!data) {
        apk_error_t code = set_error(APK_ERROR_NULL_POINTER, "data is null");
        if (error) *error = code;
        return 0;
    }

    try {
        clear_error();
        libapk::XmlDocument doc = libapk::parseBinaryXml(data, length);
        std::string result = libapk::toXmlString(doc, true);
        size_t needed = result.size() + 1;  // +1 for null terminator

        if (out_buffer && buffer_size >= needed) {
            std::memcpy(out_buffer, result.c_str(), needed);
            if (error) *error = APK_OK;
        } else if (out_buffer) {
            apk_error_t code = set_error(APK_ERROR_BUFFER_TOO_SMALL, "Output buffer too small");
            if (error) *error = code;
        } else {
            if (error) *error = APK_OK;
        }
        return needed;
    } catch (const std::exception& e) {
        apk_error_t code = handle_exception(e);
        if (error) *error = code;
        return 0;
    }
}
