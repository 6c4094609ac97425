#ifndef LIBAPK_ERRORS_H
#define LIBAPK_ERRORS_H

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace libapk {

/**
 * @typedef WarningCallback
 * @brief Callback function for non-fatal diagnostics.
 *
 * The callback receives two parameters:
 * - @param category A short category string (e.g. "chunk", "label", "signature")
 * - @param message A descriptive message about the condition
 *
 * The library never writes to stdout or stderr itself; anything that is
 * skipped, degraded or ignored during extraction is reported here.
 *
 * @example
 * @code
 * auto handler = [](const std::string& cat, const std::string& msg) {
 *     std::cerr << "Warning [" << cat << "]: " << msg << std::endl;
 * };
 * @endcode
 */
using WarningCallback =
    std::function<void(const std::string& category, const std::string& message)>;

// ============================================================================
// EXCEPTIONS
// ============================================================================

/**
 * @defgroup Errors Error Types
 * @brief Exception hierarchy thrown by libapk.
 *
 * FormatError, TruncatedInputError and IOError abort an extraction.
 * ResourceError subclasses only concern the resource being resolved, and
 * ToolUnavailableError only concerns the signature digests; the assembler
 * turns those into empty fields.
 * @{
 */

/**
 * @class ApkError
 * @brief Base class of every error raised by the library.
 */
class ApkError : public std::runtime_error {
   public:
    explicit ApkError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @class FormatError
 * @brief Malformed input: wrong extension, missing manifest, bad chunk
 *        header or size, unbalanced nesting, out-of-range pool index.
 */
class FormatError : public ApkError {
   public:
    explicit FormatError(const std::string& msg) : ApkError(msg) {}
};

/**
 * @class TruncatedInputError
 * @brief The byte stream ended in the middle of a chunk or with open
 *        namespace/element scopes.
 */
class TruncatedInputError : public ApkError {
   public:
    explicit TruncatedInputError(const std::string& msg) : ApkError(msg) {}
};

/**
 * @class IOError
 * @brief The archive could not be opened or read.
 */
class IOError : public ApkError {
   public:
    explicit IOError(const std::string& msg) : ApkError(msg) {}
};

/**
 * @class ResourceError
 * @brief A single resource could not be resolved.
 */
class ResourceError : public ApkError {
   public:
    explicit ResourceError(const std::string& msg) : ApkError(msg) {}
};

/**
 * @class ResourceNotFoundError
 * @brief No entry recorded (or matching) for the requested resource id.
 */
class ResourceNotFoundError : public ResourceError {
   public:
    explicit ResourceNotFoundError(const std::string& msg) : ResourceError(msg) {}
};

/**
 * @class ResourceCycleError
 * @brief Reference chain exceeded the maximum indirection depth.
 */
class ResourceCycleError : public ResourceError {
   public:
    explicit ResourceCycleError(const std::string& msg) : ResourceError(msg) {}
};

/**
 * @class ToolUnavailableError
 * @brief The external certificate tool is missing, failed or timed out.
 */
class ToolUnavailableError : public ApkError {
   public:
    explicit ToolUnavailableError(const std::string& msg) : ApkError(msg) {}
};

/** @} */

// ============================================================================
// RESULT
// ============================================================================

/**
 * @class Result
 * @brief Outcome of a best-effort sub-operation.
 *
 * Holds either a value or the message of the error that prevented it.
 * Used where a failure must be captured and reported instead of aborting
 * the whole extraction.
 */
template <typename T>
class Result {
   private:
    std::optional<T> mValue;
    std::string mError;

    Result() = default;

   public:
    static Result success(T value) {
        Result r;
        r.mValue = std::move(value);
        return r;
    }

    static Result failure(std::string error) {
        Result r;
        r.mError = std::move(error);
        return r;
    }

    bool ok() const noexcept { return mValue.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief Access the value.
     * @throws std::logic_error if the result holds an error
     */
    const T& value() const {
        if (!mValue) {
            throw std::logic_error("Result has no value: " + mError);
        }
        return *mValue;
    }

    T& value() {
        if (!mValue) {
            throw std::logic_error("Result has no value: " + mError);
        }
        return *mValue;
    }

    const std::string& error() const noexcept { return mError; }
};

}  // namespace libapk

#endif  // LIBAPK_ERRORS_H
