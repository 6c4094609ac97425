#ifndef LIBAPK_DIGEST_H
#define LIBAPK_DIGEST_H

#include <chrono>
#include <string>

#include "errors.hpp"

/**
 * @file digest.hpp
 * @brief Whole-file content digest and signing certificate digests.
 */
namespace libapk {

/**
 * @brief MD5 of the whole file as 32 lowercase hex digits.
 * @throws IOError if the file cannot be read
 */
std::string md5File(const std::string& path);

/**
 * @struct SignatureDigests
 * @brief Fingerprints of the signing certificate, lowercase hex without
 *        separators. A field the tool did not print stays empty.
 */
struct SignatureDigests {
    std::string md5;
    std::string sha1;
    std::string sha256;
};

/**
 * @brief Strip spaces, tabs, carriage returns and colons, and lowercase
 *        the rest.
 *
 * @code
 * normalizeDigest("  AB:CD:EF:01");  // "abcdef01"
 * @endcode
 */
std::string normalizeDigest(const std::string& text);

/**
 * @brief Scrape certificate fingerprints from `keytool -printcert` output.
 *
 * Every line containing "MD5:", "SHA1:" or "SHA256:" sets the matching
 * field to the normalised remainder of the line; when a field appears
 * several times (several signers) the last line wins.
 */
SignatureDigests parseKeytoolOutput(const std::string& output);

/**
 * @class SignatureExtractor
 * @brief Source of signing certificate digests for an archive.
 *
 * Implementations report failure in the result instead of throwing so the
 * caller can degrade to empty digest fields.
 */
class SignatureExtractor {
   public:
    virtual ~SignatureExtractor() = default;

    virtual Result<SignatureDigests> extractDigests(const std::string& path) = 0;
};

/**
 * @class KeytoolSignatureExtractor
 * @brief Runs `<keytool> -printcert -jarfile <path>` and parses its output.
 *
 * The child inherits no stdin and its stderr is discarded. When a timeout
 * is set and the tool does not finish in time it is killed.
 */
class KeytoolSignatureExtractor : public SignatureExtractor {
   public:
    /**
     * @param keytool_path Executable name or path, looked up in PATH
     * @param timeout Upper bound for the whole run; zero waits indefinitely
     */
    explicit KeytoolSignatureExtractor(std::string keytool_path,
                                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    Result<SignatureDigests> extractDigests(const std::string& path) override;

    /**
     * @brief Run the tool and return its standard output.
     * @throws ToolUnavailableError if the tool cannot be started, exits with
     *         a non-zero status, is killed by a signal or times out
     */
    std::string run(const std::string& path) const;

   private:
    std::string mKeytoolPath;
    std::chrono::milliseconds mTimeout;
};

}  // namespace libapk

#endif  // LIBAPK_DIGEST_H
