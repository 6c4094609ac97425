#include "digest.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "test_builders.hpp"

using namespace libapk;

static const char kKeytoolOutput[] =
    "Signer #1:\n"
    "\n"
    "Signature:\n"
    "\n"
    "Owner: CN=Example, OU=Mobile, O=Example, L=Unknown, ST=Unknown, C=US\n"
    "Issuer: CN=Example, OU=Mobile, O=Example, L=Unknown, ST=Unknown, C=US\n"
    "Certificate fingerprints:\n"
    "\t MD5:  AB:CD:EF:01:23:45:67:89:AB:CD:EF:01:23:45:67:89\n"
    "\t SHA1: 01:23:45:67:89:AB:CD:EF:01:23:45:67:89:AB:CD:EF:01:23:45:67\n"
    "\t SHA256: FF:EE:DD:CC:BB:AA:99:88:77:66:55:44:33:22:11:00:"
    "FF:EE:DD:CC:BB:AA:99:88:77:66:55:44:33:22:11:00\n"
    "Signature algorithm name: SHA256withRSA\n";

// Writes an executable shell script standing in for keytool.
static std::string writeScript(const std::string& name, const std::string& body) {
  std::string path = apktest::tempPath(name);
  {
    std::ofstream out(path, std::ios::trunc);
    out << "#!/bin/sh\n" << body;
  }
  chmod(path.c_str(), 0755);
  return path;
}

TEST(digest, Md5File) {
  std::string path = apktest::tempPath("abc.txt");
  apktest::writeFile(path, {'a', 'b', 'c'});
  ASSERT_EQ("900150983cd24fb0d6963f7d28e17f72", md5File(path));
}

TEST(digest, Md5EmptyFile) {
  std::string path = apktest::tempPath("empty.txt");
  apktest::writeFile(path, {});
  ASSERT_EQ("d41d8cd98f00b204e9800998ecf8427e", md5File(path));
}

TEST(digest, Md5LargeFile) {
  // Spans several read buffers.
  std::string path = apktest::tempPath("large.bin");
  apktest::writeFile(path, apktest::Bytes(200 * 1024, 'a'));
  std::string digest = md5File(path);
  ASSERT_EQ(32u, digest.size());
  ASSERT_EQ(digest, md5File(path));
}

TEST(digest, Md5MissingFile) {
  ASSERT_THROW(md5File(apktest::tempPath("missing.bin")), IOError);
}

TEST(digest, NormalizeDigest) {
  ASSERT_EQ("abcdef01", normalizeDigest("  AB:CD:EF:01"));
  ASSERT_EQ("abcdef01", normalizeDigest("\tab:cd:ef:01\r\n"));
  ASSERT_EQ("", normalizeDigest(""));
}

TEST(digest, ParseKeytoolOutput) {
  SignatureDigests digests = parseKeytoolOutput(kKeytoolOutput);
  ASSERT_EQ("abcdef0123456789abcdef0123456789", digests.md5);
  ASSERT_EQ("0123456789abcdef0123456789abcdef01234567", digests.sha1);
  ASSERT_EQ("ffeeddccbbaa99887766554433221100ffeeddccbbaa99887766554433221100", digests.sha256);
}

TEST(digest, ParseKeytoolOutputMissingLines) {
  SignatureDigests digests = parseKeytoolOutput("MD5:  AB:CD:EF:01\nnothing else\n");
  ASSERT_EQ("abcdef01", digests.md5);
  ASSERT_EQ("", digests.sha1);
  ASSERT_EQ("", digests.sha256);
}

TEST(digest, ParseKeytoolOutputLastSignerWins) {
  SignatureDigests digests = parseKeytoolOutput("MD5: 11:11\nMD5: 22:22\n");
  ASSERT_EQ("2222", digests.md5);
}

TEST(digest, EmptyKeytoolPath) {
  KeytoolSignatureExtractor extractor("");
  Result<SignatureDigests> result = extractor.extractDigests("app.apk");
  ASSERT_TRUE(result.ok());
  ASSERT_EQ("", result.value().md5);
  ASSERT_EQ("", result.value().sha256);
}

TEST(digest, KeytoolScript) {
  std::string output_path = apktest::tempPath("keytool-output.txt");
  {
    std::ofstream out(output_path, std::ios::trunc);
    out << kKeytoolOutput;
  }
  std::string keytool = writeScript("keytool-ok.sh", "cat '" + output_path + "'\n");

  KeytoolSignatureExtractor extractor(keytool, std::chrono::milliseconds(10000));
  Result<SignatureDigests> result = extractor.extractDigests("app.apk");
  ASSERT_TRUE(result.ok()) << result.error();
  ASSERT_EQ("0123456789abcdef0123456789abcdef01234567", result.value().sha1);
}

TEST(digest, KeytoolArguments) {
  std::string keytool = writeScript("keytool-args.sh", "echo \"MD5: $1 $2 $3\"\n");
  KeytoolSignatureExtractor extractor(keytool);
  ASSERT_EQ("MD5: -printcert -jarfile app.apk\n", extractor.run("app.apk"));
}

TEST(digest, KeytoolMissing) {
  KeytoolSignatureExtractor extractor(apktest::tempPath("no-such-keytool"));
  Result<SignatureDigests> result = extractor.extractDigests("app.apk");
  ASSERT_FALSE(result.ok());
  ASSERT_EQ(0u, result.error().find("Cannot run"));
  ASSERT_THROW(extractor.run("app.apk"), ToolUnavailableError);
}

TEST(digest, KeytoolFailure) {
  std::string keytool = writeScript("keytool-fail.sh", "echo 'keytool error'\nexit 1\n");
  KeytoolSignatureExtractor extractor(keytool);
  Result<SignatureDigests> result = extractor.extractDigests("app.apk");
  ASSERT_FALSE(result.ok());
  ASSERT_NE(std::string::npos, result.error().find("status 1"));
}

TEST(digest, KeytoolTimeout) {
  std::string keytool = writeScript("keytool-slow.sh", "exec sleep 30\n");
  KeytoolSignatureExtractor extractor(keytool, std::chrono::milliseconds(200));

  const auto start = std::chrono::steady_clock::now();
  Result<SignatureDigests> result = extractor.extractDigests("app.apk");
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(result.ok());
  ASSERT_NE(std::string::npos, result.error().find("timed out"));
  ASSERT_LT(elapsed, std::chrono::seconds(10));
}

TEST(digest, ConcurrentExtractions) {
  // Each run closes its stdout early and lingers, so a pipe leaked into a
  // sibling's child would hold off end-of-file past the timeout.
  std::string keytool = writeScript("keytool-linger.sh", "echo 'MD5: AB:CD'\nexec 1>&-\nsleep 1\n");

  const int kThreads = 8;
  std::vector<std::string> failures(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      KeytoolSignatureExtractor extractor(keytool, std::chrono::milliseconds(500));
      for (int i = 0; i < 3; ++i) {
        Result<SignatureDigests> result = extractor.extractDigests("app.apk");
        if (!result.ok()) {
          failures[t] = result.error();
          return;
        }
        if (result.value().md5 != "abcd") {
          failures[t] = "unexpected digest " + result.value().md5;
          return;
        }
      }
    });
  }
  for (std::thread& thread : threads) thread.join();

  for (const std::string& failure : failures) {
    ASSERT_EQ("", failure);
  }
}
