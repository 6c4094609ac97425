#include "digest.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <openssl/evp.h>

namespace libapk {

// ============================================================================
// CONTENT DIGEST
// ============================================================================

std::string md5File(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IOError("Cannot open file for hashing: " + path);
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw IOError("Cannot initialise MD5 digest");
  }

  std::vector<char> buffer(64 * 1024);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = in.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) !=
            1) {
      throw IOError("MD5 update failed for " + path);
    }
  }
  if (in.bad()) {
    throw IOError("Read failed while hashing " + path);
  }

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
    throw IOError("MD5 finalisation failed for " + path);
  }

  std::ostringstream hex;
  for (unsigned int i = 0; i < md_len; ++i) {
    hex << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(md[i]);
  }
  return hex.str();
}

// ============================================================================
// KEYTOOL OUTPUT
// ============================================================================

std::string normalizeDigest(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ':') {
      continue;
    }
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

SignatureDigests parseKeytoolOutput(const std::string &output) {
  static const struct {
    const char *marker;
    std::string SignatureDigests::*field;
  } kMarkers[] = {
      {"MD5:", &SignatureDigests::md5},
      {"SHA1:", &SignatureDigests::sha1},
      {"SHA256:", &SignatureDigests::sha256},
  };

  SignatureDigests digests;
  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    for (const auto &m : kMarkers) {
      const size_t pos = line.find(m.marker);
      if (pos != std::string::npos) {
        digests.*(m.field) =
            normalizeDigest(line.substr(pos + std::strlen(m.marker)));
      }
    }
  }
  return digests;
}

// ============================================================================
// KEYTOOL PROCESS
// ============================================================================

namespace {

class UniqueFd {
public:
  explicit UniqueFd(int fd = -1) : mFd(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  int get() const { return mFd; }

  void reset(int fd = -1) {
    if (mFd >= 0) {
      close(mFd);
    }
    mFd = fd;
  }

private:
  int mFd;
};

int64_t elapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // namespace

KeytoolSignatureExtractor::KeytoolSignatureExtractor(
    std::string keytool_path, std::chrono::milliseconds timeout)
    : mKeytoolPath(std::move(keytool_path)), mTimeout(timeout) {}

std::string KeytoolSignatureExtractor::run(const std::string &path) const {
  int out_pipe[2];
  // Close-on-exec keeps the pipe out of children forked concurrently by
  // other threads; dup2 clears the flag on the child's stdout.
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw ToolUnavailableError(std::string("pipe failed: ") +
                               std::strerror(errno));
  }
  UniqueFd read_fd(out_pipe[0]);
  UniqueFd write_fd(out_pipe[1]);

  std::vector<const char *> args = {mKeytoolPath.c_str(), "-printcert",
                                    "-jarfile", path.c_str(), nullptr};

  const pid_t pid = fork();
  if (pid < 0) {
    throw ToolUnavailableError(std::string("fork failed: ") +
                               std::strerror(errno));
  }
  if (pid == 0) {
    int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
      dup2(null_fd, STDERR_FILENO);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    close(out_pipe[0]);
    execvp(args[0], const_cast<char *const *>(args.data()));
    _exit(127);
  }
  write_fd.reset();

  std::string output;
  bool timed_out = false;
  const auto start = std::chrono::steady_clock::now();
  char buf[4096];
  for (;;) {
    int wait_ms = -1;
    if (mTimeout.count() > 0) {
      const int64_t left = mTimeout.count() - elapsedMs(start);
      if (left <= 0) {
        timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left);
    }

    pollfd pfd = {read_fd.get(), POLLIN, 0};
    const int ready = poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      throw ToolUnavailableError(std::string("poll failed: ") +
                                 std::strerror(errno));
    }
    if (ready == 0) {
      timed_out = true;
      break;
    }

    const ssize_t n = read(read_fd.get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int saved = errno;
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      throw ToolUnavailableError(std::string("read failed: ") +
                                 std::strerror(saved));
    }
    if (n == 0) {
      break;
    }
    output.append(buf, static_cast<size_t>(n));
  }

  if (timed_out) {
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    throw ToolUnavailableError(mKeytoolPath + " timed out after " +
                               std::to_string(mTimeout.count()) + " ms");
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw ToolUnavailableError(std::string("waitpid failed: ") +
                                 std::strerror(errno));
    }
  }
  if (WIFSIGNALED(status)) {
    throw ToolUnavailableError(mKeytoolPath + " was killed by signal " +
                               std::to_string(WTERMSIG(status)));
  }
  if (WEXITSTATUS(status) == 127) {
    throw ToolUnavailableError("Cannot run " + mKeytoolPath);
  }
  if (WEXITSTATUS(status) != 0) {
    throw ToolUnavailableError(mKeytoolPath + " exited with status " +
                               std::to_string(WEXITSTATUS(status)));
  }
  return output;
}

Result<SignatureDigests>
KeytoolSignatureExtractor::extractDigests(const std::string &path) {
  if (mKeytoolPath.empty()) {
    return Result<SignatureDigests>::success(SignatureDigests());
  }
  try {
    return Result<SignatureDigests>::success(parseKeytoolOutput(run(path)));
  } catch (const ToolUnavailableError &e) {
    return Result<SignatureDigests>::failure(e.what());
  }
}

} // namespace libapk
