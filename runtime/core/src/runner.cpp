#include <cumulus/runtime/runner.hpp>

#include <cumulus/common/exceptions.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>

#include <cereal/archives/json.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

namespace cumulus::runtime::jobrunner {

  void Config::write(const std::filesystem::path& path) const
  {
    std::ofstream out{path, std::ios::out | std::ios::trunc};
    if (!out.is_open()) {
      throw common::CumulusException{
          fmt::format("Could not open runner configuration {}", path.string())};
    }
    {
      cereal::JSONOutputArchive archive_out{out};
      archive_out(cereal::make_nvp("jobrunner", *this));
    }
    out.close();
    if (!out) {
      throw common::CumulusException{
          fmt::format("Could not write runner configuration {}", path.string())};
    }
  }

  Config Config::read(const std::filesystem::path& path)
  {
    std::ifstream in{path};
    if (!in.is_open()) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not open runner configuration {}", path.string())};
    }

    Config cfg;
    try {
      cereal::JSONInputArchive archive_in{in};
      archive_in(cereal::make_nvp("jobrunner", cfg));
    } catch (cereal::Exception& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse runner configuration, reason: {}", exc.what())};
    }
    return cfg;
  }

  void CompletionToken::send(int fd)
  {
    CompletionToken token;
    ssize_t written = 0;
    do {
      written = ::write(fd, &token, sizeof(token));
    } while (written == -1 && errno == EINTR);

    // Tokens are smaller than PIPE_BUF, so writes are atomic.
    if (written != sizeof(token)) {
      throw common::CumulusException{
          fmt::format("Could not send completion token, errno {}, reason {}", errno, strerror(errno))};
    }
  }

  bool CompletionToken::receive(int fd)
  {
    CompletionToken token;
    token.magic = 0;

    ssize_t read_bytes = 0;
    do {
      read_bytes = ::read(fd, &token, sizeof(token));
    } while (read_bytes == -1 && errno == EINTR);

    if (read_bytes == -1) {
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        spdlog::error("Reading completion token failed, errno {}, reason {}", errno, strerror(errno));
      }
      return false;
    }

    return read_bytes == sizeof(token) && token.magic == MAGIC;
  }

} // namespace cumulus::runtime::jobrunner
