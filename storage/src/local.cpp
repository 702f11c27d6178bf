#include <cumulus/storage/local.hpp>

#include <cumulus/common/exceptions.hpp>

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace fs = std::filesystem;

namespace cumulus::storage {

  LocalStorage::LocalStorage(const fs::path& storage_root, std::string bucket)
      : ObjectStorage(std::move(bucket)), _location(storage_root / _bucket)
  {
    std::error_code ec;
    fs::create_directories(_location, ec);
    if (ec) {
      throw common::StorageError{
          fmt::format("Could not create storage location {}: {}", _location.string(), ec.message())};
    }
  }

  fs::path LocalStorage::_path(const std::string& key) const
  {
    fs::path relative = fs::path{key}.lexically_normal();
    if (key.empty() || relative.is_absolute() || relative.begin()->string() == "..") {
      throw common::StorageError{fmt::format("Invalid object key {}", key)};
    }
    return _location / relative;
  }

  void LocalStorage::put(const std::string& key, const std::string& data)
  {
    fs::path full_path = _path(key);
    fs::create_directories(full_path.parent_path());

    // Readers must never observe a partially written object.
    fs::path tmp_path = full_path;
    tmp_path += fmt::format(".tmp.{}", getpid());

    {
      std::ofstream out_file(tmp_path, std::ios::binary | std::ios::trunc);
      if (!out_file) {
        throw common::StorageError{
            fmt::format("Unable to open file for writing: {}", tmp_path.string())};
      }
      out_file.write(data.data(), data.size());
      if (!out_file) {
        throw common::StorageError{fmt::format("Unable to write to file: {}", tmp_path.string())};
      }
    }

    std::error_code ec;
    fs::rename(tmp_path, full_path, ec);
    if (ec) {
      fs::remove(tmp_path, ec);
      throw common::StorageError{fmt::format("Unable to store object {}", key)};
    }

    SPDLOG_DEBUG("Stored object {}, size {}", key, data.size());
  }

  std::string LocalStorage::get(const std::string& key, std::optional<ByteRange> range)
  {
    fs::path full_path = _path(key);
    if (!fs::is_regular_file(full_path)) {
      throw common::ObjectDoesNotExist{key};
    }

    std::ifstream in_file{full_path, std::ios::in | std::ios::binary};
    if (!in_file) {
      throw common::StorageError{fmt::format("Couldn't read from file {}!", full_path.string())};
    }

    size_t size = fs::file_size(full_path);
    size_t offset = 0;
    size_t length = size;
    if (range.has_value()) {
      if (range->first > range->last) {
        throw common::StorageError{
            fmt::format("Invalid byte range {}-{} for {}", range->first, range->last, key)};
      }
      offset = std::min(range->first, size);
      length = std::min(range->length(), size - offset);
    }

    std::string data;
    data.resize(length);
    in_file.seekg(offset);
    in_file.read(data.data(), length);
    if (static_cast<size_t>(in_file.gcount()) != length) {
      throw common::StorageError{
          fmt::format("Couldn't read {} bytes from file {}!", length, full_path.string())};
    }

    return data;
  }

  std::vector<std::string> LocalStorage::list(const std::string& prefix)
  {
    std::vector<std::string> keys;
    for (const auto& entry : fs::recursive_directory_iterator(_location)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::string key = entry.path().lexically_relative(_location).generic_string();
      if (key.compare(0, prefix.length(), prefix) == 0) {
        keys.emplace_back(std::move(key));
      }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
  }

  void LocalStorage::remove(const std::string& key)
  {
    std::error_code ec;
    fs::remove(_path(key), ec);
    if (ec) {
      throw common::StorageError{fmt::format("Could not remove {}: {}", key, ec.message())};
    }
  }

} // namespace cumulus::storage
