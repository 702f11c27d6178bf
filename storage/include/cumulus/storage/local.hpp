#ifndef CUMULUS_STORAGE_LOCAL_HPP
#define CUMULUS_STORAGE_LOCAL_HPP

#include <cumulus/storage/storage.hpp>

#include <filesystem>

namespace cumulus::storage {

  /**
   * @brief Object storage kept in a directory tree: <storage_root>/<bucket>/<key>.
   * Used by the localhost deployment and by tests.
   */
  struct LocalStorage : ObjectStorage {

    LocalStorage(const std::filesystem::path& storage_root, std::string bucket);
    ~LocalStorage() override = default;

    void put(const std::string& key, const std::string& data) override;

    std::string get(const std::string& key, std::optional<ByteRange> range = std::nullopt) override;

    std::vector<std::string> list(const std::string& prefix) override;

    using ObjectStorage::remove;
    void remove(const std::string& key) override;

    const std::filesystem::path& location() const
    {
      return _location;
    }

  private:
    std::filesystem::path _path(const std::string& key) const;

    std::filesystem::path _location;
  };

} // namespace cumulus::storage

#endif
