#ifndef CUMULUS_STORAGE_STORAGE_HPP
#define CUMULUS_STORAGE_STORAGE_HPP

#include <cumulus/storage/config.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cumulus::storage {

  // Inclusive range of bytes, as in an HTTP Range header.
  struct ByteRange {
    size_t first;
    size_t last;

    size_t length() const
    {
      return last - first + 1;
    }
  };

  struct ObjectStorage {

    virtual ~ObjectStorage() = default;

    virtual void put(const std::string& key, const std::string& data) = 0;

    /**
     * @brief Retrieves the object, or the slice of it when a range is given.
     *
     * @throws ObjectDoesNotExist when the key is absent
     */
    virtual std::string get(const std::string& key, std::optional<ByteRange> range = std::nullopt) = 0;

    virtual std::vector<std::string> list(const std::string& prefix) = 0;

    virtual void remove(const std::string& key) = 0;

    virtual void remove(const std::vector<std::string>& keys)
    {
      for (const auto& key : keys) {
        remove(key);
      }
    }

    const std::string& bucket() const
    {
      return _bucket;
    }

    static std::unique_ptr<ObjectStorage> construct(const config::Storage& cfg);

  protected:
    ObjectStorage(std::string bucket) : _bucket(std::move(bucket)) {}

    std::string _bucket;
  };

} // namespace cumulus::storage

#endif
