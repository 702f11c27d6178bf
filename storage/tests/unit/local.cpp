#include <cumulus/common/exceptions.hpp>
#include <cumulus/storage/local.hpp>

#include <filesystem>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <unistd.h>

using namespace cumulus::storage;

class LocalStorageTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    root = std::filesystem::temp_directory_path() / fmt::format("cumulus-storage-test-{}", getpid());
    std::filesystem::remove_all(root);
    storage = std::make_unique<LocalStorage>(root, "bucket");
  }

  void TearDown() override
  {
    storage.reset();
    std::filesystem::remove_all(root);
  }

  std::filesystem::path root;
  std::unique_ptr<LocalStorage> storage;
};

TEST_F(LocalStorageTest, PutGet)
{
  storage->put("jobs/A000/status.json", "{\"exception\": false}");

  EXPECT_TRUE(std::filesystem::is_regular_file(root / "bucket" / "jobs" / "A000" / "status.json"));
  EXPECT_EQ(storage->get("jobs/A000/status.json"), "{\"exception\": false}");

  // Overwrite
  storage->put("jobs/A000/status.json", "new");
  EXPECT_EQ(storage->get("jobs/A000/status.json"), "new");
}

TEST_F(LocalStorageTest, ByteRange)
{
  storage->put("data", "0123456789");

  EXPECT_EQ(storage->get("data", ByteRange{2, 5}), "2345");
  EXPECT_EQ(storage->get("data", ByteRange{0, 0}), "0");
  // Range extends past the end of the object.
  EXPECT_EQ(storage->get("data", ByteRange{8, 20}), "89");
}

TEST_F(LocalStorageTest, MissingObject)
{
  EXPECT_THROW(storage->get("missing"), cumulus::common::ObjectDoesNotExist);
}

TEST_F(LocalStorageTest, InvalidKeys)
{
  EXPECT_THROW(storage->put("", "data"), cumulus::common::StorageError);
  EXPECT_THROW(storage->put("/etc/passwd", "data"), cumulus::common::StorageError);
  EXPECT_THROW(storage->put("../escape", "data"), cumulus::common::StorageError);
}

TEST_F(LocalStorageTest, ListRemove)
{
  storage->put("exec/job/00001/output.pickle", "1");
  storage->put("exec/job/00000/output.pickle", "0");
  storage->put("other/key", "2");

  auto keys = storage->list("exec/");
  ASSERT_EQ(keys.size(), 2);
  EXPECT_EQ(keys[0], "exec/job/00000/output.pickle");
  EXPECT_EQ(keys[1], "exec/job/00001/output.pickle");

  storage->remove("other/key");
  EXPECT_THROW(storage->get("other/key"), cumulus::common::ObjectDoesNotExist);

  storage->remove(keys);
  EXPECT_TRUE(storage->list("").empty());
}

TEST_F(LocalStorageTest, Construct)
{
  config::Storage cfg;
  cfg.set_defaults();
  cfg.bucket = "other";
  cfg.localhost.storage_root = root.string();

  auto constructed = ObjectStorage::construct(cfg);
  ASSERT_NE(constructed, nullptr);
  EXPECT_EQ(constructed->bucket(), "other");

  constructed->put("key", "value");
  EXPECT_EQ(LocalStorage(root, "other").get("key"), "value");
}
