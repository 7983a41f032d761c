#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include "storage/memory_adapter.hpp"
#include "test_utils.hpp"

using namespace fstore::storage;

class MemoryAdapterTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  MemoryAdapter adapter;
};

TEST_F(MemoryAdapterTest, SaveThenLoad) {
  EXPECT_TRUE(adapter.save(FileRecord("key", "Hello, Store!")));
  EXPECT_TRUE(adapter.has("key"));
  EXPECT_EQ(adapter.load("key"), FileRecord("key", "Hello, Store!"));
}

TEST_F(MemoryAdapterTest, SaveOverwrites) {
  adapter.save(FileRecord("key", "first"));
  adapter.save(FileRecord("key", "second"));
  EXPECT_EQ(adapter.size(), 1u);
  EXPECT_EQ(adapter.load("key").content(), std::optional<std::string>("second"));
}

TEST_F(MemoryAdapterTest, AbsentContentStoredAsEmpty) {
  adapter.save(FileRecord("key"));
  EXPECT_EQ(adapter.load("key").content(), std::optional<std::string>(""));
}

TEST_F(MemoryAdapterTest, InitDoesNotPersist) {
  FileRecord file = adapter.init("key", true);
  EXPECT_EQ(file.key(), "key");
  EXPECT_FALSE(file.content().has_value());
  EXPECT_FALSE(adapter.has("key"));
}

TEST_F(MemoryAdapterTest, MissingKeyThrowsNotFound) {
  EXPECT_THROW(adapter.load("missing"), NotFoundError);
  EXPECT_THROW(adapter.remove("missing"), NotFoundError);
}

TEST_F(MemoryAdapterTest, RemoveAndClear) {
  adapter.save(FileRecord("a", "1"));
  adapter.save(FileRecord("b", "2"));

  EXPECT_TRUE(adapter.remove("a"));
  EXPECT_FALSE(adapter.has("a"));
  EXPECT_EQ(adapter.size(), 1u);

  adapter.clear();
  EXPECT_EQ(adapter.size(), 0u);
}

TEST_F(MemoryAdapterTest, ConcurrentSaves) {
  const size_t num_threads = 4;
  const size_t ops_per_thread = 100;
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        std::string key = "concurrent_" + std::to_string(i) + "_" + std::to_string(j);
        adapter.save(FileRecord(key, "Data for " + key));
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(adapter.size(), num_threads * ops_per_thread);
}
