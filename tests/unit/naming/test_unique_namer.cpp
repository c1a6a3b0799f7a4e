#include <gtest/gtest.h>

#include <mutex>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "depot/naming/unique_namer.hpp"
#include "test_helpers.hpp"

using depot::naming::FileDescriptor;
using depot::naming::NamingPolicy;
using depot::naming::UniqueNamer;

class UniqueNamerTest : public ::testing::Test {
 protected:
  UniqueNamer namer_;

  std::string pathFor(const std::string& name) {
    return namer_.uniquePathname(FileDescriptor{name, std::nullopt, {}}, "target-dir");
  }
};

TEST_F(UniqueNamerTest, AcceptsJpg) {
  EXPECT_TRUE(std::regex_match(pathFor("something.jpg"),
                               std::regex(R"(target-dir/something-[0-9a-f]{16}\.jpg)")));
}

TEST_F(UniqueNamerTest, AcceptsPng) {
  EXPECT_TRUE(std::regex_match(pathFor("something.png"),
                               std::regex(R"(target-dir/something-[0-9a-f]{16}\.png)")));
}

TEST_F(UniqueNamerTest, AcceptsMp4) {
  EXPECT_TRUE(std::regex_match(pathFor("something.mp4"),
                               std::regex(R"(target-dir/something-[0-9a-f]{16}\.mp4)")));
}

TEST_F(UniqueNamerTest, IgnoresInvalidExtension) {
  EXPECT_TRUE(std::regex_match(pathFor("something.1"),
                               std::regex(R"(target-dir/something\.1-[0-9a-f]{16})")));
}

TEST_F(UniqueNamerTest, SanitizesAndDropsPathPrefix) {
  EXPECT_TRUE(std::regex_match(pathFor("uploads/tmp/Holiday (1).JPG"),
                               std::regex(R"(target-dir/Holiday--1--[0-9a-f]{16}\.JPG)")));
}

TEST_F(UniqueNamerTest, PreservesDefaultSuffix) {
  EXPECT_TRUE(std::regex_match(pathFor("photo_o.jpg"),
                               std::regex(R"(target-dir/photo-[0-9a-f]{16}_o\.jpg)")));
}

TEST_F(UniqueNamerTest, SuffixInsideStemIsNotMoved) {
  EXPECT_TRUE(std::regex_match(pathFor("abc_o_123.jpg"),
                               std::regex(R"(target-dir/abc_o_123-[0-9a-f]{16}\.jpg)")));
}

TEST_F(UniqueNamerTest, DescriptorSuffixOverridesPolicy) {
  FileDescriptor file{"avatar_thumb.png", std::string("_thumb"), {}};
  std::string filename = namer_.uniqueFilename(file);
  EXPECT_TRUE(std::regex_match(filename, std::regex(R"(avatar-[0-9a-f]{16}_thumb\.png)")));
}

TEST_F(UniqueNamerTest, PolicySuffixIsConfigurable) {
  NamingPolicy policy;
  policy.default_suffix = "_orig";
  UniqueNamer namer(policy);

  std::string filename = namer.uniqueFilename(FileDescriptor{"cat_orig.gif", std::nullopt, {}});
  EXPECT_TRUE(std::regex_match(filename, std::regex(R"(cat-[0-9a-f]{16}_orig\.gif)")));
}

TEST_F(UniqueNamerTest, LongNamesAreTruncatedToPolicyLimit) {
  std::string long_name(400, 'x');
  long_name += "_o.jpeg";

  std::string filename = namer_.uniqueFilename(FileDescriptor{long_name, std::nullopt, {}});
  EXPECT_EQ(filename.size(), 255u);
  EXPECT_TRUE(std::regex_search(filename, std::regex(R"(x-[0-9a-f]{16}_o\.jpeg$)")));

  NamingPolicy policy;
  policy.max_filename_bytes = 253;
  UniqueNamer reserved(policy);
  EXPECT_EQ(reserved.uniqueFilename(FileDescriptor{long_name, std::nullopt, {}}).size(), 253u);
}

TEST_F(UniqueNamerTest, OversizedDescriptorSuffixStillFitsLimit) {
  std::string marker = "_" + std::string(249, 'm');
  FileDescriptor file{"a" + marker + ".jpg", marker, {}};

  std::string filename = namer_.uniqueFilename(file);
  EXPECT_EQ(filename.size(), 255u);
  EXPECT_TRUE(std::regex_match(filename, std::regex(R"(a_m+-[0-9a-f]{16}\.jpg)")));
}

TEST_F(UniqueNamerTest, SuffixThatFitsIsKeptWhole) {
  std::string marker = "_" + std::string(100, 'm');
  FileDescriptor file{std::string(300, 'p') + marker + ".jpg", marker, {}};

  std::string filename = namer_.uniqueFilename(file);
  EXPECT_EQ(filename.size(), 255u);
  EXPECT_TRUE(filename.ends_with(marker + ".jpg"));
}

TEST_F(UniqueNamerTest, RejectsPolicyWithoutRoomForStem) {
  NamingPolicy policy;
  policy.max_filename_bytes = 20;
  EXPECT_THROW(UniqueNamer{policy}, std::invalid_argument);
}

TEST_F(UniqueNamerTest, EveryCallProducesAFreshName) {
  FileDescriptor file{"same.jpg", std::nullopt, {}};
  EXPECT_NE(namer_.uniqueFilename(file), namer_.uniqueFilename(file));
}

TEST_F(UniqueNamerTest, ConcurrentCallsDoNotCollide) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 250;

  std::mutex mutex;
  std::set<std::string> names;
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      std::vector<std::string> local;
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(namer_.uniquePathname(FileDescriptor{"upload.png", std::nullopt, {}}, "dir"));
      }
      std::lock_guard<std::mutex> lock(mutex);
      names.insert(local.begin(), local.end());
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(names.size(), static_cast<size_t>(kThreads * kPerThread));
}
