//
//  StoreTests.cpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Storage/KeyValue/DirectoryStore.hpp"
#include "Storage/KeyValue/PercentEncoding.hpp"
#include "Storage/KeyValue/SeedDirectory.hpp"
#include "Storage/KeyValue/Store.hpp"
#include "Storage/FileHolder.hpp"

#include <gtest/gtest.h>

#include <zlib.h>

#include <filesystem>
#include <string>

using namespace Storage::KeyValue;

namespace {

/// Provides a fresh, empty host directory for the duration of a test.
class HostDirectoryTest: public ::testing::Test {
protected:
	void SetUp() override {
		const auto info = ::testing::UnitTest::GetInstance()->current_test_info();
		directory_ = std::filesystem::temp_directory_path() /
			(std::string("appledos-") + info->test_suite_name() + "-" + info->name());
		std::filesystem::remove_all(directory_);
		std::filesystem::create_directories(directory_);
	}

	void TearDown() override {
		std::filesystem::remove_all(directory_);
	}

	std::string path() const {
		return directory_.string();
	}

	void write_file(const std::string &name, const std::string &content) {
		Storage::FileHolder file(path() + "/" + name, Storage::FileMode::Rewrite);
		file.write(reinterpret_cast<const uint8_t *>(content.data()), content.size());
	}

private:
	std::filesystem::path directory_;
};

}

// MARK: - MemoryStore.

TEST(MemoryStore, AbsentIsDistinctFromEmpty) {
	MemoryStore store;
	EXPECT_FALSE(store.get("FILE").has_value());

	store.set("FILE", "");
	ASSERT_TRUE(store.get("FILE").has_value());
	EXPECT_TRUE(store.get("FILE")->empty());

	store.remove("FILE");
	store.remove("FILE");
	EXPECT_FALSE(store.get("FILE").has_value());
}

// MARK: - Percent encoding.

TEST(PercentEncoding, UnreservedCharactersAreKept) {
	EXPECT_EQ(percent_encode("A.B"), "A.B");
	EXPECT_EQ(percent_encode("az-09_~"), "az-09_~");
}

TEST(PercentEncoding, EverythingElseIsEscaped) {
	EXPECT_EQ(percent_encode("HELLO WORLD/1"), "HELLO%20WORLD%2F1");
	EXPECT_EQ(percent_encode("100%"), "100%25");
	EXPECT_EQ(percent_encode(std::string("\x00\xff", 2)), "%00%FF");
}

TEST(PercentEncoding, DotNamesDoNotAliasDirectories) {
	EXPECT_EQ(percent_encode("."), "%2E");
	EXPECT_EQ(percent_encode(".."), "%2E.");
	EXPECT_EQ(percent_encode("..."), "...");
}

// MARK: - DirectoryStore.

using DirectoryStoreTest = HostDirectoryTest;

TEST_F(DirectoryStoreTest, RoundTrip) {
	DirectoryStore store(path());
	EXPECT_TRUE(std::filesystem::is_directory(path() + "/vfs"));

	EXPECT_FALSE(store.get("MY FILE").has_value());
	store.set("MY FILE", std::string("LINE\r\0BYTE", 10));
	EXPECT_EQ(store.get("MY FILE").value_or(""), std::string("LINE\r\0BYTE", 10));
	EXPECT_TRUE(std::filesystem::exists(store.path_for("MY FILE")));
	EXPECT_EQ(store.path_for("MY FILE"), path() + "/vfs/MY%20FILE");

	store.set("MY FILE", "");
	ASSERT_TRUE(store.get("MY FILE").has_value());
	EXPECT_TRUE(store.get("MY FILE")->empty());

	store.remove("MY FILE");
	EXPECT_FALSE(store.get("MY FILE").has_value());
	store.remove("MY FILE");
}

TEST_F(DirectoryStoreTest, ContentOutlivesTheStore) {
	DirectoryStore(path()).set("..", "DOTS");
	EXPECT_EQ(DirectoryStore(path() + "/").get("..").value_or(""), "DOTS");
}

// MARK: - SeedDirectory.

using SeedDirectoryTest = HostDirectoryTest;

TEST_F(SeedDirectoryTest, PlainTextWithLineFeeds) {
	write_file("GREETING_TXT.txt", "HELLO\r\nWORLD\r\rEND\n");

	SeedDirectory seeds(path());
	EXPECT_EQ(seeds.fetch("GREETING.TXT").value_or(""), "HELLO\rWORLD\r\rEND\n");
}

TEST_F(SeedDirectoryTest, CompressedText) {
	const std::string content = "COMPRESSED\r\nCONTENT";
	const auto file = gzopen((path() + "/PACKED.txt").c_str(), "wb");
	ASSERT_NE(file, nullptr);
	ASSERT_EQ(gzwrite(file, content.data(), unsigned(content.size())), int(content.size()));
	ASSERT_EQ(gzclose(file), Z_OK);

	SeedDirectory seeds(path());
	EXPECT_EQ(seeds.fetch("PACKED").value_or(""), "COMPRESSED\rCONTENT");
}

TEST_F(SeedDirectoryTest, MissingSeed) {
	SeedDirectory seeds(path());
	EXPECT_FALSE(seeds.fetch("NOTHING").has_value());
	EXPECT_EQ(seeds.path_for("A.B C"), path() + "/A_B%20C.txt");
}
