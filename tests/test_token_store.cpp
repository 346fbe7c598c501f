#include "storage/token_store.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace powgate;
using namespace powgate::storage;

namespace fs = std::filesystem;

class TokenStoreTest : public ::testing::Test {
protected:
    std::string test_dir = "./test_token_store_data";
    
    void SetUp() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }
    
    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }
};

TEST_F(TokenStoreTest, CreatesDirectory) {
    FileTokenStore store(test_dir);
    EXPECT_TRUE(fs::is_directory(test_dir));
}

TEST_F(TokenStoreTest, SetGetClear) {
    FileTokenStore store(test_dir);
    
    EXPECT_FALSE(store.get("auth_token").has_value());
    
    ASSERT_TRUE(store.set("auth_token", "eyJhbGciOi.payload.sig"));
    EXPECT_EQ(store.get("auth_token").value_or(""), "eyJhbGciOi.payload.sig");
    
    ASSERT_TRUE(store.set("auth_token", "replacement"));
    EXPECT_EQ(store.get("auth_token").value_or(""), "replacement");
    
    EXPECT_TRUE(store.clear("auth_token"));
    EXPECT_FALSE(store.get("auth_token").has_value());
    
    // Clearing again is not an error
    EXPECT_TRUE(store.clear("auth_token"));
}

TEST_F(TokenStoreTest, TokenFileIsOwnerOnly) {
    FileTokenStore store(test_dir);
    ASSERT_TRUE(store.set("auth_token", "secret-token"));
    
    auto perms = fs::status(fs::path(test_dir) / "auth_token.token").permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
    
    // Replacing keeps the restriction and leaves no temp file behind
    ASSERT_TRUE(store.set("auth_token", "next-token"));
    perms = fs::status(fs::path(test_dir) / "auth_token.token").permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_FALSE(fs::exists(fs::path(test_dir) / "auth_token.token.tmp"));
}

TEST_F(TokenStoreTest, PersistsAcrossInstances) {
    {
        FileTokenStore store(test_dir);
        ASSERT_TRUE(store.set("auth_token", "persisted"));
    }
    
    FileTokenStore reopened(test_dir);
    EXPECT_EQ(reopened.get("auth_token").value_or(""), "persisted");
}

TEST_F(TokenStoreTest, KeysAreIndependent) {
    FileTokenStore store(test_dir);
    
    ASSERT_TRUE(store.set("first", "1"));
    ASSERT_TRUE(store.set("second", "2"));
    ASSERT_TRUE(store.clear("first"));
    
    EXPECT_FALSE(store.get("first").has_value());
    EXPECT_EQ(store.get("second").value_or(""), "2");
}

TEST_F(TokenStoreTest, KeyCannotEscapeDirectory) {
    FileTokenStore store(test_dir);
    
    ASSERT_TRUE(store.set("../outside", "value"));
    EXPECT_EQ(store.get("../outside").value_or(""), "value");
    
    for (const auto& entry : fs::directory_iterator(test_dir)) {
        EXPECT_EQ(entry.path().extension(), ".token");
    }
    EXPECT_FALSE(fs::exists("./outside.token"));
}

TEST(MemoryTokenStoreTest, SetGetClear) {
    MemoryTokenStore store;
    
    EXPECT_FALSE(store.get("auth_token").has_value());
    EXPECT_TRUE(store.set("auth_token", "abc"));
    EXPECT_EQ(store.get("auth_token").value_or(""), "abc");
    EXPECT_TRUE(store.clear("auth_token"));
    EXPECT_TRUE(store.clear("auth_token"));
    EXPECT_FALSE(store.get("auth_token").has_value());
}
