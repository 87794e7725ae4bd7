#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "session/credential_vault.hpp"

namespace {

using toolsrv::core::errors::get_error;
using toolsrv::core::errors::get_value;
using toolsrv::core::errors::is_error;
using toolsrv::session::CredentialVault;

TEST(CredentialVaultTest, InsertLookupAndErase) {
    CredentialVault vault;
    auto stored = vault.insert("api_key", "secret123");
    ASSERT_FALSE(is_error(stored));
    EXPECT_EQ(get_value(stored), "api_key");
    EXPECT_EQ(vault.lookup("api_key").value_or(""), "secret123");
    EXPECT_EQ(vault.size(), 1u);

    EXPECT_TRUE(vault.erase("api_key"));
    EXPECT_FALSE(vault.erase("api_key"));
    EXPECT_FALSE(vault.lookup("api_key").has_value());
}

TEST(CredentialVaultTest, LaterDeliveryReplacesValue) {
    CredentialVault vault;
    ASSERT_FALSE(is_error(vault.insert("token", "old")));
    ASSERT_FALSE(is_error(vault.insert("token", "new")));
    EXPECT_EQ(vault.lookup("token").value_or(""), "new");
    EXPECT_EQ(vault.size(), 1u);
}

TEST(CredentialVaultTest, RejectsNamesUnusableAsEnvironmentVariables) {
    CredentialVault vault;
    auto empty = vault.insert("", "v");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "invalid_credential_name");

    auto with_equals = vault.insert("A=B", "v");
    ASSERT_TRUE(is_error(with_equals));
    EXPECT_EQ(get_error(with_equals).code, "invalid_credential_name");

    EXPECT_TRUE(is_error(vault.insert(std::string("A\0B", 3), "v")));
    EXPECT_EQ(vault.size(), 0u);
}

TEST(CredentialVaultTest, ResolvesKnownPlaceholdersAndKeepsUnknownOnes) {
    CredentialVault vault;
    ASSERT_FALSE(is_error(vault.insert("api_key", "secret123")));

    EXPECT_EQ(vault.resolve_placeholders("echo <credential:api_key>"), "echo secret123");
    EXPECT_EQ(vault.resolve_placeholders("<credential:api_key>:<credential:api_key>"),
              "secret123:secret123");
    EXPECT_EQ(vault.resolve_placeholders("echo <credential:missing>"),
              "echo <credential:missing>");
    EXPECT_EQ(vault.resolve_placeholders("echo <credential:bad-name>"),
              "echo <credential:bad-name>");
    EXPECT_EQ(vault.resolve_placeholders("echo <credential:api_key"),
              "echo <credential:api_key");
}

TEST(CredentialVaultTest, ConcurrentReadersSeeConsistentSnapshots) {
    CredentialVault vault;
    ASSERT_FALSE(is_error(vault.insert("a", "1")));

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&vault]() {
            for (int j = 0; j < 500; ++j) {
                const auto entries = vault.snapshot();
                for (const auto& entry : entries) {
                    EXPECT_FALSE(entry.first.empty());
                }
                EXPECT_EQ(vault.resolve_placeholders("<credential:a>"), "1");
            }
        });
    }
    for (int j = 0; j < 200; ++j) {
        EXPECT_FALSE(is_error(vault.insert("k" + std::to_string(j), "v")));
    }
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(vault.size(), 201u);
}

}  // namespace
