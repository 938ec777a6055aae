#include <gtest/gtest.h>
#include <filesystem>
#include "runtime/language_registry.hpp"
#include "test_utils.hpp"

using namespace codeloop::runtime;

namespace {

LanguageRegistry& defaults(LanguageRegistry& registry) {
    register_defaults(registry);
    registry.freeze();
    return registry;
}

}

TEST(LanguageRegistry, DefaultsAreSortedAndFrozen) {
    LanguageRegistry registry;
    defaults(registry);

    EXPECT_TRUE(registry.is_frozen());
    EXPECT_EQ(registry.languages(), (std::vector<std::string>{"bash", "javascript", "python"}));

    const LanguageAdapter* python = registry.resolve("python");
    ASSERT_NE(python, nullptr);
    EXPECT_EQ(python->image, "python-3.11-slim");
    EXPECT_EQ(python->file_suffix, ".py");
    EXPECT_EQ(python->default_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(python->limits.memory_limit_bytes, 128u * 1024 * 1024);
    EXPECT_EQ(python->limits.max_pids, 128u);
    EXPECT_FALSE(python->enable_network);

    const LanguageAdapter* bash = registry.resolve("bash");
    ASSERT_NE(bash, nullptr);
    EXPECT_EQ(bash->image, "alpine-latest");
    EXPECT_EQ(bash->command, (std::vector<std::string>{"/bin/sh", "{file}"}));
}

TEST(LanguageRegistry, ResolveIsCaseInsensitiveAndTrimmed) {
    LanguageRegistry registry;
    defaults(registry);

    const LanguageAdapter* adapter = registry.resolve("  PyThOn \n");
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(adapter->name, "python");
}

TEST(LanguageRegistry, AliasesResolveToCanonicalAdapter) {
    LanguageRegistry registry;
    defaults(registry);

    EXPECT_EQ(registry.resolve("py"), registry.resolve("python"));
    EXPECT_EQ(registry.resolve("JS"), registry.resolve("javascript"));
    EXPECT_EQ(registry.resolve("node"), registry.resolve("javascript"));
    EXPECT_EQ(registry.resolve("sh"), registry.resolve("bash"));
    EXPECT_EQ(registry.resolve("shell"), registry.resolve("bash"));
}

TEST(LanguageRegistry, UnknownLanguageIsNotSupported) {
    LanguageRegistry registry;
    defaults(registry);

    EXPECT_EQ(registry.resolve("cobol"), nullptr);
    EXPECT_EQ(registry.resolve(""), nullptr);
    EXPECT_EQ(registry.resolve("   "), nullptr);
}

TEST(LanguageRegistry, RejectsInvalidRegistrations) {
    LanguageRegistry registry;
    LanguageAdapter adapter = codeloop::test::host_shell_adapter();
    ASSERT_TRUE(registry.register_adapter(adapter));

    // Duplicate, in any case
    LanguageAdapter dup = adapter;
    dup.name = "BASH";
    dup.aliases.clear();
    EXPECT_FALSE(registry.register_adapter(dup));

    // Empty identifier
    LanguageAdapter unnamed = adapter;
    unnamed.name = "  ";
    unnamed.aliases.clear();
    EXPECT_FALSE(registry.register_adapter(unnamed));

    // Empty command template
    LanguageAdapter no_command;
    no_command.name = "ruby";
    EXPECT_FALSE(registry.register_adapter(no_command));

    // Alias colliding with an existing alias
    LanguageAdapter zsh = adapter;
    zsh.name = "zsh";
    zsh.aliases = {"sh"};
    EXPECT_FALSE(registry.register_adapter(zsh));

    // Name colliding with an existing alias
    LanguageAdapter shell = adapter;
    shell.name = "shell";
    shell.aliases.clear();
    EXPECT_FALSE(registry.register_adapter(shell));

    EXPECT_EQ(registry.size(), 1u);
}

TEST(LanguageRegistry, FrozenRegistryRejectsRegistration) {
    LanguageRegistry registry;
    registry.freeze();

    EXPECT_FALSE(registry.register_adapter(codeloop::test::host_shell_adapter()));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.resolve("bash"), nullptr);
}

TEST(LanguageRegistry, MissingImagesListsAbsentRootFilesystems) {
    namespace fs = std::filesystem;
    std::string image_root = codeloop::test::test_root() + "/images-missing";
    fs::create_directories(image_root + "/alpine-latest");

    LanguageRegistry registry;
    defaults(registry);

    EXPECT_EQ(registry.missing_images(image_root),
              (std::vector<std::string>{"javascript", "python"}));

    fs::remove_all(image_root);
}

TEST(LanguageRegistry, HostImageIsAlwaysAvailable) {
    LanguageRegistry registry;
    registry.register_adapter(codeloop::test::host_shell_adapter());

    EXPECT_TRUE(registry.missing_images("/nonexistent").empty());
}

TEST(LanguageAdapter, FromJsonKeepsBaseForMissingFields) {
    LanguageAdapter base = codeloop::test::host_shell_adapter();
    LanguageAdapter parsed;
    std::string error;

    nlohmann::json j = {
        {"name", "Bash"},
        {"timeout_ms", 2500},
        {"limits", {{"max_pids", 16}}},
    };
    ASSERT_TRUE(LanguageAdapter::from_json(j, parsed, error, base)) << error;
    EXPECT_EQ(parsed.name, "bash");
    EXPECT_EQ(parsed.command, base.command);
    EXPECT_EQ(parsed.default_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(parsed.limits.max_pids, 16u);
    EXPECT_EQ(parsed.limits.memory_limit_bytes, base.limits.memory_limit_bytes);
}

TEST(LanguageAdapter, FromJsonRejectsBadEntries) {
    LanguageAdapter parsed;
    std::string error;

    EXPECT_FALSE(LanguageAdapter::from_json(nlohmann::json::array(), parsed, error));
    EXPECT_FALSE(LanguageAdapter::from_json({{"image", "x"}}, parsed, error));
    EXPECT_FALSE(LanguageAdapter::from_json({{"name", "x"}, {"timeout_ms", 0}}, parsed, error));
    EXPECT_FALSE(LanguageAdapter::from_json({{"name", "x"}, {"command", "not-a-list"}}, parsed, error));
}
