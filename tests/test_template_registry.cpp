#include "test_helpers.hpp"
#include <templates/template_registry.hpp>
#include <algorithm>

class TemplateRegistryTest : public TempDirTest {};

TEST(TemplateRegistry, BuiltinEnumeration) {
    auto names = list_templates();
    std::vector<std::string> expected = {"hello_world", "advanced", "nlp", "langchain", "llama"};
    EXPECT_EQ(names, expected);
}

TEST(TemplateRegistry, ModuleNamesFollowBundles) {
    for (const auto& entry : builtin_templates()) {
        if (entry.identifier == "langchain") EXPECT_EQ(entry.module_name, "langchain_app");
        if (entry.identifier == "llama") EXPECT_EQ(entry.module_name, "llama_app");
        if (entry.identifier == "hello_world") EXPECT_EQ(entry.bundle_name, "template-hello-world");
        EXPECT_FALSE(entry.description.empty());
    }
}

TEST(TemplateRegistry, KnownTemplate) {
    EXPECT_TRUE(is_known_template("hello_world"));
    EXPECT_TRUE(is_known_template("llama"));
    EXPECT_FALSE(is_known_template("unknown_template"));
    EXPECT_FALSE(is_known_template("Hello_World"));
    EXPECT_FALSE(is_known_template(""));
}

TEST_F(TemplateRegistryTest, ResolvesInstalledBundle) {
    make_bundle(test_dir / "template-hello-world", "hello_world");
    FixtureLocator locator(test_dir);
    auto registry = TemplateRegistry::builtin(locator);

    auto result = registry.resolve("hello_world");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.identifier, "hello_world");
    EXPECT_EQ(result.value.internal_module_name, "hello_world");
    EXPECT_EQ(result.value.bundle_location.string(), (test_dir / "template-hello-world").string());
}

TEST_F(TemplateRegistryTest, UnknownIdentifier) {
    FixtureLocator locator(test_dir);
    auto registry = TemplateRegistry::builtin(locator);

    auto result = registry.resolve("unknown_template");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Unknown template"), std::string::npos);
}

TEST_F(TemplateRegistryTest, EnumeratedButNotInstalled) {
    make_bundle(test_dir / "template-hello-world", "hello_world");
    FixtureLocator locator(test_dir);
    auto registry = TemplateRegistry::builtin(locator);

    EXPECT_EQ(registry.size(), 1u);
    auto result = registry.resolve("llama");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("template-llama"), std::string::npos);
}

TEST_F(TemplateRegistryTest, LookupIsExactMatch) {
    make_bundle(test_dir / "template-hello-world", "hello_world");
    FixtureLocator locator(test_dir);
    auto registry = TemplateRegistry::builtin(locator);

    EXPECT_TRUE(registry.resolve("hello_world ").is_err());
    EXPECT_TRUE(registry.resolve("HELLO_WORLD").is_err());
}

TEST_F(TemplateRegistryTest, SearchPathFirstRootWins) {
    make_bundle(test_dir / "a" / "template-nlp", "nlp");
    make_bundle(test_dir / "b" / "template-nlp", "nlp");
    make_bundle(test_dir / "b" / "template-llama", "llama_app");

    SearchPathLocator locator({test_dir / "missing", test_dir / "a", test_dir / "b"});
    auto nlp = locator.locate("template-nlp");
    auto llama = locator.locate("template-llama");
    ASSERT_TRUE(nlp.has_value());
    ASSERT_TRUE(llama.has_value());
    EXPECT_EQ(nlp->string(), (test_dir / "a" / "template-nlp").string());
    EXPECT_EQ(llama->string(), (test_dir / "b" / "template-llama").string());
    EXPECT_FALSE(locator.locate("template-advanced").has_value());
}

TEST_F(TemplateRegistryTest, SearchPathIgnoresPlainFiles) {
    write_file(test_dir / "template-nlp", "not a directory");
    SearchPathLocator locator({test_dir});
    EXPECT_FALSE(locator.locate("template-nlp").has_value());
}

TEST(TemplateRegistry, DefaultRootsPreferConfiguredDir) {
    auto roots = default_template_roots(fs::path("/configured/templates"));
    ASSERT_FALSE(roots.empty());
    EXPECT_EQ(roots.front().string(), "/configured/templates");
    EXPECT_EQ(roots.back().string(), APIGEN_SOURCE_BUNDLES_DIR);
}

TEST(TemplateRegistry, ShippedBundlesAreComplete) {
    SearchPathLocator locator({fs::path(APIGEN_SOURCE_BUNDLES_DIR)});
    auto registry = TemplateRegistry::builtin(locator);

    for (const auto& name : list_templates()) {
        auto result = registry.resolve(name);
        ASSERT_TRUE(result.is_ok()) << result.error;
        EXPECT_TRUE(fs::is_directory(result.value.bundle_location / "src" /
                                     result.value.internal_module_name)) << name;
    }
}
