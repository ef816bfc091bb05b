#include "test_helpers.hpp"
#include <generator/project_generator.hpp>
#include <templates/template_registry.hpp>
#include <generator/vcs_init.hpp>
#include <regex>

class ProjectGeneratorTest : public TempDirTest {
protected:
    fs::path templates_root() const { return test_dir / "templates"; }
    fs::path workdir() const { return test_dir / "work"; }

    void SetUp() override {
        TempDirTest::SetUp();
        make_bundle(templates_root() / "template-hello-world", "hello_world");
        make_bundle(templates_root() / "template-langchain", "langchain_app");
        fs::create_directories(workdir());
    }

    static GeneratorOptions no_git() {
        GeneratorOptions options;
        options.git_init = false;
        return options;
    }

    GenerationReport generate(const std::string& name, const std::string& tmpl,
                              GeneratorOptions options = no_git()) const {
        FixtureLocator locator(templates_root());
        auto registry = TemplateRegistry::builtin(locator);
        ProjectGenerator generator(registry, std::move(options));
        return generator.generate(make_project_request(name, tmpl, workdir()));
    }
};

TEST_F(ProjectGeneratorTest, HelloWorldScenario) {
    auto report = generate("my_app", "hello_world");
    ASSERT_TRUE(report.ok()) << report.error;

    fs::path project = workdir() / "my_app";
    EXPECT_EQ(report.destination.string(), project.string());
    EXPECT_TRUE(fs::is_directory(project));
    EXPECT_TRUE(fs::is_directory(project / "src" / "my_app"));
    EXPECT_FALSE(fs::exists(project / "src" / "hello_world"));
    EXPECT_NE(read_file(project / "pyproject.toml").find("name = \"my_app\""), std::string::npos);
    ASSERT_TRUE(report.template_used.has_value());
    EXPECT_EQ(report.template_used->identifier, "hello_world");
    EXPECT_EQ(report.error_kind, GenerationErrorKind::None);
}

TEST_F(ProjectGeneratorTest, TemplateWithDifferentModuleName) {
    auto report = generate("chatbot", "langchain");
    ASSERT_TRUE(report.ok()) << report.error;

    fs::path project = workdir() / "chatbot";
    EXPECT_TRUE(fs::is_directory(project / "src" / "chatbot"));
    EXPECT_FALSE(fs::exists(project / "src" / "langchain_app"));
    EXPECT_EQ(read_file(project / "pyproject.toml").find("langchain_app"), std::string::npos);
}

TEST_F(ProjectGeneratorTest, InvalidNameCreatesNothing) {
    auto report = generate("bad-name!", "hello_world");
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.error_kind, GenerationErrorKind::InvalidName);
    EXPECT_EQ(report.stage, GenerationStage::Validating);
    EXPECT_FALSE(fs::exists(workdir() / "bad-name!"));
    EXPECT_TRUE(fs::is_empty(workdir()));
}

TEST_F(ProjectGeneratorTest, TraversalNameCreatesNothing) {
    auto report = generate("..", "hello_world");
    EXPECT_EQ(report.error_kind, GenerationErrorKind::InvalidName);
    EXPECT_TRUE(fs::is_empty(workdir()));
}

TEST_F(ProjectGeneratorTest, UnknownTemplateCreatesNothing) {
    auto report = generate("my_app", "unknown_template");
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.error_kind, GenerationErrorKind::TemplateNotFound);
    EXPECT_EQ(report.stage, GenerationStage::ResolvingTemplate);
    EXPECT_FALSE(fs::exists(workdir() / "my_app"));
}

TEST_F(ProjectGeneratorTest, MissingBundleCreatesNothing) {
    auto report = generate("my_app", "llama");
    EXPECT_EQ(report.error_kind, GenerationErrorKind::TemplateNotFound);
    EXPECT_FALSE(fs::exists(workdir() / "my_app"));
}

TEST_F(ProjectGeneratorTest, SecondRunFailsAndLeavesFirstUntouched) {
    auto first = generate("my_app", "hello_world");
    ASSERT_TRUE(first.ok()) << first.error;
    auto before = snapshot(workdir() / "my_app");

    auto second = generate("my_app", "hello_world");
    EXPECT_FALSE(second.ok());
    EXPECT_EQ(second.error_kind, GenerationErrorKind::DestinationExists);
    EXPECT_EQ(second.stage, GenerationStage::CheckingDestination);
    EXPECT_EQ(snapshot(workdir() / "my_app"), before);
}

TEST_F(ProjectGeneratorTest, ExistingFileBlocksDestination) {
    write_file(workdir() / "my_app", "a file, not a directory");
    auto report = generate("my_app", "hello_world");
    EXPECT_EQ(report.error_kind, GenerationErrorKind::DestinationExists);
    EXPECT_EQ(read_file(workdir() / "my_app"), "a file, not a directory");
}

TEST_F(ProjectGeneratorTest, NoBuildArtifactsInOutput) {
    auto report = generate("my_app", "hello_world");
    ASSERT_TRUE(report.ok()) << report.error;

    for (const auto& entry : fs::recursive_directory_iterator(workdir() / "my_app")) {
        std::string name = entry.path().filename().string();
        EXPECT_NE(name, "__pycache__") << entry.path();
        EXPECT_NE(name, ".venv") << entry.path();
        EXPECT_NE(name, ".git") << entry.path();
        EXPECT_NE(name, "uv.lock") << entry.path();
        EXPECT_NE(name, ".pytest_cache") << entry.path();
    }
    EXPECT_TRUE(fs::exists(workdir() / "my_app" / ".gitignore"));
}

TEST_F(ProjectGeneratorTest, BrokenBundleIsCopyError) {
    fs::create_symlink(test_dir / "gone", templates_root() / "template-hello-world" / "dangling");

    auto report = generate("my_app", "hello_world");
    EXPECT_EQ(report.error_kind, GenerationErrorKind::CopyIOError);
    EXPECT_EQ(report.stage, GenerationStage::Copying);
    // Partial output stays for diagnosis
    EXPECT_TRUE(fs::exists(workdir() / "my_app"));
    EXPECT_FALSE(report.cleaned_up);
}

TEST_F(ProjectGeneratorTest, RewriteFailureLeavesCopiedTree) {
    write_file(templates_root() / "template-hello-world" / "src" / "my_app" / "clash.py");

    auto report = generate("my_app", "hello_world");
    EXPECT_EQ(report.error_kind, GenerationErrorKind::RewriteIOError);
    EXPECT_EQ(report.stage, GenerationStage::Rewriting);
    EXPECT_TRUE(fs::exists(workdir() / "my_app" / "src" / "hello_world"));
}

TEST_F(ProjectGeneratorTest, CleanupOnFailureRemovesDestination) {
    write_file(templates_root() / "template-hello-world" / "src" / "my_app" / "clash.py");

    GeneratorOptions options = no_git();
    options.cleanup_on_failure = true;
    auto report = generate("my_app", "hello_world", std::move(options));
    EXPECT_EQ(report.error_kind, GenerationErrorKind::RewriteIOError);
    EXPECT_TRUE(report.cleaned_up);
    EXPECT_FALSE(fs::exists(workdir() / "my_app"));
}

TEST_F(ProjectGeneratorTest, CleanupNeverTouchesSomeoneElsesDirectory) {
    fs::create_directories(workdir() / "my_app");
    write_file(workdir() / "my_app" / "keep.txt", "precious");

    GeneratorOptions options = no_git();
    options.cleanup_on_failure = true;
    auto report = generate("my_app", "hello_world", std::move(options));
    EXPECT_EQ(report.error_kind, GenerationErrorKind::DestinationExists);
    EXPECT_EQ(read_file(workdir() / "my_app" / "keep.txt"), "precious");
}

TEST_F(ProjectGeneratorTest, GitDisabledIsSkipped) {
    auto report = generate("my_app", "hello_world");
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.vcs.status, VcsInitResult::Status::Skipped);
}

TEST_F(ProjectGeneratorTest, MissingGitIsIgnored) {
    GeneratorOptions options;
    options.git_init = true;
    options.git_program = "apigen-test-no-such-git";

    auto report = generate("my_app", "hello_world", std::move(options));
    ASSERT_TRUE(report.ok()) << report.error;
    EXPECT_EQ(report.vcs.status, VcsInitResult::Status::Ignored);
    EXPECT_FALSE(report.vcs.reason.empty());
    EXPECT_FALSE(fs::exists(workdir() / "my_app" / ".git"));
}

class VcsInitTest : public TempDirTest {};

TEST_F(VcsInitTest, MissingProgramIsReportedAsNotFound) {
    auto result = init_git_repository(test_dir, "apigen-test-no-such-git");
    EXPECT_EQ(result.status, VcsInitResult::Status::Ignored);
    EXPECT_NE(result.reason.find("not found"), std::string::npos) << result.reason;
}

TEST_F(VcsInitTest, UnreachableDirectoryIsNotBlamedOnGit) {
    fs::path missing = test_dir / "missing";
    auto result = init_git_repository(missing, "apigen-test-no-such-git");
    EXPECT_EQ(result.status, VcsInitResult::Status::Ignored);
    EXPECT_EQ(result.reason.find("not found"), std::string::npos) << result.reason;
    EXPECT_NE(result.reason.find(missing.string()), std::string::npos) << result.reason;
}

TEST_F(ProjectGeneratorTest, ProgressGoesThroughCallback) {
    FixtureLocator locator(templates_root());
    auto registry = TemplateRegistry::builtin(locator);
    ProjectGenerator generator(registry, no_git());

    std::vector<std::string> messages;
    auto report = generator.generate(make_project_request("my_app", "hello_world", workdir()),
                                     [&](const std::string& msg) { messages.push_back(msg); });
    ASSERT_TRUE(report.ok());
    ASSERT_FALSE(messages.empty());
    EXPECT_NE(messages.front().find("my_app"), std::string::npos);
}

TEST(ProjectGenerator, StageAndErrorNames) {
    EXPECT_STREQ(stage_name(GenerationStage::Copying), "copying");
    EXPECT_STREQ(stage_name(GenerationStage::ResolvingTemplate), "resolving template");
    EXPECT_STREQ(error_kind_name(GenerationErrorKind::DestinationExists), "DestinationExists");
    EXPECT_STREQ(error_kind_name(GenerationErrorKind::RewriteIOError), "RewriteIOError");
}

// Every shipped template, end to end against the real bundles
class ShippedTemplatesTest : public TempDirTest {};

TEST_F(ShippedTemplatesTest, EveryTemplateRenamesCompletely) {
    SearchPathLocator locator({fs::path(APIGEN_SOURCE_BUNDLES_DIR)});
    auto registry = TemplateRegistry::builtin(locator);
    GeneratorOptions options;
    options.git_init = false;
    ProjectGenerator generator(registry, options);

    for (const auto& entry : builtin_templates()) {
        std::string name = "proj_" + entry.identifier;
        auto report = generator.generate(make_project_request(name, entry.identifier, test_dir));
        ASSERT_TRUE(report.ok()) << entry.identifier << ": " << report.error;

        fs::path project = test_dir / name;
        EXPECT_TRUE(fs::is_directory(project / "src" / name)) << entry.identifier;

        std::string manifest = read_file(project / "pyproject.toml");
        EXPECT_NE(manifest.find("name = \"" + name + "\""), std::string::npos) << entry.identifier;

        std::regex old_token("(^|[^A-Za-z0-9_])" + entry.module_name + "([^A-Za-z0-9_]|$)");
        EXPECT_FALSE(std::regex_search(manifest, old_token)) << entry.identifier;

        std::string tests = read_file(project / "tests" / "test_main.py");
        EXPECT_EQ(tests.find("from " + entry.module_name + "."), std::string::npos) << entry.identifier;
        EXPECT_EQ(tests.find("import " + entry.module_name + "\n"), std::string::npos) << entry.identifier;
    }
}
