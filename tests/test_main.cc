#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

#include "config.hpp"
#include "runner.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

class FileExecutionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "clarice_test";
        fs::create_directories(test_dir);
        cfg.color = false;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;
    CliConfig cfg;
    CapturedOutput out;
    ScriptedInput in;
    std::ostringstream diag;

    void createTestFile(const std::string& filename, const std::string& content) {
        fs::path filepath = test_dir / filename;
        std::ofstream file(filepath);
        file << content;
        file.close();
    }

    int runFile(const std::string& filename) {
        return run_script_file((test_dir / filename).string(), cfg, out, in, diag);
    }
};

TEST_F(FileExecutionTest, ExecutesSimpleScript) {
    createTestFile("test.clrs", "let x\nset x to 5\nprint x + 3");
    EXPECT_EQ(runFile("test.clrs"), 0);
    EXPECT_EQ(out.text(), "8\n");
    EXPECT_TRUE(diag.str().empty());
}

TEST_F(FileExecutionTest, RuntimeErrorExitsWithOneAndKeepsEarlierOutput) {
    createTestFile("fail.clrs", "print \"before\"\nprint missing\nprint \"after\"\n");
    EXPECT_EQ(runFile("fail.clrs"), 1);
    EXPECT_EQ(out.text(), "before\n");
    std::string msg = diag.str();
    EXPECT_EQ(msg.rfind("Error: NameError at ", 0), 0u) << msg;
    EXPECT_NE(msg.find("fail.clrs:2:7"), std::string::npos) << msg;
    EXPECT_NE(msg.find("print missing"), std::string::npos) << msg;
}

TEST_F(FileExecutionTest, ParseErrorRunsNothing) {
    createTestFile("bad.clrs", "print \"never\"\nset x 3\n");
    EXPECT_EQ(runFile("bad.clrs"), 1);
    EXPECT_EQ(out.text(), "");
    EXPECT_NE(diag.str().find("ParseError"), std::string::npos);
}

TEST_F(FileExecutionTest, MissingFileIsReported) {
    EXPECT_EQ(runFile("nonexistent.clrs"), 1);
    EXPECT_NE(diag.str().find("Could not open file"), std::string::npos);
}

TEST_F(FileExecutionTest, ScriptImportsSiblingModule) {
    createTestFile("helper.clrs", "let name set name to \"helper\"");
    createTestFile("main.clrs", "using helper from \"helper\"\nprint helper.name");
    EXPECT_EQ(runFile("main.clrs"), 0);
    EXPECT_EQ(out.text(), "helper\n");
}

TEST_F(FileExecutionTest, ModulePathFromConfigIsSearched) {
    fs::create_directories(test_dir / "lib");
    createTestFile("lib/shared.clrs", "let v set v to 7");
    createTestFile("main.clrs", "using shared from \"shared.clrs\"\nprint shared.v");
    cfg.module_path = {(test_dir / "lib").string()};
    EXPECT_EQ(runFile("main.clrs"), 0);
    EXPECT_EQ(out.text(), "7\n");
}

TEST_F(FileExecutionTest, AstDumpPrintsCanonicalProgram) {
    createTestFile("fmt.clrs", "print   1+2*3\nwith x as 2 print x");
    cfg.dump_ast = true;
    EXPECT_EQ(runFile("fmt.clrs"), 0);
    EXPECT_EQ(out.text(), "print 1 + 2 * 3\nwith x as 2 print x\n");
}

TEST_F(FileExecutionTest, TokenDumpDoesNotRunTheProgram) {
    createTestFile("tok.clrs", "print 1");
    cfg.dump_tokens = true;
    EXPECT_EQ(runFile("tok.clrs"), 0);
    const std::string& dump = out.text();
    EXPECT_NE(dump.find("---- TOKEN DUMP (3 tokens) ----"), std::string::npos) << dump;
    EXPECT_NE(dump.find("0: PRINT"), std::string::npos);
    EXPECT_NE(dump.find("1: INTEGER value='1'"), std::string::npos);
    EXPECT_NE(dump.find("2: EOF_TOKEN"), std::string::npos);
    EXPECT_EQ(dump.find("\n1\n"), std::string::npos);
}

TEST_F(FileExecutionTest, PromptReadsFromInputSource) {
    ScriptedInput answers({"yes"});
    createTestFile("ask.clrs", "prompt \"Continue? \" then print \"ok\"");
    EXPECT_EQ(run_script_file((test_dir / "ask.clrs").string(), cfg, out, answers, diag), 0);
    EXPECT_EQ(out.text(), "Continue? ok\n");
    EXPECT_EQ(answers.reads(), 1);
}

TEST(RunScriptSourceTest, MissingTrailingNewlineIsFine) {
    CliConfig cfg;
    CapturedOutput out;
    ScriptedInput in;
    std::ostringstream diag;
    EXPECT_EQ(run_script_source("<string>", "print \"x\"", cfg, out, in, diag), 0);
    EXPECT_EQ(out.text(), "x\n");
}

// ============================================================================
// COMMAND LINE
// ============================================================================

TEST(CommandLineTest, ScriptArgument) {
    CliConfig cfg = parse_command_line({"app.clrs", "ignored"});
    EXPECT_EQ(cfg.script, "app.clrs");
    EXPECT_FALSE(cfg.interactive);
}

TEST(CommandLineTest, NoArgumentsStartsRepl) {
    CliConfig cfg = parse_command_line({});
    EXPECT_TRUE(cfg.interactive);
    EXPECT_TRUE(cfg.script.empty());
}

TEST(CommandLineTest, Flags) {
    CliConfig cfg = parse_command_line({"--no-color", "--ast", "x.clrs"});
    EXPECT_FALSE(cfg.color);
    EXPECT_TRUE(cfg.dump_ast);
    EXPECT_EQ(cfg.script, "x.clrs");

    EXPECT_TRUE(parse_command_line({"-v"}).show_version);
    EXPECT_TRUE(parse_command_line({"--help"}).show_help);
    EXPECT_TRUE(parse_command_line({"-i"}).interactive);
}

TEST(CommandLineTest, DoubleDashEndsOptions) {
    CliConfig cfg = parse_command_line({"--", "-weird.clrs"});
    EXPECT_EQ(cfg.script, "-weird.clrs");
}

TEST(CommandLineTest, BadUsage) {
    EXPECT_THROW(parse_command_line({"--frobnicate"}), UsageError);
    EXPECT_THROW(parse_command_line({"--tokens"}), UsageError);
}

TEST(CommandLineTest, EnvironmentOverrides) {
    std::map<std::string, std::string> vars = {
        {"CLARICE_PATH", "/a::/b"},
        {"NO_COLOR", "1"},
        {"HOME", "/home/someone"}};
    auto lookup = [&vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };

    CliConfig cfg;
    apply_environment(cfg, lookup);
    EXPECT_EQ(cfg.module_path, (std::vector<std::string>{"/a", "/b"}));
    EXPECT_FALSE(cfg.color);
    EXPECT_EQ(cfg.history_file, "/home/someone/.clarice_history");

    vars["CLARICE_HISTORY"] = "/tmp/hist";
    vars["NO_COLOR"] = "";
    CliConfig second;
    apply_environment(second, lookup);
    EXPECT_TRUE(second.color);
    EXPECT_EQ(second.history_file, "/tmp/hist");
}

TEST_F(FileExecutionTest, ResolvesScriptWithOrWithoutExtension) {
    createTestFile("script.clrs", "print 1");
    fs::path base = test_dir / "script";
    auto found = resolve_script_path(base.string());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(fs::path(*found).filename().string(), "script.clrs");
    EXPECT_TRUE(resolve_script_path((test_dir / "script.clrs").string()).has_value());
    EXPECT_FALSE(resolve_script_path((test_dir / "other").string()).has_value());
    EXPECT_FALSE(resolve_script_path((test_dir / "script.txt").string()).has_value());
}
