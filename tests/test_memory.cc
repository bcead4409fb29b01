#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "ClariceError.hpp"
#include "memory_tracking.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

class MemoryTest : public ::testing::Test {
   protected:
    void SetUp() override {
        // the built-in packages live for the whole process
        ModuleRegistry::builtin();
        evaluator = std::make_unique<Evaluator>(out, in);
        baseline = MemoryTracking::snapshot();
    }

    void run(const std::string& source) {
        auto ast = parse_source(source);
        evaluator->evaluate(ast.get());
    }

    CapturedOutput out;
    ScriptedInput in;
    std::unique_ptr<Evaluator> evaluator;
    MemoryTracking::Snapshot baseline;
};

TEST_F(MemoryTest, TransientListIsReleasedWithItsScope) {
    run("with xs as [1, 2, 3] print xs");
    auto after = MemoryTracking::snapshot();
    EXPECT_EQ(after.lists, baseline.lists);
    EXPECT_EQ(after.list_elements, baseline.list_elements);
    EXPECT_EQ(after.scopes, baseline.scopes);
    EXPECT_EQ(out.text(), "[1, 2, 3]\n");
}

TEST_F(MemoryTest, NestedListsAreReleasedTogether) {
    run("with xs as [[1, 2], [3], []] do\n  iter inner in xs do print inner\nend");
    auto after = MemoryTracking::snapshot();
    EXPECT_EQ(after.lists, baseline.lists);
    EXPECT_EQ(after.list_elements, baseline.list_elements);
}

TEST_F(MemoryTest, DurableListLivesUntilTopLevelReset) {
    run("let keep\nset keep to [1, 2] + [3]");
    EXPECT_EQ(MemoryTracking::snapshot().lists, baseline.lists + 1);
    EXPECT_EQ(MemoryTracking::snapshot().list_elements, baseline.list_elements + 3);

    evaluator->reset_top_level();
    EXPECT_EQ(MemoryTracking::snapshot().lists, baseline.lists);
}

TEST_F(MemoryTest, ReassignmentReleasesPreviousValue) {
    run("let v\nset v to [1, 2, 3]\nset v to \"gone\"");
    EXPECT_EQ(MemoryTracking::snapshot().lists, baseline.lists);
}

TEST_F(MemoryTest, LoopsAndBlocksLeaveNoScopesBehind) {
    run(
        "loop do\n"
        "  do with n as [0] print n end\n"
        "  break\n"
        "end\n"
        "iter i in 3 do with sq as i * i print sq");
    EXPECT_EQ(MemoryTracking::snapshot().scopes, baseline.scopes);
}

TEST_F(MemoryTest, ErrorUnwindingPopsScopes) {
    EXPECT_THROW(run("with xs as [1] do do with ys as [2] print 1 / 0 end end"), ArithmeticError);
    auto after = MemoryTracking::snapshot();
    EXPECT_EQ(after.scopes, baseline.scopes);
    EXPECT_EQ(after.lists, baseline.lists);
}

TEST_F(MemoryTest, ModuleBindingDoesNotCopyBuiltins) {
    run("using Text from Clarice/Std\nwith Text.Upper as up do print up(\"x\")");
    auto after = MemoryTracking::snapshot();
    EXPECT_EQ(after.modules, baseline.modules);
    EXPECT_EQ(after.functions, baseline.functions);
}

TEST(MemoryScriptModuleTest, CachedModuleIsReleasedWithEvaluator) {
    fs::path dir = fs::temp_directory_path() / "clarice_memory_test";
    fs::create_directories(dir);
    {
        std::ofstream file(dir / "data.clrs");
        file << "let items\nset items to [1, 2, 3]\n";
    }

    ModuleRegistry::builtin();
    auto before = MemoryTracking::snapshot();
    {
        CapturedOutput out;
        ScriptedInput in;
        Evaluator evaluator(out, in);
        evaluator.set_entry_point((dir / "main.clrs").string());
        auto ast = parse_source("using data from \"data.clrs\"\nprint data.items", (dir / "main.clrs").string());
        evaluator.evaluate(ast.get());
        EXPECT_EQ(out.text(), "[1, 2, 3]\n");

        auto loaded = MemoryTracking::snapshot();
        EXPECT_EQ(loaded.modules, before.modules + 1);
        EXPECT_EQ(loaded.lists, before.lists + 1);
    }
    auto after = MemoryTracking::snapshot();
    EXPECT_EQ(after.modules, before.modules);
    EXPECT_EQ(after.lists, before.lists);
    EXPECT_EQ(after.scopes, before.scopes);
    fs::remove_all(dir);
}
