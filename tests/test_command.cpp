/**
 * @file test_command.cpp
 * @brief Tests for the command tree: dispatch, hooks and help (GoogleTest)
 */

#include <gtest/gtest.h>
#include "cfgbind/Command.hpp"
#include "cfgbind/Errors.hpp"

#include <sstream>

using namespace cfgbind;

namespace {

using Args = std::vector<std::string>;

class CommandTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        root.set_out(out);
        root.set_err(err);
        root.persistent_flags().add("second-param", &second, "second");
        root.persistent_flags().add("verbose", &verbose);
        child2.persistent_flags().add("fifth-param", &fifth, "fifth");
    }

    std::ostringstream out;
    std::ostringstream err;
    Command root{"app", "Demo application"};
    Command& child1 = root.add_command("child1", "First level");
    Command& child2 = child1.add_command("child2", "Second level");

    std::string second;
    bool verbose = false;
    int fifth = 0;
};

} // anonymous namespace

// ============================================================================
// Tree
// ============================================================================

TEST_F(CommandTreeTest, ParentAndRoot) {
    EXPECT_EQ(child2.parent(), &child1);
    EXPECT_EQ(child1.parent(), &root);
    EXPECT_EQ(root.parent(), nullptr);
    EXPECT_EQ(&child2.root(), &root);
}

TEST_F(CommandTreeTest, PathsFromRoot) {
    EXPECT_EQ(child2.command_path(), "app child1 child2");
    const auto path = child2.path_from_root();
    ASSERT_EQ(path.size(), 3u);
    EXPECT_EQ(path[0], &root);
    EXPECT_EQ(path[2], &child2);
}

TEST_F(CommandTreeTest, Find) {
    EXPECT_EQ(root.find({"child1", "child2"}), &child2);
    EXPECT_EQ(root.find({}), &root);
    EXPECT_EQ(root.find({"child2"}), nullptr);
    EXPECT_EQ(root.find_child("child1"), &child1);
}

TEST_F(CommandTreeTest, OutputStreamsAreInherited) {
    child2.out() << "x";
    EXPECT_EQ(out.str(), "x");
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(CommandTreeTest, DispatchParsesFlagsOfWholePath) {
    Command* ran = nullptr;
    Args positionals;
    child2.set_run([&](Command& cmd, const Args& args) {
        ran = &cmd;
        positionals = args;
    });

    root.execute({"child1", "child2", "--fifth-param", "102", "--second-param", "SecondFlag", "extra"});

    EXPECT_EQ(ran, &child2);
    EXPECT_EQ(fifth, 102);
    EXPECT_EQ(second, "SecondFlag");
    EXPECT_EQ(positionals, Args{"extra"});
    EXPECT_TRUE(child2.persistent_flags().changed("fifth-param"));
    EXPECT_TRUE(root.persistent_flags().changed("second-param"));
    EXPECT_FALSE(root.persistent_flags().changed("verbose"));
}

TEST_F(CommandTreeTest, FlagValuesBeforeCommandWords) {
    Command* ran = nullptr;
    child1.set_run([&](Command& cmd, const Args&) { ran = &cmd; });

    root.execute({"--second-param", "child2", "child1"});

    EXPECT_EQ(ran, &child1);
    EXPECT_EQ(second, "child2");
}

TEST_F(CommandTreeTest, ExecuteFromChildDispatchesFromRoot) {
    bool ran = false;
    child1.set_run([&](Command&, const Args&) { ran = true; });
    child2.execute({"child1"});
    EXPECT_TRUE(ran);
}

TEST_F(CommandTreeTest, DoubleDashEndsCommandWords) {
    Args positionals;
    root.set_run([&](Command&, const Args& args) { positionals = args; });
    root.execute({"--", "child1"});
    EXPECT_EQ(positionals, Args{"child1"});
}

TEST_F(CommandTreeTest, NearestPersistentPreRunRunsBeforeRun) {
    std::vector<std::string> calls;
    root.set_persistent_pre_run([&](Command& cmd, const Args&) { calls.push_back("root-pre:" + cmd.name()); });
    child2.set_run([&](Command&, const Args&) { calls.push_back("run"); });

    root.execute({"child1", "child2"});
    EXPECT_EQ(calls, (std::vector<std::string>{"root-pre:child2", "run"}));

    calls.clear();
    child1.set_persistent_pre_run([&](Command&, const Args&) { calls.push_back("child1-pre"); });
    root.execute({"child1", "child2"});
    EXPECT_EQ(calls, (std::vector<std::string>{"child1-pre", "run"}));
}

TEST_F(CommandTreeTest, ResolversRunRootToTargetBeforeHooks) {
    std::vector<std::string> calls;
    root.set_resolver([&](Command& target) { calls.push_back("root:" + target.name()); });
    child2.set_resolver([&](Command& target) { calls.push_back("child2:" + target.name()); });
    child2.set_persistent_pre_run([&](Command&, const Args&) { calls.push_back("pre"); });
    child2.set_help_func([&](Command&, const Args&) { calls.push_back("help"); });
    child2.set_run([&](Command&, const Args&) { calls.push_back("run"); });

    root.execute({"child1", "child2"});
    EXPECT_EQ(calls, (std::vector<std::string>{"root:child2", "child2:child2", "pre", "run"}));

    calls.clear();
    root.execute({"child1", "child2", "--help"});
    EXPECT_EQ(calls, (std::vector<std::string>{"root:child2", "child2:child2", "help"}));

    calls.clear();
    root.execute({"child1"});
    EXPECT_EQ(calls, (std::vector<std::string>{"root:child1"}));
}

TEST_F(CommandTreeTest, DispatchSerialCountsDispatches) {
    root.set_run([](Command&, const Args&) {});
    const auto before = child2.dispatch_serial();
    root.execute({});
    root.execute({});
    EXPECT_EQ(child2.dispatch_serial(), before + 2);
}

TEST_F(CommandTreeTest, ChangedFlagsResetBetweenDispatches) {
    child2.set_run([](Command&, const Args&) {});
    root.execute({"child1", "child2", "--fifth-param", "1"});
    ASSERT_TRUE(child2.persistent_flags().changed("fifth-param"));
    root.execute({"child1", "child2"});
    EXPECT_FALSE(child2.persistent_flags().changed("fifth-param"));
    EXPECT_EQ(fifth, 1);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(CommandTreeTest, UnknownFlagIsFlagParseError) {
    child1.set_run([](Command&, const Args&) {});
    EXPECT_THROW(root.execute({"child1", "--nope"}), FlagParseError);
}

TEST_F(CommandTreeTest, ChildFlagUnknownOnParent) {
    child1.set_run([](Command&, const Args&) {});
    EXPECT_THROW(root.execute({"child1", "--fifth-param", "3"}), FlagParseError);
}

TEST_F(CommandTreeTest, BadFlagValueIsFlagParseError) {
    child2.set_run([](Command&, const Args&) {});
    EXPECT_THROW(root.execute({"child1", "child2", "--fifth-param", "abc"}), FlagParseError);
}

TEST_F(CommandTreeTest, RunReportsErrors) {
    child2.set_run([](Command&, const Args&) { throw ConfigError("boom"); });
    const char* argv[] = {"app", "child1", "child2"};
    EXPECT_EQ(root.run(3, argv), 1);
    EXPECT_EQ(err.str(), "Error: boom\n");

    child2.set_run([](Command&, const Args&) {});
    EXPECT_EQ(root.run(3, argv), 0);
}

// ============================================================================
// Help
// ============================================================================

TEST_F(CommandTreeTest, HelpFlagCallsNearestHelpFunc) {
    Command* helped = nullptr;
    bool ran = false;
    root.set_help_func([&](Command& cmd, const Args&) { helped = &cmd; });
    child2.set_run([&](Command&, const Args&) { ran = true; });

    root.execute({"child1", "child2", "--help"});
    EXPECT_EQ(helped, &child2);
    EXPECT_FALSE(ran);
}

TEST_F(CommandTreeTest, NoRunActionShowsHelp) {
    root.execute({"child1"});
    const std::string text = out.str();
    EXPECT_NE(text.find("First level"), std::string::npos);
    EXPECT_NE(text.find("app child1 [command]"), std::string::npos);
    EXPECT_NE(text.find("child2"), std::string::npos);
}

TEST_F(CommandTreeTest, PrintHelpListsLocalAndGlobalFlags) {
    fifth = 78;
    child2.persistent_flags().refresh_defaults();
    child2.print_help();

    const std::string text = out.str();
    EXPECT_NE(text.find("Usage:"), std::string::npos);
    EXPECT_NE(text.find("Flags:"), std::string::npos);
    EXPECT_NE(text.find("--fifth-param int"), std::string::npos);
    EXPECT_NE(text.find("(default 78)"), std::string::npos);
    EXPECT_NE(text.find("Global Flags:"), std::string::npos);
    EXPECT_NE(text.find("--second-param string"), std::string::npos);
    EXPECT_NE(text.find("-h, --help"), std::string::npos);
}
