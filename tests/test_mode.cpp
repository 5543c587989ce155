#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "bus/bus.hpp"
#include "mode/mode.hpp"
#include "mode/mode_manager.hpp"
#include "mode/write_detector.hpp"

using namespace toolgate;
using namespace toolgate::mode;

// --- Mode table ---

TEST(ModeTest, ModeFlags) {
  EXPECT_TRUE(mode_config(Mode::Plan).read_only);
  EXPECT_FALSE(mode_config(Mode::Plan).auto_approve);
  EXPECT_TRUE(mode_config(Mode::Architect).read_only);
  EXPECT_FALSE(mode_config(Mode::Normal).read_only);
  EXPECT_FALSE(mode_config(Mode::Normal).auto_approve);
  EXPECT_TRUE(mode_config(Mode::Auto).auto_approve);
  EXPECT_TRUE(mode_config(Mode::Yolo).auto_approve);
  EXPECT_FALSE(mode_config(Mode::Yolo).read_only);
}

TEST(ModeTest, CycleOrderWraps) {
  EXPECT_EQ(next_mode(Mode::Normal), Mode::Auto);
  EXPECT_EQ(next_mode(Mode::Auto), Mode::Plan);
  EXPECT_EQ(next_mode(Mode::Plan), Mode::Yolo);
  EXPECT_EQ(next_mode(Mode::Yolo), Mode::Architect);
  EXPECT_EQ(next_mode(Mode::Architect), Mode::Normal);
}

TEST(ModeTest, StringConversion) {
  for (auto m : kCycleOrder) {
    EXPECT_EQ(mode_from_string(to_string(m)), m);
  }
  EXPECT_EQ(mode_from_string("YOLO"), Mode::Yolo);
  EXPECT_FALSE(mode_from_string("turbo").has_value());
}

TEST(ModeTest, PromptModifierPerMode) {
  for (auto m : kCycleOrder) {
    auto block = system_prompt_modifier(m);
    EXPECT_NE(block.find("<active_mode>"), std::string::npos);
    EXPECT_NE(block.find("<rules>"), std::string::npos);
    EXPECT_NE(block.find("<style>"), std::string::npos);
  }
  EXPECT_NE(system_prompt_modifier(Mode::Plan).find("PLAN"), std::string::npos);
}

// --- Write detection ---

TEST(WriteDetectorTest, ToolCategories) {
  EXPECT_TRUE(is_write_operation("write_file", {}));
  EXPECT_TRUE(is_write_operation("search_replace", {}));
  EXPECT_FALSE(is_write_operation("read_file", {}));
  EXPECT_FALSE(is_write_operation("grep", {}));
  // Unknown tools fail closed
  EXPECT_TRUE(is_write_operation("mystery_tool", {}));
}

TEST(WriteDetectorTest, ExtractCommandKeys) {
  EXPECT_EQ(extract_command({{"command", "ls"}}), "ls");
  EXPECT_EQ(extract_command({{"cmd", "pwd"}}), "pwd");
  EXPECT_EQ(extract_command({{"CommandLine", "git status"}}), "git status");
  EXPECT_EQ(extract_command({{"commandLine", "whoami"}}), "whoami");
  EXPECT_EQ(extract_command({{"command", ""}, {"cmd", "date"}}), "date");
  EXPECT_EQ(extract_command(json::object()), "");
  EXPECT_EQ(extract_command(json()), "");
}

TEST(WriteDetectorTest, ReadOnlyShellCommands) {
  for (const char *cmd : {"ls -la", "cat README.md", "grep -rn foo src", "git status", "git log --oneline",
                          "git diff HEAD~1", "pwd", "echo hello", "find . -name '*.cpp'", "wc -l file.txt"}) {
    EXPECT_FALSE(is_write_shell_command(cmd)) << cmd;
  }
}

TEST(WriteDetectorTest, WriteShellCommands) {
  for (const char *cmd : {"rm file.txt",
                          "rm -rf build",
                          "mv a b",
                          "cp a b",
                          "touch new.txt",
                          "mkdir out",
                          "echo hi > file.txt",
                          "cat a >> b",
                          "ls | tee out.txt",
                          "sed -i 's/a/b/' file",
                          "chmod +x run.sh",
                          "git push",
                          "git commit -m msg",
                          "git checkout main",
                          "git reset --hard",
                          "pip install requests",
                          "npm install",
                          "apt-get install vim",
                          "sudo ls",
                          "curl -o out.html http://example.com",
                          "cat ${IFS}file",
                          "diff <(ls a) <(ls b)",
                          "find . -name '*.o' | xargs rm",
                          "find . -name '*.o' -delete",
                          "find . -type f -exec chmod 644 {} +",
                          "ls && sudo",
                          "ls; . ./env.sh"}) {
    EXPECT_TRUE(is_write_shell_command(cmd)) << cmd;
  }
}

TEST(WriteDetectorTest, UnknownShellCommandIsWrite) {
  EXPECT_TRUE(is_write_shell_command("make install"));
  EXPECT_TRUE(is_write_shell_command("python script.py"));
  // git with a subcommand outside the safe list
  EXPECT_TRUE(is_write_shell_command("git gc"));
}

TEST(WriteDetectorTest, EmptyCommandIsRead) {
  EXPECT_FALSE(is_write_shell_command(""));
  EXPECT_FALSE(is_write_shell_command("   "));
  EXPECT_FALSE(is_write_operation("bash", json::object()));
}

TEST(WriteDetectorTest, ShellToolsUseCommandText) {
  EXPECT_FALSE(is_write_operation("bash", {{"command", "ls"}}));
  EXPECT_TRUE(is_write_operation("bash", {{"command", "git push"}}));
  EXPECT_TRUE(is_write_operation("run_command", {{"CommandLine", "rm x"}}));
  EXPECT_FALSE(is_write_operation("execute_command", {{"cmd", "git status"}}));
}

// --- ModeManager ---

class ModeManagerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (auto id : subscriptions_) {
      Bus::instance().unsubscribe(id);
    }
  }

  std::vector<Bus::SubscriptionId> subscriptions_;
};

TEST_F(ModeManagerTest, DefaultsToNormal) {
  ModeManager manager;
  EXPECT_EQ(manager.current_mode(), Mode::Normal);
  EXPECT_FALSE(manager.auto_approve());
  EXPECT_FALSE(manager.read_only());
  EXPECT_EQ(manager.history().size(), 1u);
}

TEST_F(ModeManagerTest, CycleReturnsOldAndNew) {
  ModeManager manager;

  auto [old_mode, new_mode] = manager.cycle_mode();
  EXPECT_EQ(old_mode, Mode::Normal);
  EXPECT_EQ(new_mode, Mode::Auto);
  EXPECT_TRUE(manager.auto_approve());

  manager.cycle_mode();
  EXPECT_EQ(manager.current_mode(), Mode::Plan);
  EXPECT_TRUE(manager.read_only());

  manager.cycle_mode();
  manager.cycle_mode();
  auto last = manager.cycle_mode();
  EXPECT_EQ(last.first, Mode::Architect);
  EXPECT_EQ(last.second, Mode::Normal);

  auto history = manager.history();
  ASSERT_EQ(history.size(), 6u);
  EXPECT_EQ(history[0].first, Mode::Normal);
  EXPECT_EQ(history[2].first, Mode::Plan);
  EXPECT_EQ(history[5].first, Mode::Normal);
}

TEST_F(ModeManagerTest, PublishesModeChanged) {
  std::vector<std::string> seen;
  subscriptions_.push_back(Bus::instance().subscribe<events::ModeChanged>(
      [&](const events::ModeChanged &e) { seen.push_back(e.old_mode + "->" + e.new_mode); }));

  ModeManager manager;
  manager.cycle_mode();
  manager.set_mode(Mode::Architect);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], "normal->auto");
  EXPECT_EQ(seen[1], "auto->architect");
}

TEST_F(ModeManagerTest, PlanBlocksWritesWithModeInReason) {
  ModeManager manager(Mode::Plan);

  auto check = manager.should_block_tool("write_file", {{"path", "a.txt"}, {"content", "x"}});
  EXPECT_TRUE(check.blocked);
  ASSERT_TRUE(check.reason.has_value());
  EXPECT_NE(check.reason->find("PLAN"), std::string::npos);
  EXPECT_NE(check.reason->find("write_file"), std::string::npos);
  EXPECT_NE(check.reason->find("Shift+Tab"), std::string::npos);
}

TEST_F(ModeManagerTest, PlanAllowsReads) {
  ModeManager manager(Mode::Plan);

  EXPECT_FALSE(manager.should_block_tool("read_file", {{"path", "a.txt"}}).blocked);
  EXPECT_FALSE(manager.should_block_tool("bash", {{"command", "git status"}}).blocked);
  EXPECT_TRUE(manager.should_block_tool("bash", {{"command", "git push"}}).blocked);
}

TEST_F(ModeManagerTest, PlanBlocksDestructiveVerbAtEndOfPipeline) {
  ModeManager manager(Mode::Plan);

  EXPECT_TRUE(manager.should_block_tool("bash", {{"command", "find . -name '*.o' | xargs rm"}}).blocked);
  EXPECT_TRUE(manager.should_block_tool("bash", {{"command", "find . -name '*.o' -delete"}}).blocked);
  EXPECT_FALSE(manager.should_block_tool("bash", {{"command", "find . -name '*.o'"}}).blocked);
}

TEST_F(ModeManagerTest, ArchitectBlocksToo) {
  ModeManager manager(Mode::Architect);
  auto check = manager.should_block_tool("edit_file", json::object());
  EXPECT_TRUE(check.blocked);
  EXPECT_NE(check.reason->find("ARCHITECT"), std::string::npos);
}

TEST_F(ModeManagerTest, NonReadOnlyModesNeverBlock) {
  for (auto m : {Mode::Normal, Mode::Auto, Mode::Yolo}) {
    ModeManager manager(m);
    auto check = manager.should_block_tool("bash", {{"command", "rm -rf /"}});
    EXPECT_FALSE(check.blocked);
    EXPECT_FALSE(check.reason.has_value());
  }
}

TEST_F(ModeManagerTest, BlockCheckIsPure) {
  ModeManager manager(Mode::Plan);
  json args = {{"command", "echo hi > out.txt"}};

  auto first = manager.should_block_tool("bash", args);
  for (int i = 0; i < 10; ++i) {
    auto again = manager.should_block_tool("bash", args);
    EXPECT_EQ(again.blocked, first.blocked);
    EXPECT_EQ(again.reason, first.reason);
  }
}

TEST_F(ModeManagerTest, ShouldApproveTool) {
  ModeManager manager(Mode::Normal);
  EXPECT_FALSE(manager.should_approve_tool("read_file"));
  EXPECT_FALSE(manager.should_approve_tool("write_file"));

  manager.set_mode(Mode::Auto);
  EXPECT_TRUE(manager.should_approve_tool("write_file"));
  EXPECT_TRUE(manager.should_approve_tool("anything"));

  manager.set_mode(Mode::Plan);
  EXPECT_TRUE(manager.should_approve_tool("read_file"));
  EXPECT_FALSE(manager.should_approve_tool("bash"));
}

TEST_F(ModeManagerTest, DisplayStrings) {
  ModeManager manager(Mode::Plan);
  EXPECT_EQ(manager.mode_indicator(), "📋 PLAN");
  EXPECT_FALSE(manager.mode_description().empty());
  EXPECT_NE(manager.get_system_prompt_modifier().find("PLAN"), std::string::npos);

  auto message = ModeManager::transition_message(Mode::Normal, Mode::Auto);
  EXPECT_NE(message.find("NORMAL"), std::string::npos);
  EXPECT_NE(message.find("AUTO"), std::string::npos);
}

TEST_F(ModeManagerTest, StateJson) {
  ModeManager manager(Mode::Yolo);
  manager.cycle_mode();

  auto j = manager.to_json();
  EXPECT_EQ(j["mode"], "architect");
  EXPECT_EQ(j["read_only"], true);
  EXPECT_EQ(j["auto_approve"], false);
  EXPECT_EQ(j["transitions"], 1);
  EXPECT_TRUE(j["started_at"].is_string());
}

TEST_F(ModeManagerTest, ConcurrentCyclingKeepsHistoryConsistent) {
  ModeManager manager;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&manager] {
      for (int i = 0; i < 25; ++i) {
        manager.cycle_mode();
      }
    });
  }
  for (auto &th : threads) th.join();

  // 100 cycles over a 5-mode ring lands back on the start
  EXPECT_EQ(manager.current_mode(), Mode::Normal);
  EXPECT_EQ(manager.history().size(), 101u);
}
