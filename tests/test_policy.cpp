#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>
#include <vector>

#include "bus/bus.hpp"
#include "permission/policy.hpp"

using namespace toolgate;
using namespace toolgate::permission;

namespace fs = std::filesystem;

namespace {

Config bash_config() {
  Config config;
  config.tools["bash"].permission = ToolPermission::AskIterations;
  config.tools["bash"].allowlist = {"git status*", "ls*"};
  config.tools["bash"].denylist = {"rm -rf*", "git status --evil*"};
  config.tools["write_file"].denylist = {"/etc/*"};
  config.tools["read_file"].permission = ToolPermission::Always;
  return config;
}

}  // namespace

// --- Resolution ---

TEST(PolicyTest, DefaultPermissionIsAsk) {
  PermissionPolicy policy(Config{});
  EXPECT_EQ(policy.resolve("anything", json::object()), ToolPermission::Ask);
}

TEST(PolicyTest, ConfiguredDefault) {
  Config config;
  config.default_permission = ToolPermission::Never;
  PermissionPolicy policy(config);
  EXPECT_EQ(policy.resolve("bash", {{"command", "ls"}}), ToolPermission::Never);
}

TEST(PolicyTest, ToolPermission) {
  PermissionPolicy policy(bash_config());
  EXPECT_EQ(policy.resolve("read_file", {{"path", "a"}}), ToolPermission::Always);
  EXPECT_EQ(policy.resolve("bash", {{"command", "git push"}}), ToolPermission::AskIterations);
}

TEST(PolicyTest, AllowAndDenyGlobs) {
  PermissionPolicy policy(bash_config());

  EXPECT_EQ(policy.resolve("bash", {{"command", "git status"}}), ToolPermission::Always);
  EXPECT_EQ(policy.resolve("bash", {{"command", "ls -la"}}), ToolPermission::Always);
  EXPECT_EQ(policy.resolve("bash", {{"command", "rm -rf build"}}), ToolPermission::Never);
}

TEST(PolicyTest, DenyWinsOverAllow) {
  PermissionPolicy policy(bash_config());
  // Matches both "git status*" and "git status --evil*"
  EXPECT_EQ(policy.resolve("bash", {{"command", "git status --evil"}}), ToolPermission::Never);
}

TEST(PolicyTest, GlobsDoNotChangeStoredPermission) {
  PermissionPolicy policy(bash_config());
  policy.resolve("bash", {{"command", "rm -rf /"}});
  EXPECT_EQ(policy.base_permission("bash"), ToolPermission::AskIterations);
}

TEST(PolicyTest, PathSubject) {
  PermissionPolicy policy(bash_config());
  EXPECT_EQ(policy.resolve("write_file", {{"path", "/etc/passwd"}}), ToolPermission::Never);
  EXPECT_EQ(policy.resolve("write_file", {{"file_path", "/etc/hosts"}}), ToolPermission::Never);
  // No permission configured for write_file: falls back to default
  EXPECT_EQ(policy.resolve("write_file", {{"path", "/tmp/out.txt"}}), ToolPermission::Ask);
}

TEST(PolicyTest, MatchSubject) {
  EXPECT_EQ(PermissionPolicy::match_subject({{"command", "git push"}}), "git push");
  EXPECT_EQ(PermissionPolicy::match_subject({{"cmd", "ls"}}), "ls");
  EXPECT_EQ(PermissionPolicy::match_subject({{"path", "/a"}}), "/a");
  EXPECT_EQ(PermissionPolicy::match_subject({{"filePath", "/b"}}), "/b");
  EXPECT_EQ(PermissionPolicy::match_subject({{"query", "x"}}), R"({"query":"x"})");
  EXPECT_EQ(PermissionPolicy::match_subject(json()), "");
}

TEST(PolicyTest, SetPermissionPublishesNewSnapshot) {
  PermissionPolicy policy(bash_config());
  auto before = policy.snapshot();

  policy.set_permission("bash", ToolPermission::Never);

  auto after = policy.snapshot();
  EXPECT_NE(before.get(), after.get());
  EXPECT_GT(after->version, before->version);
  // Readers holding the old snapshot are unaffected
  EXPECT_EQ(before->base_permission("bash"), ToolPermission::AskIterations);
  EXPECT_EQ(after->base_permission("bash"), ToolPermission::Never);
  // Globs survive the change
  EXPECT_EQ(policy.resolve("bash", {{"command", "git status"}}), ToolPermission::Always);
}

TEST(PolicyTest, PersistAlwaysWithoutBackingFile) {
  PermissionPolicy policy(Config{});
  ASSERT_TRUE(policy.backing_file().empty());

  auto result = policy.persist_always("bash");
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value->empty());
  EXPECT_EQ(policy.resolve("bash", {{"command", "git push"}}), ToolPermission::Always);
}

TEST(PolicyTest, ReloadWithoutBackingFileFails) {
  PermissionPolicy policy(Config{});
  EXPECT_TRUE(policy.reload().failed());
}

TEST(PolicyTest, ConcurrentReadersDuringWrites) {
  PermissionPolicy policy(bash_config());
  std::atomic<bool> stop{false};
  std::atomic<int> bad{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop) {
        auto perm = policy.resolve("bash", {{"command", "git push"}});
        if (perm != ToolPermission::AskIterations && perm != ToolPermission::Always) ++bad;
      }
    });
  }

  for (int i = 0; i < 50; ++i) {
    policy.set_permission("bash", i % 2 ? ToolPermission::Always : ToolPermission::AskIterations);
  }
  stop = true;
  for (auto &t : readers) t.join();

  EXPECT_EQ(bad.load(), 0);
}

// --- Backing file ---

class PolicyFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    dir_ = fs::temp_directory_path() / ("toolgate_policy_" + std::to_string(rd()));
    fs::create_directories(dir_);
    path_ = dir_ / "config.json";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void write(const std::string &text) {
    std::ofstream file(path_);
    file << text;
  }

  json read() {
    std::ifstream file(path_);
    return json::parse(file);
  }

  fs::path dir_;
  fs::path path_;
};

TEST_F(PolicyFileTest, PersistAlwaysWritesFileAndSnapshot) {
  write(R"({"log_level": "debug", "extra": {"keep": true},
            "tools": {"bash": {"permission": "ask-iterations", "denylist": ["rm -rf*"]}}})");

  auto config = Config::load(path_);
  PermissionPolicy policy(config);
  EXPECT_EQ(policy.backing_file(), path_);

  std::string persisted_path;
  auto sub = Bus::instance().subscribe<events::PolicyPersisted>(
      [&](const events::PolicyPersisted &e) { persisted_path = e.path; });

  auto result = policy.persist_always("bash");
  Bus::instance().unsubscribe(sub);

  ASSERT_TRUE(result.ok()) << result.error.value_or("");
  EXPECT_EQ(*result.value, path_);
  EXPECT_EQ(persisted_path, path_.string());

  auto j = read();
  EXPECT_EQ(j["tools"]["bash"]["permission"], "always");
  EXPECT_EQ(j["tools"]["bash"]["denylist"], json::array({"rm -rf*"}));
  EXPECT_EQ(j["extra"]["keep"], true);
  EXPECT_EQ(j["log_level"], "debug");

  EXPECT_EQ(policy.base_permission("bash"), ToolPermission::Always);
  // Deny globs still apply after persisting
  EXPECT_EQ(policy.resolve("bash", {{"command", "rm -rf /"}}), ToolPermission::Never);
}

TEST_F(PolicyFileTest, PersistFailureLeavesSnapshotUnchanged) {
  write(R"({"tools": {"bash": {"permission": "ask"}}})");
  PermissionPolicy policy(Config::load(path_));
  auto before = policy.snapshot();

  // Corrupt the file after loading: the update must refuse to overwrite it
  write("{ broken");

  auto result = policy.persist_always("bash");
  EXPECT_TRUE(result.failed());
  EXPECT_EQ(policy.snapshot().get(), before.get());
  EXPECT_EQ(policy.base_permission("bash"), ToolPermission::Ask);
}

TEST_F(PolicyFileTest, Reload) {
  write(R"({"tools": {"bash": {"permission": "ask"}}})");
  PermissionPolicy policy(Config::load(path_));
  EXPECT_EQ(policy.base_permission("bash"), ToolPermission::Ask);

  write(R"({"tools": {"bash": {"permission": "never"}}})");
  ASSERT_TRUE(policy.reload().ok());
  EXPECT_EQ(policy.base_permission("bash"), ToolPermission::Never);

  // A malformed file keeps the last good snapshot
  write("not json");
  EXPECT_TRUE(policy.reload().failed());
  EXPECT_EQ(policy.base_permission("bash"), ToolPermission::Never);

  // So does a value of the wrong type
  write(R"({"approval": {"timeout_seconds": "30"}, "tools": {"bash": {"permission": "always"}}})");
  EXPECT_TRUE(policy.reload().failed());
  EXPECT_EQ(policy.base_permission("bash"), ToolPermission::Never);
}
