#include "mode/write_detector.hpp"

#include <regex>
#include <set>
#include <sstream>
#include <vector>

namespace toolgate::mode {

// ============================================================
// Tool categorization
// ============================================================

static const std::set<std::string> &read_only_tools() {
  static const std::set<std::string> tools = {
      // File reading
      "read_file", "grep", "list_files", "find_files", "view_file", "search_files", "get_file_contents", "read",
      // Git read operations
      "git_status", "git_log", "git_diff", "git_show", "git_branch",
      // Todo/task reading
      "todo_read", "list_todos", "get_todos",
      // Context/info
      "get_time", "get_context", "get_cwd", "get_working_directory",
      // MCP read patterns
      "mcp_read", "mcp_get", "mcp_list", "mcp_search",
  };
  return tools;
}

static const std::set<std::string> &write_tools() {
  static const std::set<std::string> tools = {
      "write_file", "create_file", "delete_file",   "remove_file", "edit_file",   "patch_file",
      "search_replace", "modify_file", "todo_write", "todo_create", "todo_update",
  };
  return tools;
}

static const std::set<std::string> &shell_tools() {
  static const std::set<std::string> tools = {"bash", "shell", "run_command", "execute_command"};
  return tools;
}

static const std::set<std::string> &read_only_shell_commands() {
  static const std::set<std::string> commands = {
      "ls",   "cat",  "head",  "tail",     "find",     "grep",   "egrep",  "fgrep", "wc",
      "file", "which", "whereis", "pwd",   "echo",     "date",   "whoami", "tree",  "less",
      "more", "stat", "du",    "df",       "env",      "printenv", "hostname", "uname", "id",
      "groups", "type", "command", "git",
  };
  return commands;
}

static const std::set<std::string> &safe_git_subcommands() {
  static const std::set<std::string> subcommands = {
      "status", "log",      "diff",    "show",      "branch",   "tag",      "describe",  "ls-files",
      "ls-tree", "ls-remote", "remote", "config",   "help",     "version",  "reflog",    "shortlog",
      "blame",  "annotate", "grep",    "rev-parse", "rev-list", "cat-file", "fsck",      "count-objects",
  };
  return subcommands;
}

// ============================================================
// Write patterns (compiled once per process)
// ============================================================

static const std::vector<std::regex> &write_patterns() {
  static const std::vector<std::regex> patterns = [] {
    const char *sources[] = {
        // File modification
        R"(\brm(?:\s|$))",
        R"(\brmdir\b)",
        R"(\bmv(?:\s|$))",
        R"(\bcp(?:\s|$))",
        R"(\btouch(?:\s|$))",
        R"(\bmkdir(?:\s|$))",
        R"(\btruncate(?:\s|$))",
        R"(\bshred(?:\s|$))",
        R"(\bfind\b.*\s-(?:delete|exec|execdir|ok|okdir|fprint|fprint0|fprintf|fls)\b)",
        // Redirection and writing pipes
        R"(>)",
        R"(\|&)",
        R"(tee\b)",
        // In-place edits
        R"(\bsed\s+.*-i)",
        R"(\bawk\s+.*-i)",
        R"(\bperl\s+.*-i)",
        // Permissions and ownership
        R"(\bchmod(?:\s|$))",
        R"(\bchown(?:\s|$))",
        R"(\bchgrp(?:\s|$))",
        R"(\bchattr(?:\s|$))",
        // Shell manipulation
        R"(\beval(?:\s|$))",
        R"(\bsource(?:\s|$))",
        R"((?:^|[;&|]\s*)\.\s)",
        R"(\bexec(?:\s|$))",
        R"(\bdd(?:\s|$))",
        R"(\bmknod(?:\s|$))",
        R"(\bmkfifo(?:\s|$))",
        // Evasion
        R"(\$\{IFS\})",
        R"(\$IFS)",
        R"(>\s*\()",
        R"(<\s*\()",
        // Git mutation
        R"(\bgit\s+commit\b)",
        R"(\bgit\s+push\b)",
        R"(\bgit\s+checkout\b)",
        R"(\bgit\s+reset\b)",
        R"(\bgit\s+rebase\b)",
        R"(\bgit\s+merge\b)",
        R"(\bgit\s+stash\b)",
        R"(\bgit\s+cherry-pick\b)",
        R"(\bgit\s+clean\b)",
        R"(\bgit\s+apply\b)",
        R"(\bgit\s+rm\b)",
        R"(\bgit\s+mv\b)",
        R"(\bgit\s+init\b)",
        R"(\bgit\s+clone\b)",
        R"(\bgit\s+restore\b)",
        R"(\bgit\s+switch\b)",
        R"(\bgit\s+pull\b)",
        R"(\bgit\s+config\s+.*core\.editor)",
        // Downloads to file
        R"(\bcurl\s+.*-[oO#])",
        R"(\bwget\s+.*-O)",
        // Package managers
        R"(\bpip\s+(?:install|uninstall)\b)",
        R"(\bpip3\s+(?:install|uninstall)\b)",
        R"(\buv\s+(?:pip|add|remove)\b)",
        R"(\bnpm\s+(?:install|i|add|remove|update)\b)",
        R"(\byarn\s+(?:add|remove)\b)",
        R"(\bpnpm\s+(?:add|remove)\b)",
        R"(\bapt\s+(?:install|remove|purge)\b)",
        R"(\bapt-get\s+(?:install|remove|purge)\b)",
        R"(\byum\s+(?:install|remove)\b)",
        R"(\bdnf\s+(?:install|remove)\b)",
        R"(\bbrew\s+(?:install|uninstall)\b)",
        R"(\bpacman\s+-[RS])",
        R"(\bgem\s+(?:install|uninstall)\b)",
        R"(\bcargo\s+(?:install|uninstall)\b)",
        // Privilege escalation
        R"(\bsudo(?:\s|$))",
        R"(\bsu(?:\s|$))",
        R"(\bdoas(?:\s|$))",
    };

    std::vector<std::regex> compiled;
    for (const char *source : sources) {
      compiled.emplace_back(source, std::regex::ECMAScript | std::regex::optimize);
    }
    return compiled;
  }();
  return patterns;
}

// ============================================================
// Classification
// ============================================================

bool is_read_only_tool(const std::string &tool_name) {
  return read_only_tools().count(tool_name) > 0;
}

bool is_write_tool(const std::string &tool_name) {
  return write_tools().count(tool_name) > 0;
}

bool is_shell_tool(const std::string &tool_name) {
  return shell_tools().count(tool_name) > 0;
}

std::string extract_command(const json &args) {
  if (!args.is_object()) return "";

  for (const char *key : {"command", "cmd", "CommandLine", "commandLine"}) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) continue;
    std::string command = it->is_string() ? it->get<std::string>()
                                            : it->dump(-1, ' ', false, json::error_handler_t::replace);
    if (!command.empty()) return command;
  }
  return "";
}

bool is_write_shell_command(const std::string &command) {
  std::istringstream iss(command);
  std::vector<std::string> parts;
  std::string part;
  while (iss >> part) {
    parts.push_back(part);
  }
  if (parts.empty()) {
    return false;
  }

  // Write patterns first: "echo hi > file" is a write even though echo is read-only
  for (const auto &pattern : write_patterns()) {
    if (std::regex_search(command, pattern)) {
      return true;
    }
  }

  const auto &base_cmd = parts[0];
  if (base_cmd == "git" && parts.size() > 1) {
    return safe_git_subcommands().count(parts[1]) == 0;
  }

  return read_only_shell_commands().count(base_cmd) == 0;
}

bool is_write_operation(const std::string &tool_name, const json &args) {
  if (is_write_tool(tool_name)) {
    return true;
  }
  if (is_shell_tool(tool_name)) {
    return is_write_shell_command(extract_command(args));
  }
  if (is_read_only_tool(tool_name)) {
    return false;
  }
  return true;
}

}  // namespace toolgate::mode
