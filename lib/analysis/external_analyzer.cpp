// php_refactor/analysis/external_analyzer.cpp - PHPStan runner
#include "php_refactor/analysis/external_analyzer.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <thread>

#include "php_refactor/basic/logging.hpp"

namespace php_refactor
{

namespace
{

using json = nlohmann::json;
namespace fs = std::filesystem;

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

fs::path relative_to_root(const fs::path & file, const fs::path & root)
{
  std::error_code ec;
  const fs::path abs_file = fs::weakly_canonical(file, ec);
  const fs::path abs_root = fs::weakly_canonical(root, ec);
  if (ec) {
    return file;
  }
  const fs::path rel = abs_file.lexically_relative(abs_root);
  if (rel.empty() || *rel.begin() == "..") {
    return file;
  }
  return rel;
}

std::optional<std::string> find_in_path(std::string_view program)
{
  const char * path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }
  std::string_view dirs(path_env);
  while (!dirs.empty()) {
    const size_t colon = dirs.find(':');
    const std::string_view dir = dirs.substr(0, colon);
    if (!dir.empty()) {
      const fs::path candidate = fs::path(std::string(dir)) / std::string(program);
      if (::access(candidate.c_str(), X_OK) == 0) {
        return candidate.string();
      }
    }
    if (colon == std::string_view::npos) {
      break;
    }
    dirs.remove_prefix(colon + 1);
  }
  return std::nullopt;
}

}  // namespace

// ============================================================================
// Subprocess
// ============================================================================

ProcessResult run_process(
  const std::vector<std::string> & argv, const fs::path & cwd, std::chrono::milliseconds timeout)
{
  ProcessResult result;
  if (argv.empty()) {
    result.spawn_failed = true;
    return result;
  }

  int out_pipe[2] = {-1, -1};
  if (::pipe(out_pipe) != 0) {
    result.spawn_failed = true;
    return result;
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto & a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);
  const std::string dir = cwd.string();

  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    result.spawn_failed = true;
    return result;
  }
  if (pid == 0) {
    // child
    ::dup2(out_pipe[1], STDOUT_FILENO);
    const int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDERR_FILENO);
      ::close(devnull);
    }
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
      _exit(127);
    }
    ::execvp(args[0], args.data());
    _exit(127);
  }

  // parent
  ::close(out_pipe[1]);
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  char buf[4096];
  for (;;) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - std::chrono::steady_clock::now())
                             .count();
    if (remaining <= 0) {
      result.timed_out = true;
      break;
    }
    struct pollfd pfd;
    pfd.fd = out_pipe[0];
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, static_cast<int>(remaining));
    if (pr == 0) {
      result.timed_out = true;
      break;
    }
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    const ssize_t r = ::read(out_pipe[0], buf, sizeof(buf));
    if (r < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (r == 0) {
      break;
    }
    result.output.append(buf, static_cast<size_t>(r));
  }
  ::close(out_pipe[0]);

  int status = 0;
  while (!result.timed_out) {
    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
      return result;
    }
    if (w < 0 && errno != EINTR) {
      return result;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  ::kill(pid, SIGKILL);
  (void)::waitpid(pid, &status, 0);
  return result;
}

// ============================================================================
// Output parsing
// ============================================================================

AnalysisResult parse_phpstan_output(
  std::string_view json_text, const fs::path & file, const fs::path & relative_path)
{
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::exception & e) {
    return AnalysisResult::fail(fmt::format("invalid analyzer output: {}", e.what()));
  }

  // PHPStan writes `"files": []` when nothing was reported.
  if (!root.is_object() || !root.contains("files") || !root["files"].is_object()) {
    return AnalysisResult::ok({});
  }
  const json & files = root["files"];

  const json * entry = nullptr;
  if (files.contains(file.string())) {
    entry = &files[file.string()];
  }
  const std::string rel = relative_path.generic_string();
  for (auto it = files.begin(); entry == nullptr && it != files.end(); ++it) {
    if (!rel.empty() && ends_with(it.key(), rel)) {
      entry = &it.value();
    }
  }
  for (auto it = files.begin(); entry == nullptr && it != files.end(); ++it) {
    if (fs::path(it.key()).filename() == file.filename()) {
      entry = &it.value();
    }
  }
  if (entry == nullptr && files.size() == 1) {
    entry = &files.begin().value();
  }
  if (entry == nullptr || !entry->is_object() || !entry->contains("messages")) {
    return AnalysisResult::ok({});
  }

  std::vector<AnalyzerMessage> out;
  for (const json & m : (*entry)["messages"]) {
    AnalyzerMessage msg;
    msg.line = m.contains("line") && m["line"].is_number_unsigned() ? m["line"].get<uint32_t>() : 1;
    msg.message = m.value("message", std::string());
    out.push_back(std::move(msg));
  }
  return AnalysisResult::ok(std::move(out));
}

void append_analyzer_diagnostics(
  const std::vector<AnalyzerMessage> & messages, const SourceFile & file, DiagnosticBag & diags)
{
  for (const auto & m : messages) {
    const uint32_t index = m.line > 0 ? m.line - 1 : 0;
    const uint32_t start = file.get_line_offset(index);
    const auto end = static_cast<uint32_t>(start + file.get_line(index).size());
    diags.report_error(SourceRange(start, end), m.message)
      .with_code(k_analyzer_source)
      .with_source(k_analyzer_source);
  }
}

// ============================================================================
// ExternalAnalyzer
// ============================================================================

ExternalAnalyzer::ExternalAnalyzer(
  fs::path project_root, AnalyzerConfig config, std::shared_ptr<spdlog::logger> logger)
: root_(std::move(project_root)),
  config_(std::move(config)),
  logger_(logger_or_default(std::move(logger)))
{
  if (!config_.enabled) {
    logger_->debug("static analyzer disabled by configuration");
    return;
  }
  if (auto exe = detect_executable()) {
    executable_ = std::move(*exe);
    active_ = true;
    logger_->debug("static analyzer: {}", executable_);
  } else {
    logger_->info(
      "PHPStan not found; install it with `composer require --dev phpstan/phpstan` to enable "
      "analysis");
  }
}

std::optional<std::string> ExternalAnalyzer::detect_executable()
{
  if (!config_.executable.empty()) {
    return config_.executable;
  }
  std::error_code ec;
  if (fs::exists(root_ / "vendor" / "bin" / "phpstan", ec)) {
    return std::string("vendor/bin/phpstan");
  }
  if (auto global = find_in_path("phpstan")) {
    // A binary on PATH is run directly, not through the interpreter.
    run_through_php_ = false;
    return global;
  }
  return std::nullopt;
}

std::vector<std::string> ExternalAnalyzer::command_for(const fs::path & file) const
{
  if (!active_) {
    return {};
  }
  std::vector<std::string> cmd;
  if (run_through_php_) {
    std::string php = config_.php;
    if (php.rfind("./", 0) == 0) {
      php = (root_ / php).lexically_normal().string();
    }
    cmd.push_back(std::move(php));
  }
  cmd.push_back(executable_);
  cmd.emplace_back("analyse");
  cmd.emplace_back("--error-format=json");
  cmd.emplace_back("--no-progress");
  cmd.push_back("--level=" + config_.level);
  cmd.push_back(relative_to_root(file, root_).string());
  return cmd;
}

AnalysisResult ExternalAnalyzer::analyze(const fs::path & file)
{
  if (!active_) {
    return AnalysisResult::fail("static analyzer is not active");
  }

  const auto cmd = command_for(file);
  logger_->debug("running {}", fmt::join(cmd, " "));
  const ProcessResult proc =
    run_process(cmd, root_, std::chrono::milliseconds(config_.timeout_ms));

  if (proc.spawn_failed || proc.exit_code == 127) {
    active_ = false;
    logger_->error(
      "cannot execute '{}'; static analysis disabled for this session", cmd.front());
    return AnalysisResult::fail(fmt::format("cannot execute '{}'", cmd.front()));
  }
  if (proc.timed_out) {
    logger_->warn("static analysis of {} timed out after {} ms", file.string(), config_.timeout_ms);
    return AnalysisResult::fail(fmt::format("timed out after {} ms", config_.timeout_ms));
  }

  // PHPStan exits with 1 when it reports errors; the JSON is still valid.
  AnalysisResult result = parse_phpstan_output(proc.output, file, relative_to_root(file, root_));
  if (!result.success) {
    logger_->warn("static analysis of {} failed (exit {}): {}", file.string(), proc.exit_code, result.error);
    return result;
  }
  logger_->info("static analysis of {}: {} message(s)", file.string(), result.messages.size());
  return result;
}

}  // namespace php_refactor
