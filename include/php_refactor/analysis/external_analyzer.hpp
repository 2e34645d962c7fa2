// php_refactor/analysis/external_analyzer.hpp - PHPStan runner
#pragma once

#include <spdlog/logger.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "php_refactor/basic/diagnostic.hpp"
#include "php_refactor/basic/source_manager.hpp"
#include "php_refactor/project/project_config.hpp"

namespace php_refactor
{

inline constexpr const char * k_analyzer_source = "phpstan";

// ============================================================================
// Subprocess
// ============================================================================

struct ProcessResult
{
  int exit_code = -1;
  bool timed_out = false;
  bool spawn_failed = false;
  std::string output;  ///< captured stdout
};

/**
 * Run `argv` in `cwd`, capturing stdout. The child is killed once `timeout`
 * expires. A program that cannot be executed exits with status 127.
 */
[[nodiscard]] ProcessResult run_process(
  const std::vector<std::string> & argv, const std::filesystem::path & cwd,
  std::chrono::milliseconds timeout);

// ============================================================================
// Analysis results
// ============================================================================

struct AnalyzerMessage
{
  uint32_t line = 0;  ///< 1-indexed
  std::string message;
};

struct AnalysisResult
{
  bool success = false;
  std::string error;
  std::vector<AnalyzerMessage> messages;

  static AnalysisResult ok(std::vector<AnalyzerMessage> msgs)
  {
    AnalysisResult r;
    r.success = true;
    r.messages = std::move(msgs);
    return r;
  }

  static AnalysisResult fail(std::string msg)
  {
    AnalysisResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Messages for `file` in PHPStan's `--error-format=json` output.
 *
 * The `files` object is keyed by whatever path PHPStan saw (a container
 * path, say). The entry is chosen by exact path, then a key ending with
 * `relative_path`, then a matching basename, then the sole entry.
 */
[[nodiscard]] AnalysisResult parse_phpstan_output(
  std::string_view json_text, const std::filesystem::path & file,
  const std::filesystem::path & relative_path);

/// Line-wide error diagnostics (source "phpstan") for `messages` in `file`.
void append_analyzer_diagnostics(
  const std::vector<AnalyzerMessage> & messages, const SourceFile & file, DiagnosticBag & diags);

// ============================================================================
// ExternalAnalyzer
// ============================================================================

/**
 * Runs PHPStan on single files from the project root.
 *
 * The executable is taken from the configuration, then vendor/bin/phpstan,
 * then PATH. Once the interpreter or executable turns out to be missing the
 * analyzer stays inactive for the rest of the session.
 */
class ExternalAnalyzer
{
public:
  ExternalAnalyzer(
    std::filesystem::path project_root, AnalyzerConfig config,
    std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] bool is_active() const noexcept { return active_; }

  /// Command line used for `file` (empty when inactive).
  [[nodiscard]] std::vector<std::string> command_for(const std::filesystem::path & file) const;

  [[nodiscard]] AnalysisResult analyze(const std::filesystem::path & file);

private:
  [[nodiscard]] std::optional<std::string> detect_executable();

  std::filesystem::path root_;
  AnalyzerConfig config_;
  std::shared_ptr<spdlog::logger> logger_;

  std::string executable_;
  bool run_through_php_ = true;
  bool active_ = false;
};

}  // namespace php_refactor
