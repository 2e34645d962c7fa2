// phpref - PHP refactoring engine command line interface
//
// Usage:
//   phpref index
//   phpref check [file.php...]
//   phpref rename-method <file.php> <old> <new> [--at <byte>]
//   phpref move <old.php> <new.php>
//   phpref add-import <file.php> <FQN>...
//   phpref definition <name>
//   phpref implementations <name>
//   phpref analyze <file.php>
//
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "php_refactor/analysis/external_analyzer.hpp"
#include "php_refactor/basic/diagnostic_printer.hpp"
#include "php_refactor/basic/logging.hpp"
#include "php_refactor/diagnostics/import_diagnostics.hpp"
#include "php_refactor/index/symbol_index.hpp"
#include "php_refactor/project/autoload.hpp"
#include "php_refactor/project/file_enumerator.hpp"
#include "php_refactor/project/project_config.hpp"
#include "php_refactor/refactor/edit_planner.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "PHP refactoring engine v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [arguments] [options]\n\n"
            << "Commands:\n"
            << "  index                              Scan the project and print index statistics\n"
            << "  check [file.php...]                Report parse errors and missing imports\n"
            << "  rename-method <file> <old> <new>   Rename a method and its typed call sites\n"
            << "  move <old.php> <new.php>           Move a file, updating namespaces and imports\n"
            << "  add-import <file> <FQN>...         Add use statements to a file\n"
            << "  definition <name>                  Locate type or method definitions\n"
            << "  implementations <name>             List classes implementing an interface\n"
            << "  analyze <file.php>                 Run PHPStan on a file\n\n"
            << "Options:\n"
            << "  --root <dir>             Project root (default: nearest phpref.yaml or composer.json)\n"
            << "  --at <byte>              Cursor offset for rename-method\n"
            << "  --apply                  Write the planned edits to disk\n"
            << "  --json                   Print results as JSON\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

json range_json(const php_refactor::FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

std::string location(const fs::path & path, const php_refactor::FullSourceRange & r)
{
  return path.string() + ":" + std::to_string(r.start_line) + ":" + std::to_string(r.start_column);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string root;
  std::optional<uint32_t> cursor;
  bool apply = false;
  bool json_output = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--root") {
      if (i + 1 < argc) {
        args.root = argv[++i];
      }
    } else if (arg == "--at") {
      if (i + 1 < argc) {
        args.cursor = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
      }
    } else if (arg == "--apply") {
      args.apply = true;
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.positional.push_back(std::move(arg));
    }
  }

  return args;
}

// ============================================================================
// Project session
// ============================================================================

fs::path detect_root(const CommandArgs & args)
{
  if (!args.root.empty()) {
    return fs::absolute(args.root);
  }
  const fs::path cwd = fs::current_path();
  if (auto config_path = php_refactor::find_project_config(cwd)) {
    return config_path->parent_path();
  }
  if (auto composer_root = php_refactor::find_autoload_root(cwd)) {
    return *composer_root;
  }
  return cwd;
}

/// Project state shared by every command.
struct Session
{
  explicit Session(const CommandArgs & args)
  : root(detect_root(args)),
    logger(php_refactor::default_logger()),
    resolver(root, logger),
    index(logger)
  {
    const fs::path config_path = root / php_refactor::k_project_config_file_name;
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
      auto loaded = php_refactor::load_project_config(config_path);
      if (!loaded.success) {
        std::cerr << "error: " << config_path.string() << ": " << loaded.error << "\n";
        config_ok = false;
      }
      config = loaded.success ? std::move(loaded.config) : php_refactor::default_project_config(root);
    } else {
      config = php_refactor::default_project_config(root);
    }
    config.project_root = root;
  }

  void build_index()
  {
    files = php_refactor::enumerate_source_files(
      root, php_refactor::EnumerateOptions::from_config(config.indexer), logger);
    (void)index.rebuild(files, {}, std::chrono::milliseconds(config.indexer.time_slice_ms));
  }

  php_refactor::EditPlanner planner() const
  {
    php_refactor::EditPlanner p(index, resolver, nullptr, logger);
    p.set_candidate_files(files);
    return p;
  }

  fs::path root;
  std::shared_ptr<spdlog::logger> logger;
  php_refactor::ProjectConfig config;
  php_refactor::NamespaceResolver resolver;
  php_refactor::SymbolIndex index;
  std::vector<fs::path> files;
  bool config_ok = true;
};

fs::path input_path(const std::string & arg) { return fs::absolute(arg).lexically_normal(); }

bool write_file(const fs::path & path, const std::string & content)
{
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return false;
  }
  out << content;
  return static_cast<bool>(out);
}

/// Apply edits file by file. Returns false if any file could not be rewritten.
bool apply_result(const php_refactor::RefactorResult & result)
{
  php_refactor::EditSet set;
  for (const auto & op : result.edits) {
    (void)set.add(op);
  }

  bool ok = true;
  for (const auto & file : set.files()) {
    const auto text = php_refactor::read_file_to_string(file);
    if (!text) {
      std::cerr << "error: cannot read " << file.string() << "\n";
      ok = false;
      continue;
    }
    const auto ops = set.for_file(file);
    if (!write_file(file, php_refactor::apply_edits(*text, ops))) {
      std::cerr << "error: cannot write " << file.string() << "\n";
      ok = false;
    }
  }
  return ok;
}

int report_result(const php_refactor::RefactorResult & result, const CommandArgs & args)
{
  if (args.json_output) {
    json out;
    out["success"] = result.success;
    if (!result.success) {
      out["error"] = result.error;
    }
    out["warnings"] = result.warnings;
    out["edits"] = json::array();
    for (const auto & op : result.edits) {
      out["edits"].push_back(json{
        {"file", op.target_file.string()},
        {"range", range_json(op.range)},
        {"newText", op.replacement_text},
      });
    }
    std::cout << out.dump(2) << "\n";
  } else {
    for (const auto & w : result.warnings) {
      std::cerr << "warning: " << w << "\n";
    }
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
    }
    for (const auto & op : result.edits) {
      std::cout << location(op.target_file, op.range) << ": "
                << (op.is_insertion() ? "insert" : "replace") << " \"" << op.replacement_text
                << "\"\n";
    }
  }
  return result.success ? 0 : 1;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_index(const CommandArgs & args)
{
  Session session(args);
  session.build_index();
  const auto stats = session.index.stats();

  if (args.json_output) {
    json out;
    out["root"] = session.root.string();
    out["files"] = stats.files;
    out["definitions"] = stats.definitions;
    out["methods"] = stats.methods;
    out["usageSymbols"] = stats.usage_symbols;
    out["inheritance"] = stats.inheritance;
    std::cout << out.dump(2) << "\n";
  } else {
    std::cout << "Indexed " << stats.files << " file(s) under " << session.root.string() << "\n"
              << "  definitions:   " << stats.definitions << "\n"
              << "  methods:       " << stats.methods << "\n"
              << "  usage symbols: " << stats.usage_symbols << "\n"
              << "  inheritance:   " << stats.inheritance << "\n";
  }
  return session.config_ok ? 0 : 1;
}

int cmd_check(const CommandArgs & args)
{
  Session session(args);
  session.build_index();

  std::vector<fs::path> targets;
  for (const auto & p : args.positional) {
    targets.push_back(input_path(p));
  }
  if (targets.empty()) {
    targets = session.files;
  }

  const bool use_color = isatty(fileno(stderr)) != 0;
  php_refactor::DiagnosticPrinter printer(std::cerr, use_color);

  size_t error_count = 0;
  json report = json::array();
  for (const auto & path : targets) {
    auto text = php_refactor::read_file_to_string(path);
    if (!text) {
      std::cerr << "error: file not found: " << path.string() << "\n";
      ++error_count;
      continue;
    }
    const php_refactor::SourceFile source(path, *text);

    php_refactor::DiagnosticBag diags;
    const auto tree = php_refactor::parse_php(path, std::move(*text), &diags);
    if (tree) {
      (void)php_refactor::check_missing_imports(*tree, session.index, diags);
    }
    for (const auto & d : diags) {
      if (d.severity == php_refactor::Severity::Error) {
        ++error_count;
      }
      if (args.json_output) {
        report.push_back(json{
          {"file", path.string()},
          {"message", d.message},
          {"code", d.code},
          {"severity", php_refactor::to_string(d.severity)},
          {"range", range_json(source.get_full_range(d.primary_range()))},
        });
      }
    }
    if (!args.json_output) {
      printer.print_all(diags, source);
      if (diags.empty() && args.verbose) {
        std::cerr << path.string() << ": OK\n";
      }
    }
  }

  if (args.json_output) {
    std::cout << report.dump(2) << "\n";
  } else if (error_count == 0) {
    std::cout << targets.size() << " file(s): OK\n";
  }
  return error_count == 0 ? 0 : 1;
}

int cmd_rename_method(const CommandArgs & args)
{
  if (args.positional.size() < 3) {
    std::cerr << "error: file, old name and new name required\n";
    std::cerr << "usage: phpref rename-method <file.php> <old> <new> [--at <byte>]\n";
    return 1;
  }

  Session session(args);
  session.build_index();

  const auto result = session.planner().rename_method(
    input_path(args.positional[0]), args.positional[1], args.positional[2], args.cursor);
  const int rc = report_result(result, args);
  if (rc == 0 && args.apply && !apply_result(result)) {
    return 1;
  }
  return rc;
}

int cmd_move(const CommandArgs & args)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: old and new paths required\n";
    std::cerr << "usage: phpref move <old.php> <new.php>\n";
    return 1;
  }

  Session session(args);
  session.build_index();

  const fs::path old_path = input_path(args.positional[0]);
  const fs::path new_path = input_path(args.positional[1]);
  const auto result = session.planner().move_file(old_path, new_path);
  const int rc = report_result(result, args);
  if (rc != 0 || !args.apply) {
    return rc;
  }

  if (!apply_result(result)) {
    return 1;
  }

  std::error_code ec;
  if (fs::exists(old_path, ec) && !fs::exists(new_path, ec)) {
    fs::create_directories(new_path.parent_path(), ec);
    fs::rename(old_path, new_path, ec);
    if (ec) {
      std::cerr << "error: cannot move " << old_path.string() << ": " << ec.message() << "\n";
      return 1;
    }
  }
  return 0;
}

int cmd_add_import(const CommandArgs & args)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: file and at least one FQN required\n";
    std::cerr << "usage: phpref add-import <file.php> <FQN>...\n";
    return 1;
  }

  Session session(args);
  const std::vector<std::string> fqns(args.positional.begin() + 1, args.positional.end());
  const auto result = session.planner().add_imports(input_path(args.positional[0]), fqns);
  const int rc = report_result(result, args);
  if (rc == 0 && args.apply && !apply_result(result)) {
    return 1;
  }
  return rc;
}

int print_definitions(const std::vector<php_refactor::SymbolDefinition> & defs, const CommandArgs & args)
{
  if (args.json_output) {
    json out = json::array();
    for (const auto & def : defs) {
      out.push_back(json{
        {"name", def.name},
        {"fqn", def.fqn},
        {"kind", php_refactor::to_string(def.kind)},
        {"file", def.path.string()},
        {"range", range_json(def.name_range)},
      });
    }
    std::cout << out.dump(2) << "\n";
  } else {
    for (const auto & def : defs) {
      std::cout << location(def.path, def.name_range) << ": " << php_refactor::to_string(def.kind)
                << " " << (def.parent_fqn.empty() ? def.fqn : def.parent_fqn + "::" + def.name)
                << "\n";
    }
  }
  return defs.empty() ? 1 : 0;
}

int cmd_definition(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: name required\n";
    std::cerr << "usage: phpref definition <Class|Class::method|method>\n";
    return 1;
  }

  Session session(args);
  session.build_index();

  const std::string & name = args.positional[0];
  const size_t sep = name.find("::");
  if (sep != std::string::npos) {
    return print_definitions(
      session.index.lookup_method(name.substr(0, sep), name.substr(sep + 2)), args);
  }

  auto defs = session.index.lookup_definitions(name);
  if (defs.empty()) {
    defs = session.index.methods_named(name);
  }
  return print_definitions(defs, args);
}

int cmd_implementations(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: interface name required\n";
    std::cerr << "usage: phpref implementations <Interface>\n";
    return 1;
  }

  Session session(args);
  session.build_index();

  std::vector<php_refactor::SymbolDefinition> defs;
  for (const auto & name : session.index.implementations_of(args.positional[0])) {
    for (auto & def : session.index.lookup_definitions(name)) {
      defs.push_back(std::move(def));
    }
  }
  return print_definitions(defs, args);
}

int cmd_analyze(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: file required\n";
    std::cerr << "usage: phpref analyze <file.php>\n";
    return 1;
  }

  Session session(args);
  php_refactor::ExternalAnalyzer analyzer(session.root, session.config.analyzer, session.logger);
  if (!analyzer.is_active()) {
    std::cerr << "error: static analyzer is not available\n";
    return 1;
  }

  const fs::path path = input_path(args.positional[0]);
  const auto result = analyzer.analyze(path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return 1;
  }

  const auto text = php_refactor::read_file_to_string(path);
  const php_refactor::SourceFile source(path, text.value_or(std::string()));
  php_refactor::DiagnosticBag diags;
  php_refactor::append_analyzer_diagnostics(result.messages, source, diags);

  if (args.json_output) {
    json out = json::array();
    for (const auto & m : result.messages) {
      out.push_back(json{{"line", m.line}, {"message", m.message}});
    }
    std::cout << out.dump(2) << "\n";
  } else {
    php_refactor::DiagnosticPrinter printer(std::cerr, isatty(fileno(stderr)) != 0);
    printer.print_all(diags, source);
    if (diags.empty()) {
      std::cout << path.string() << ": OK\n";
    }
  }
  return diags.has_errors() ? 1 : 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  php_refactor::set_log_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

  try {
    if (args.command == "index") {
      return cmd_index(args);
    }

    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "rename-method") {
      return cmd_rename_method(args);
    }

    if (args.command == "move") {
      return cmd_move(args);
    }

    if (args.command == "add-import") {
      return cmd_add_import(args);
    }

    if (args.command == "definition") {
      return cmd_definition(args);
    }

    if (args.command == "implementations") {
      return cmd_implementations(args);
    }

    if (args.command == "analyze") {
      return cmd_analyze(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
