// PHP refactoring LSP server (stdio JSON-RPC)
//
// This is a thin wrapper around php_refactor::lsp::Workspace (serverless APIs).
// It implements the subset of LSP used by the editor integration: diagnostics,
// navigation, method rename, import quick-fixes and file moves.
//
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <php_refactor/lsp.hpp>
#include <spdlog/sinks/stdout_sinks.h>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

using nlohmann::json;

namespace
{

constexpr std::string_view k_move_file_command = "phpref.moveFile";

struct DocState
{
  std::string uri;
  std::string text;
  std::vector<uint32_t> line_offsets;  // byte offsets of each line start
  json analyzer_items = json::array();
};

std::vector<uint32_t> build_line_offsets(std::string_view text)
{
  std::vector<uint32_t> offsets;
  offsets.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      offsets.push_back(static_cast<uint32_t>(i + 1));
    }
  }
  return offsets;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

std::optional<std::string> file_uri_to_path(std::string_view uri)
{
  // file:///home/user/a.php -> /home/user/a.php
  if (!starts_with(uri, "file:")) {
    return std::nullopt;
  }

  std::string_view rest = uri.substr(std::string_view("file:").size());
  if (starts_with(rest, "///")) {
    rest = rest.substr(2);  // keep one leading slash
  } else if (starts_with(rest, "//")) {
    // file://hostname/path is not supported here.
    return std::nullopt;
  }
  return url_decode(rest);
}

/// The workspace addresses documents by decoded `file://` URIs.
std::string normalize_uri(std::string_view uri)
{
  if (auto p = file_uri_to_path(uri)) {
    return "file://" + *p;
  }
  return std::string(uri);
}

int lsp_severity(std::string_view s)
{
  // LSP DiagnosticSeverity:
  // 1 Error, 2 Warning, 3 Information, 4 Hint
  if (s == "Error") return 1;
  if (s == "Warning") return 2;
  if (s == "Info") return 3;
  if (s == "Hint") return 4;
  return 3;
}

json to_lsp_range_from_full_range(const json & fr)
{
  // FullSourceRange uses 1-indexed line/column; LSP uses 0-indexed.
  const int sl = std::max(0, fr.value("startLine", 1) - 1);
  const int sc = std::max(0, fr.value("startColumn", 1) - 1);
  const int el = std::max(0, fr.value("endLine", 1) - 1);
  const int ec = std::max(0, fr.value("endColumn", 1) - 1);

  return json{
    {"start", json{{"line", sl}, {"character", sc}}},
    {"end", json{{"line", el}, {"character", ec}}},
  };
}

json empty_lsp_range()
{
  return json{
    {"start", json{{"line", 0}, {"character", 0}}}, {"end", json{{"line", 0}, {"character", 0}}}};
}

std::optional<uint32_t> utf8_position_to_byte_offset(
  const DocState & doc, uint32_t line, uint32_t character)
{
  if (doc.line_offsets.empty()) {
    return std::nullopt;
  }
  if (line >= doc.line_offsets.size()) {
    return static_cast<uint32_t>(doc.text.size());
  }

  const uint32_t line_start = doc.line_offsets[line];
  const uint32_t next_line_start = (line + 1 < doc.line_offsets.size())
                                     ? doc.line_offsets[line + 1]
                                     : static_cast<uint32_t>(doc.text.size());

  const uint32_t line_len = (next_line_start >= line_start) ? (next_line_start - line_start) : 0;
  const uint32_t col = std::min<uint32_t>(character, line_len);
  return line_start + col;
}

std::optional<uint32_t> utf16_position_to_byte_offset(
  const DocState & doc, uint32_t line, uint32_t character)
{
  if (doc.line_offsets.empty()) {
    return std::nullopt;
  }
  if (line >= doc.line_offsets.size()) {
    return static_cast<uint32_t>(doc.text.size());
  }

  const uint32_t line_start = doc.line_offsets[line];
  const uint32_t next_line_start = (line + 1 < doc.line_offsets.size())
                                     ? doc.line_offsets[line + 1]
                                     : static_cast<uint32_t>(doc.text.size());

  const std::string_view slice =
    std::string_view(doc.text).substr(line_start, next_line_start - line_start);

  uint32_t utf16_units = 0;
  uint32_t byte_index = 0;

  while (byte_index < slice.size() && utf16_units < character) {
    const auto c0 = static_cast<unsigned char>(slice[byte_index]);

    uint32_t nbytes = 1;
    if ((c0 & 0xE0) == 0xC0) {
      nbytes = 2;
    } else if ((c0 & 0xF0) == 0xE0) {
      nbytes = 3;
    } else if ((c0 & 0xF8) == 0xF0) {
      nbytes = 4;
    }
    // Code points outside the BMP take two UTF-16 units.
    const uint32_t units = nbytes == 4 ? 2U : 1U;
    if (utf16_units + units > character || byte_index + nbytes > slice.size()) {
      break;
    }
    utf16_units += units;
    byte_index += nbytes;
  }

  return line_start + byte_index;
}

json edits_to_workspace_edit(const json & result)
{
  json changes = json::object();
  if (result.contains("edits") && result["edits"].is_array()) {
    for (const auto & e : result["edits"]) {
      if (!e.is_object()) continue;
      const std::string uri = e.value("uri", "");
      if (!changes.contains(uri)) {
        changes[uri] = json::array();
      }
      changes[uri].push_back(json{
        {"range", e.contains("range") ? to_lsp_range_from_full_range(e["range"]) : empty_lsp_range()},
        {"newText", e.value("newText", "")},
      });
    }
  }
  return json{{"changes", changes}};
}

json to_lsp_locations(const json & r)
{
  json locs = json::array();
  if (r.contains("locations") && r["locations"].is_array()) {
    for (const auto & loc : r["locations"]) {
      if (!loc.is_object()) continue;
      json out;
      out["uri"] = loc.value("uri", "");
      if (loc.contains("range") && loc["range"].is_object()) {
        out["range"] = to_lsp_range_from_full_range(loc["range"]);
      } else {
        out["range"] = empty_lsp_range();
      }
      locs.push_back(std::move(out));
    }
  }
  return locs;
}

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    // EOF or a malformed header block.
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::exception & e) {
    std::cerr << "phpref_lsp_server: dropping malformed message: " << e.what() << "\n";
    return std::nullopt;
  }
}

}  // namespace

int main()
{
  try {
    // stdout carries the protocol; log to stderr only.
    auto logger = spdlog::stderr_logger_mt("phpref_lsp");
    logger->set_level(spdlog::level::info);

    php_refactor::lsp::Workspace ws(logger);

    std::unordered_map<std::string, DocState> docs;
    std::string negotiated_position_encoding = "utf-8";
    int64_t next_request_id = 1;

    auto upsert_doc = [&](const std::string & uri, const std::string & text) -> DocState & {
      auto & d = docs[uri];
      d.uri = uri;
      d.text = text;
      d.line_offsets = build_line_offsets(d.text);
      ws.set_document(uri, text);
      return d;
    };

    auto publish_diagnostics = [&](const DocState & doc) {
      const json dj = json::parse(ws.diagnostics_json(doc.uri));

      json lsp_diags = json::array();
      auto append = [&](const json & items) {
        if (!items.is_array()) return;
        for (const auto & it : items) {
          if (!it.is_object()) continue;
          json d0;
          d0["message"] = it.value("message", "");
          d0["severity"] = lsp_severity(it.value("severity", "Info"));
          if (it.contains("source") && it["source"].is_string()) {
            d0["source"] = it["source"];
          }
          if (it.contains("code") && it["code"].is_string()) {
            d0["code"] = it["code"];
          }
          if (it.contains("range") && it["range"].is_object()) {
            d0["range"] = to_lsp_range_from_full_range(it["range"]);
          } else {
            d0["range"] = empty_lsp_range();
          }
          lsp_diags.push_back(std::move(d0));
        }
      };
      append(dj.value("items", json::array()));
      append(doc.analyzer_items);

      json notif;
      notif["jsonrpc"] = "2.0";
      notif["method"] = "textDocument/publishDiagnostics";
      notif["params"] = json{{"uri", doc.uri}, {"diagnostics", lsp_diags}};
      write_message(notif);
    };

    auto pos_to_byte_offset = [&](const DocState & doc, const json & pos) -> uint32_t {
      const auto line = pos.value<uint32_t>("line", 0U);
      const auto character = pos.value<uint32_t>("character", 0U);

      if (negotiated_position_encoding == "utf-16") {
        if (auto off = utf16_position_to_byte_offset(doc, line, character)) {
          return *off;
        }
        return 0;
      }

      // Default to utf-8 (bytes).
      if (auto off = utf8_position_to_byte_offset(doc, line, character)) {
        return *off;
      }
      return 0;
    };

    auto apply_edit_on_client = [&](const std::string & label, const json & workspace_edit) {
      json req;
      req["jsonrpc"] = "2.0";
      req["id"] = next_request_id++;
      req["method"] = "workspace/applyEdit";
      req["params"] = json{{"label", label}, {"edit", workspace_edit}};
      write_message(req);
    };

    bool running = true;
    while (running) {
      const auto msg_opt = read_message();
      if (!msg_opt) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      const json & msg = *msg_opt;
      if (!msg.contains("method")) {
        // Response to one of our workspace/applyEdit requests.
        continue;
      }
      const std::string method = msg.value("method", "");
      const bool is_request = msg.contains("id");

      auto respond = [&](const json & id, const json & result) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["result"] = result;
        write_message(resp);
      };

      auto respond_error = [&](const json & id, int code, std::string message) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["error"] = json{{"code", code}, {"message", std::move(message)}};
        write_message(resp);
      };

      const json params = msg.value("params", json::object());

      auto doc_request = [&](const char * empty_result) -> std::pair<DocState *, uint32_t> {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = normalize_uri(td.value("uri", ""));
        auto it = docs.find(uri);
        if (it == docs.end()) {
          respond(msg["id"], json::parse(empty_result));
          return {nullptr, 0};
        }
        const auto pos = params.value("position", json::object());
        return {&it->second, pos_to_byte_offset(it->second, pos)};
      };

      if (method == "initialize" && is_request) {
        negotiated_position_encoding = "utf-8";
        if (params.contains("capabilities") && params["capabilities"].is_object()) {
          const auto & caps = params["capabilities"];
          if (caps.contains("general") && caps["general"].is_object()) {
            const auto & gen = caps["general"];
            if (gen.contains("positionEncodings") && gen["positionEncodings"].is_array()) {
              bool has_utf8 = false;
              bool has_utf16 = false;
              for (const auto & e : gen["positionEncodings"]) {
                if (!e.is_string()) continue;
                const auto s = e.get<std::string>();
                if (s == "utf-8") has_utf8 = true;
                if (s == "utf-16") has_utf16 = true;
              }
              if (!has_utf8 && has_utf16) {
                negotiated_position_encoding = "utf-16";
              }
            }
          }
        }

        std::string root;
        if (params.contains("rootUri") && params["rootUri"].is_string()) {
          root = file_uri_to_path(params["rootUri"].get<std::string>()).value_or("");
        }
        if (root.empty() && params.contains("rootPath") && params["rootPath"].is_string()) {
          root = params["rootPath"].get<std::string>();
        }
        if (!root.empty()) {
          std::string error;
          if (!ws.load_project(root, &error)) {
            logger->warn("phpref.yaml: {}", error);
          }
        }

        json caps;
        caps["positionEncoding"] = negotiated_position_encoding;
        caps["textDocumentSync"] =
          json{{"openClose", true}, {"change", 1}, {"save", json{{"includeText", false}}}};
        caps["definitionProvider"] = true;
        caps["implementationProvider"] = true;
        caps["referencesProvider"] = true;
        caps["renameProvider"] = true;
        caps["codeActionProvider"] = json{{"codeActionKinds", json::array({"quickfix", "refactor.rewrite"})}};
        caps["executeCommandProvider"] =
          json{{"commands", json::array({std::string(k_move_file_command)})}};
        const json php_filters = json::array({json{{"pattern", json{{"glob", "**/*.php"}}}}});
        caps["workspace"] = json{
          {"fileOperations",
           json{
             {"willRename", json{{"filters", php_filters}}},
             {"didRename", json{{"filters", php_filters}}},
           }}};

        respond(msg["id"], json{{"capabilities", caps}});
        continue;
      }

      if (method == "initialized") {
        const json stats = json::parse(ws.index_workspace_json());
        logger->info(
          "indexed {} file(s), {} definition(s)", stats.value("files", 0),
          stats.value("definitions", 0));
        for (auto & [uri, doc] : docs) {
          publish_diagnostics(doc);
        }
        continue;
      }

      if (method == "shutdown" && is_request) {
        respond(msg["id"], json());
        continue;
      }

      if (method == "exit") {
        running = false;
        continue;
      }

      if (method == "textDocument/didOpen") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = normalize_uri(td.value("uri", ""));
        const std::string text = td.value("text", "");
        if (!uri.empty()) {
          auto & doc = upsert_doc(uri, text);
          publish_diagnostics(doc);
        }
        continue;
      }

      if (method == "textDocument/didChange") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = normalize_uri(td.value("uri", ""));
        if (uri.empty()) {
          continue;
        }

        // Full sync: take first change text
        const auto changes = params.value("contentChanges", json::array());
        if (!changes.is_array() || changes.empty()) {
          continue;
        }
        const auto & c0 = changes.at(0);
        if (!c0.is_object() || !c0.contains("text") || !c0["text"].is_string()) {
          continue;
        }

        auto & doc = upsert_doc(uri, c0["text"].get<std::string>());
        publish_diagnostics(doc);
        continue;
      }

      if (method == "textDocument/didSave") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = normalize_uri(td.value("uri", ""));
        if (uri.empty()) {
          continue;
        }
        ws.did_save(uri);
        auto it = docs.find(uri);
        if (it == docs.end()) {
          continue;
        }
        const json aj = json::parse(ws.analyze_json(uri));
        it->second.analyzer_items = aj.value("items", json::array());
        if (aj.contains("error")) {
          logger->warn("static analysis of {}: {}", uri, aj["error"].get<std::string>());
        }
        publish_diagnostics(it->second);
        continue;
      }

      if (method == "textDocument/didClose") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = normalize_uri(td.value("uri", ""));
        if (!uri.empty()) {
          ws.remove_document(uri);
          docs.erase(uri);

          // Clear diagnostics on close
          json notif;
          notif["jsonrpc"] = "2.0";
          notif["method"] = "textDocument/publishDiagnostics";
          notif["params"] = json{{"uri", uri}, {"diagnostics", json::array()}};
          write_message(notif);
        }
        continue;
      }

      if (method == "workspace/willRenameFiles" && is_request) {
        // The client applies the returned edit before renaming, so each file
        // is planned against the tree as it still stands.
        json changes = json::object();
        for (const auto & f : params.value("files", json::array())) {
          const std::string old_uri = normalize_uri(f.value("oldUri", ""));
          const std::string new_uri = normalize_uri(f.value("newUri", ""));
          if (old_uri.empty() || new_uri.empty()) continue;
          const json r = json::parse(ws.move_file_json(old_uri, new_uri));
          if (!r.value("success", false)) {
            logger->warn("no edits for {} -> {}: {}", old_uri, new_uri, r.value("error", "move failed"));
            continue;
          }
          for (const auto & w : r.value("warnings", json::array())) {
            logger->warn("{}", w.get<std::string>());
          }
          const json edit = edits_to_workspace_edit(r);
          for (auto it = edit["changes"].begin(); it != edit["changes"].end(); ++it) {
            for (const auto & e : it.value()) {
              changes[it.key()].push_back(e);
            }
          }
        }
        respond(msg["id"], json{{"changes", changes}});
        continue;
      }

      if (method == "workspace/didRenameFiles") {
        for (const auto & f : params.value("files", json::array())) {
          const std::string old_uri = normalize_uri(f.value("oldUri", ""));
          const std::string new_uri = normalize_uri(f.value("newUri", ""));
          if (old_uri.empty() || new_uri.empty()) continue;
          ws.did_move(old_uri, new_uri);
          auto node = docs.extract(old_uri);
          if (!node.empty()) {
            node.key() = new_uri;
            node.mapped().uri = new_uri;
            docs.insert(std::move(node));
          }
        }
        continue;
      }

      if (method == "workspace/didChangeWatchedFiles") {
        // FileChangeType: 1 Created, 2 Changed, 3 Deleted
        for (const auto & ch : params.value("changes", json::array())) {
          const std::string uri = normalize_uri(ch.value("uri", ""));
          if (uri.empty()) continue;
          if (ch.value("type", 2) == 3) {
            ws.did_delete(uri);
          } else {
            ws.did_save(uri);
          }
        }
        continue;
      }

      if (method == "textDocument/definition" && is_request) {
        const auto [doc, off] = doc_request("[]");
        if (doc == nullptr) continue;
        respond(msg["id"], to_lsp_locations(json::parse(ws.definition_json(doc->uri, off))));
        continue;
      }

      if (method == "textDocument/implementation" && is_request) {
        const auto [doc, off] = doc_request("[]");
        if (doc == nullptr) continue;
        respond(msg["id"], to_lsp_locations(json::parse(ws.implementation_json(doc->uri, off))));
        continue;
      }

      if (method == "textDocument/references" && is_request) {
        const auto [doc, off] = doc_request("[]");
        if (doc == nullptr) continue;
        respond(msg["id"], to_lsp_locations(json::parse(ws.references_json(doc->uri, off))));
        continue;
      }

      if (method == "textDocument/rename" && is_request) {
        const auto [doc, off] = doc_request("null");
        if (doc == nullptr) continue;
        const std::string new_name = params.value("newName", "");
        const json r = json::parse(ws.rename_method_json(doc->uri, off, new_name));
        if (!r.value("success", false)) {
          // LSP RequestFailed
          respond_error(msg["id"], -32803, r.value("error", "rename failed"));
          continue;
        }
        for (const auto & w : r.value("warnings", json::array())) {
          logger->warn("rename: {}", w.get<std::string>());
        }
        respond(msg["id"], edits_to_workspace_edit(r));
        continue;
      }

      if (method == "textDocument/codeAction" && is_request) {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = normalize_uri(td.value("uri", ""));
        auto it = docs.find(uri);
        if (it == docs.end()) {
          respond(msg["id"], json::array());
          continue;
        }
        const auto range = params.value("range", json::object());
        const uint32_t off = pos_to_byte_offset(it->second, range.value("start", json::object()));

        std::vector<std::string> messages;
        const auto context = params.value("context", json::object());
        for (const auto & d : context.value("diagnostics", json::array())) {
          if (d.is_object() && d.contains("message") && d["message"].is_string()) {
            messages.push_back(d["message"].get<std::string>());
          }
        }

        const json r = json::parse(ws.code_actions_json(uri, off, messages));
        json out = json::array();
        for (const auto & a : r.value("actions", json::array())) {
          json action;
          action["title"] = a.value("title", "");
          action["kind"] = a.value("kind", "quickfix");
          action["isPreferred"] = a.value("isPreferred", false);
          if (a.contains("edits") && a["edits"].is_array() && !a["edits"].empty()) {
            action["edit"] = edits_to_workspace_edit(a);
          }
          out.push_back(std::move(action));
        }
        respond(msg["id"], out);
        continue;
      }

      if (method == "workspace/executeCommand" && is_request) {
        const std::string command = params.value("command", "");
        const auto arguments = params.value("arguments", json::array());
        if (
          command != k_move_file_command || arguments.size() < 2 || !arguments[0].is_string() ||
          !arguments[1].is_string()) {
          // LSP InvalidParams
          respond_error(msg["id"], -32602, "expected " + std::string(k_move_file_command) + "(oldUri, newUri)");
          continue;
        }
        const std::string old_uri = normalize_uri(arguments[0].get<std::string>());
        const std::string new_uri = normalize_uri(arguments[1].get<std::string>());
        const json r = json::parse(ws.move_file_json(old_uri, new_uri));
        if (!r.value("success", false)) {
          respond_error(msg["id"], -32803, r.value("error", "move failed"));
          continue;
        }
        const json edit = edits_to_workspace_edit(r);
        if (!edit["changes"].empty()) {
          apply_edit_on_client("Move " + old_uri, edit);
        }
        respond(msg["id"], r);
        continue;
      }

      // Unknown method
      if (is_request) {
        respond_error(msg["id"], -32601, "Method not found");
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "phpref_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
