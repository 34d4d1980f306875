#include "ckmcp/session/roots.h"

namespace ckmcp::session {

using json = nlohmann::json;

namespace {

constexpr std::string_view kFileScheme = "file://";

struct FileUri {
  std::string host;
  std::string path;
};

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::optional<std::string> percent_decode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') {
      out.push_back(in[i]);
      continue;
    }
    if (i + 2 >= in.size()) {
      return std::nullopt;
    }
    const int hi = hex_value(in[i + 1]);
    const int lo = hex_value(in[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

// Splits file://host/path?query#fragment into host and decoded path.
std::optional<FileUri> split_file_uri(std::string_view uri) {
  if (uri.substr(0, kFileScheme.size()) != kFileScheme) {
    return std::nullopt;
  }
  std::string_view rest = uri.substr(kFileScheme.size());
  const auto cut = rest.find_first_of("?#");
  if (cut != std::string_view::npos) {
    rest = rest.substr(0, cut);
  }

  const auto slash = rest.find('/');
  const std::string_view host = slash == std::string_view::npos ? rest : rest.substr(0, slash);
  const std::string_view raw_path =
      slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);

  auto path = percent_decode(raw_path);
  if (!path.has_value()) {
    return std::nullopt;
  }
  return FileUri{.host = std::string(host), .path = std::move(path.value())};
}

}  // namespace

std::string Root::path() const {
  if (uri.rfind(kFileScheme, 0) != 0) {
    return uri;
  }
  auto parts = split_file_uri(uri);
  if (!parts.has_value()) {
    return uri.substr(kFileScheme.size());
  }
  return parts->path;
}

ClientCapabilities parse_client_capabilities(const json& params) {
  ClientCapabilities caps;
  if (!params.is_object() || !params.contains("capabilities") ||
      !params["capabilities"].is_object()) {
    return caps;
  }
  const json& capabilities = params["capabilities"];
  if (capabilities.contains("roots") && capabilities["roots"].is_object()) {
    caps.roots = true;
    const json& roots = capabilities["roots"];
    if (roots.contains("listChanged") && roots["listChanged"].is_boolean()) {
      caps.roots_list_changed = roots["listChanged"].get<bool>();
    }
  }
  return caps;
}

bool is_valid_root_uri(std::string_view uri) {
  auto parts = split_file_uri(uri);
  if (!parts.has_value()) {
    return false;
  }
  if (!parts->host.empty()) {
    return false;
  }
  if (parts->path.find("..") != std::string::npos) {
    return false;
  }
  return !parts->path.empty() && parts->path.front() == '/';
}

std::optional<std::vector<Root>> parse_roots_result(const json& result) {
  if (!result.is_object() || !result.contains("roots") || !result["roots"].is_array()) {
    return std::nullopt;
  }

  std::vector<Root> roots;
  for (const auto& entry : result["roots"]) {
    if (!entry.is_object()) {
      continue;
    }
    Root root;
    if (entry.contains("uri") && entry["uri"].is_string()) {
      root.uri = entry["uri"].get<std::string>();
    }
    if (entry.contains("name") && entry["name"].is_string()) {
      root.name = entry["name"].get<std::string>();
    }
    if (!root.uri.empty() && is_valid_root_uri(root.uri)) {
      roots.push_back(std::move(root));
    }
  }
  return roots;
}

json roots_to_json(const std::vector<Root>& roots) {
  json out = json::array();
  for (const auto& root : roots) {
    json entry{{"uri", root.uri}, {"path", root.path()}};
    if (!root.name.empty()) {
      entry["name"] = root.name;
    }
    out.push_back(entry);
  }
  return out;
}

}  // namespace ckmcp::session
