#include "file_url.hpp"

#include <cctype>
#include <filesystem>

#include "v8cov/util/string_utils.hpp"

namespace v8cov::path {

namespace {

constexpr std::string_view k_file_scheme = "file://";

int hex_value(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string strip_trailing_separator(std::string value) {
  while (value.size() > 1 && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

} // namespace

bool is_file_url(std::string_view url) { return util::starts_with(util::to_lower(url.substr(0, 7)), k_file_scheme); }

result<std::string> file_url_to_path(std::string_view url) {
  if (!is_file_url(url)) {
    return error_result<std::string>(error_code::invalid_url, "not a file url: " + std::string(url));
  }

  std::string_view rest = url.substr(k_file_scheme.size());
  size_t path_start = rest.find('/');
  std::string_view authority = path_start == std::string_view::npos ? rest : rest.substr(0, path_start);
  if (!authority.empty() && util::to_lower(authority) != "localhost") {
    return error_result<std::string>(
        error_code::invalid_url, "file url host must be empty or localhost: " + std::string(url)
    );
  }
  if (path_start == std::string_view::npos) {
    return error_result<std::string>(error_code::invalid_url, "file url has no path: " + std::string(url));
  }

  std::string_view encoded = rest.substr(path_start);
  size_t suffix = encoded.find_first_of("?#");
  if (suffix != std::string_view::npos) {
    encoded = encoded.substr(0, suffix);
  }

  std::string decoded;
  decoded.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); ++i) {
    char ch = encoded[i];
    if (ch != '%') {
      decoded.push_back(ch);
      continue;
    }
    if (i + 2 >= encoded.size()) {
      return error_result<std::string>(error_code::invalid_url, "truncated percent escape: " + std::string(url));
    }
    int high = hex_value(encoded[i + 1]);
    int low = hex_value(encoded[i + 2]);
    if (high < 0 || low < 0) {
      return error_result<std::string>(error_code::invalid_url, "malformed percent escape: " + std::string(url));
    }
    char value = static_cast<char>((high << 4) | low);
    if (value == '/') {
      return error_result<std::string>(
          error_code::invalid_url, "file url must not include encoded / characters: " + std::string(url)
      );
    }
    if (value == '\0') {
      return error_result<std::string>(
          error_code::invalid_url, "file url must not include nul bytes: " + std::string(url)
      );
    }
    decoded.push_back(value);
    i += 2;
  }

  return ok_result(std::move(decoded));
}

std::string path_to_file_url(std::string_view path) {
  static constexpr char k_hex[] = "0123456789ABCDEF";
  std::string out(k_file_scheme);
  for (unsigned char ch : path) {
    bool plain = std::isalnum(ch) || ch == '/' || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch >= 0x80;
    if (plain) {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(k_hex[(ch >> 4) & 0x0f]);
      out.push_back(k_hex[ch & 0x0f]);
    }
  }
  return out;
}

bool is_absolute(std::string_view path) { return !path.empty() && path.front() == '/'; }

std::string resolve_path(std::string_view root, std::string_view path) {
  std::filesystem::path candidate(path);
  if (!is_absolute(path)) {
    std::filesystem::path base(root);
    if (!is_absolute(root)) {
      std::error_code ec;
      base = std::filesystem::current_path(ec) / base;
    }
    candidate = base / candidate;
  }
  return strip_trailing_separator(candidate.lexically_normal().generic_string());
}

std::string relative_path(std::string_view root, std::string_view target) {
  std::filesystem::path rel = std::filesystem::path(target).lexically_relative(std::filesystem::path(root));
  if (rel.empty()) {
    return std::string(target);
  }
  return rel.generic_string();
}

std::string parent_directory(std::string_view path) {
  return std::filesystem::path(path).parent_path().generic_string();
}

} // namespace v8cov::path
