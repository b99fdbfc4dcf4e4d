/**
 * @file config.cpp
 * @brief Configuration loader implementation
 */

#include "wenjiao/config.hpp"
#include "wenjiao/text_utils.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace wenjiao {

std::optional<std::size_t> parse_count(std::string_view value) {
  value = trim(value);
  if (value.empty()) {
    return std::nullopt;
  }
  std::size_t result = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), result);
  if (ec == std::errc{} && ptr == value.data() + value.size()) {
    return result;
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(std::string_view value) {
  value = trim(value);
  if (value == "true" || value == "yes" || value == "1" || value == "on") {
    return true;
  }
  if (value == "false" || value == "no" || value == "0" || value == "off") {
    return false;
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  // Limits
  if (config.limits.max_text_length == 0 ||
      config.limits.max_line_length == 0 || config.limits.max_issues == 0) {
    return false;
  }

  // Scheduler
  if (config.scheduler.chunk_size == 0 ||
      config.scheduler.async_threshold == 0) {
    return false;
  }

  // Detector thresholds
  if (config.detectors.max_sentence_chars_zh == 0 ||
      config.detectors.max_sentence_chars_en == 0 ||
      config.detectors.title_max_chars == 0) {
    return false;
  }

  return true;
}

namespace {

/// ~/.config/wenjiao/config.yaml
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

/// Removes one level of matching quotes
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    sv.remove_prefix(1);
    sv.remove_suffix(1);
  }
  return sv;
}

/// Line parser. A malformed value keeps its default and records an error.
class ConfigParser {
public:
  explicit ConfigParser(Config &config) : config_{config} {}

  void feed(std::string_view raw) {
    ++line_number_;
    std::string_view sv = trim(raw);

    // Skip blank lines and comments
    if (sv.empty() || sv.front() == '#') {
      return;
    }

    // A key with nothing after the colon opens a section, or a list when
    // indented inside one
    if (sv.back() == ':' && sv.find(':') == sv.size() - 1) {
      std::string name{trim(sv.substr(0, sv.size() - 1))};
      const bool indented = !raw.empty() && (raw.front() == ' ' ||
                                             raw.front() == '\t');
      if (indented && !section_.empty()) {
        list_ = std::move(name);
      } else {
        section_ = std::move(name);
        list_.clear();
      }
      return;
    }

    if (sv.starts_with("- ")) {
      if (section_ == "dictionary" && list_ == "word_lists") {
        config_.dictionary.word_lists.emplace_back(
            std::string{unquote(trim(sv.substr(2)))});
      }
      return;
    }

    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      fail("expected 'key: value'");
      return;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = unquote(trim(sv.substr(colon_pos + 1)));

    if (section_ == "limits") {
      parse_limits(key, value);
    } else if (section_ == "scheduler") {
      parse_scheduler(key, value);
    } else if (section_ == "dictionary") {
      parse_dictionary(key, value);
    } else if (section_ == "detectors") {
      parse_detectors(key, value);
    }
  }

  [[nodiscard]] const std::string &first_error() const noexcept {
    return first_error_;
  }

  [[nodiscard]] bool ok() const noexcept { return first_error_.empty(); }

private:
  void fail(std::string_view what) {
    if (first_error_.empty()) {
      first_error_ = "line " + std::to_string(line_number_) + ": " +
                     std::string{what};
    }
  }

  void set_count(std::size_t &target, std::string_view key,
                 std::string_view value) {
    if (auto v = parse_count(value)) {
      target = *v;
    } else {
      fail("invalid number for '" + std::string{key} + "'");
    }
  }

  void set_bool(bool &target, std::string_view key, std::string_view value) {
    if (auto v = parse_bool(value)) {
      target = *v;
    } else {
      fail("invalid boolean for '" + std::string{key} + "'");
    }
  }

  void parse_limits(std::string_view key, std::string_view value) {
    auto &limits = config_.limits;
    if (key == "max_text_length") {
      set_count(limits.max_text_length, key, value);
    } else if (key == "max_line_length") {
      set_count(limits.max_line_length, key, value);
    } else if (key == "max_issues") {
      set_count(limits.max_issues, key, value);
    }
  }

  void parse_scheduler(std::string_view key, std::string_view value) {
    auto &scheduler = config_.scheduler;
    if (key == "chunk_size") {
      set_count(scheduler.chunk_size, key, value);
    } else if (key == "async_threshold") {
      set_count(scheduler.async_threshold, key, value);
    }
  }

  void parse_dictionary(std::string_view key, std::string_view value) {
    auto &dict = config_.dictionary;
    if (key == "word_list") {
      dict.word_lists.emplace_back(std::string{value});
    } else if (key == "hunspell_aff") {
      dict.hunspell_aff = std::string{value};
    } else if (key == "hunspell_dic") {
      dict.hunspell_dic = std::string{value};
    } else if (key == "typo_table") {
      dict.typo_table = std::string{value};
    } else if (key == "skip_capitalized") {
      set_bool(dict.skip_capitalized, key, value);
    }
  }

  void parse_detectors(std::string_view key, std::string_view value) {
    auto &det = config_.detectors;
    if (key == "spelling") {
      set_bool(det.spelling, key, value);
    } else if (key == "typo") {
      set_bool(det.typo, key, value);
    } else if (key == "title") {
      set_bool(det.title, key, value);
    } else if (key == "repeated") {
      set_bool(det.repeated, key, value);
    } else if (key == "sentence") {
      set_bool(det.sentence, key, value);
    } else if (key == "phrase") {
      set_bool(det.phrase, key, value);
    } else if (key == "article") {
      set_bool(det.article, key, value);
    } else if (key == "agreement") {
      set_bool(det.agreement, key, value);
    } else if (key == "citation") {
      set_bool(det.citation, key, value);
    } else if (key == "max_sentence_chars_zh") {
      set_count(det.max_sentence_chars_zh, key, value);
    } else if (key == "max_sentence_chars_en") {
      set_count(det.max_sentence_chars_en, key, value);
    } else if (key == "title_max_chars") {
      set_count(det.title_max_chars, key, value);
    }
  }

  Config &config_;
  std::string section_;
  std::string list_;
  std::size_t line_number_ = 0;
  std::string first_error_;
};

ConfigLoadOutcome parse_config_stream(std::istream &in) {
  ConfigLoadOutcome out;
  ConfigParser parser{out.config};

  std::string line;
  while (std::getline(in, line)) {
    parser.feed(line);
  }

  if (!parser.ok()) {
    out.result = ConfigResult::ParseError;
    out.error = parser.first_error();
    return out;
  }

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration values";
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

} // namespace

ConfigLoadOutcome parse_config_text(std::string_view text) {
  std::istringstream in{std::string{text}};
  return parse_config_stream(in);
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  if (path.empty()) {
    ConfigLoadOutcome out;
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{path};
  if (!file.is_open()) {
    ConfigLoadOutcome out;
    out.used_path = path;
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + path.string();
    return out;
  }

  ConfigLoadOutcome out = parse_config_stream(file);
  out.used_path = path;
  out.config.config_path = path;
  if (!out.error.empty()) {
    out.error = path.string() + ": " + out.error;
  }
  return out;
}

Config load_config(std::string_view path) {
  // Best effort: for the default path a per-user config wins
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[wenjiao] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  switch (out.result) {
  case ConfigResult::Ok:
    return out.config;
  case ConfigResult::ParseError:
    // Well-formed entries are kept, malformed ones stay at their defaults
    std::cerr << "[wenjiao] Warning: " << out.error << "\n";
    if (validate_config(out.config)) {
      return out.config;
    }
    return Config{};
  case ConfigResult::FileNotFound:
  case ConfigResult::InvalidValue:
    break;
  }

  if (!out.error.empty()) {
    std::cerr << "[wenjiao] Warning: " << out.error << "\n";
  }
  return Config{};
}

} // namespace wenjiao
