/**
 * @file main.cpp
 * @brief wenjiao command line entry point
 *
 * Checks a UTF-8 text document for spelling, typo, heading, repetition,
 * punctuation and phrasing problems.
 *
 * Usage: wenjiao [-c config.yaml] [--async] [--quiet] <file>
 */

#include "wenjiao/config.hpp"
#include "wenjiao/document_decoder.hpp"
#include "wenjiao/engine.hpp"
#include "wenjiao/text_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <signal.h>
#include <string>

namespace {

volatile sig_atomic_t g_running = 1;

constexpr int kExitClean = 0;
constexpr int kExitIssues = 1;
constexpr int kExitError = 2;

void signal_handler(int sig) {
  if (sig == SIGINT || sig == SIGTERM) {
    g_running = 0;
  }
}

void print_version() {
  std::cout << "wenjiao 1.0.0 (C++20)\n"
            << "Chinese/English document proofreading engine\n";
}

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [options] <file>\n"
            << "\n"
            << "Options:\n"
            << "  -c, --config <path>  Configuration file\n"
            << "      --async          Analyze in the background with progress\n"
            << "      --quiet          Print issues only\n"
            << "  -h, --help           Show this help\n"
            << "  -v, --version        Show version\n"
            << "\n"
            << "Exit status: 0 no issues, 1 issues found, 2 error\n"
            << "Configuration: " << wenjiao::kConfigPath << "\n";
}

struct Options {
  std::optional<std::string> config_path;
  std::string file;
  bool async = false;
  bool quiet = false;
};

void print_result(const wenjiao::AnalysisResult &result, bool quiet) {
  for (const auto &issue : result.issues) {
    std::cout << issue.line_number << ":" << issue.start << "-" << issue.end
              << " [" << issue.issue_type << "] " << issue.message << " -> "
              << issue.suggestion << "\n";
  }

  if (quiet) {
    return;
  }

  std::cout << "\n";
  for (const auto &[name, value] : result.stats) {
    std::cout << name << ": " << value << "\n";
  }
  std::cout << "issues: " << result.issues.size() << "\n"
            << "truncated: " << (result.truncated ? "yes" : "no") << "\n";
}

/// Runs the analysis on the scheduler and reports progress on stderr
std::optional<wenjiao::AnalysisResult>
run_async(wenjiao::Engine &engine, std::string text, bool quiet) {
  const std::string id = engine.analyze_text_async(std::move(text));

  while (true) {
    if (!g_running) {
      engine.cancel(id);
      std::cerr << "[wenjiao] Analysis cancelled\n";
      return std::nullopt;
    }

    auto event = engine.wait_event_for(std::chrono::milliseconds{100});
    if (!event || event->analysis_id != id) {
      continue;
    }

    const auto &payload = event->payload;
    if (event->kind == wenjiao::EventKind::Progress) {
      if (!quiet && payload.progress) {
        std::cerr << "\r[wenjiao] " << static_cast<int>(payload.progress->progress)
                  << "% " << payload.progress->message << std::flush;
      }
      continue;
    }

    if (!quiet) {
      std::cerr << "\n";
    }
    if (payload.error) {
      std::cerr << "[wenjiao] Analysis failed: " << *payload.error << "\n";
      return std::nullopt;
    }
    if (payload.result) {
      return *payload.result;
    }
    return std::nullopt;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  Options options;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return kExitClean;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return kExitClean;
    }
    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "[wenjiao] " << arg << " requires a path\n";
        return kExitError;
      }
      options.config_path = argv[++i];
    } else if (arg == "--async") {
      options.async = true;
    } else if (arg == "--quiet") {
      options.quiet = true;
    } else if (arg.starts_with("-")) {
      std::cerr << "[wenjiao] Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return kExitError;
    } else if (options.file.empty()) {
      options.file = std::string{arg};
    } else {
      std::cerr << "[wenjiao] Only one input file is accepted\n";
      return kExitError;
    }
  }

  if (options.file.empty()) {
    print_usage(argv[0]);
    return kExitError;
  }

  // An explicit config must load cleanly, the default one is best effort
  wenjiao::Config config;
  if (options.config_path) {
    auto outcome = wenjiao::load_config_checked(*options.config_path);
    if (outcome.result != wenjiao::ConfigResult::Ok) {
      std::cerr << "[wenjiao] " << outcome.error << "\n";
      return kExitError;
    }
    config = std::move(outcome.config);
  } else {
    config = wenjiao::load_config();
  }

  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  wenjiao::Engine engine{config};

  wenjiao::AnalysisResult result;

  wenjiao::PlainTextDecoder decoder;
  wenjiao::DecodeOutcome decoded = decoder.decode(options.file);
  if (decoded.status != wenjiao::DecodeStatus::Ok) {
    std::cerr << "[wenjiao] " << decoded.error << "\n";
    return kExitError;
  }

  const bool async =
      options.async ||
      wenjiao::char_count(decoded.text) > config.scheduler.async_threshold;

  if (async) {
    auto async_result =
        run_async(engine, std::move(decoded.text), options.quiet);
    if (!async_result) {
      return kExitError;
    }
    result = std::move(*async_result);
  } else {
    result = engine.analyze_text(decoded.text);
  }

  print_result(result, options.quiet);
  return result.issues.empty() ? kExitClean : kExitIssues;
}
