#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmatch::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
// handler returns false when the value does not validate; it reports the reason itself.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;
  bool ok{true};  // false if any flag was unknown, lacked its value or failed validation
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Every problem is reported to stderr; parsing continues so that all of them are
// reported in one pass.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
      continue;
    }
    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.ok = false;
      continue;
    }
    parsed.ok = opt->handler(parsed.config,
                             argv[++i]) &&  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                parsed.ok;
  }

  return parsed;
}

// One line per option, for usage text.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace pmatch::apps
