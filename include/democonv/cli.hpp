#pragma once
// Command-line entry point for demo_converter.

#include <iosfwd>
#include <string>

#include "democonv/config.hpp"

namespace democonv {

constexpr const char* kDefaultConfigPath = "config/converter_config.yaml";

// Loads the YAML named by --config (or the default path) and applies the
// command-line overrides on top. --arm and --data-type have no file fallback.
// Throws std::invalid_argument if either is missing.
ConversionConfig resolve_config(const ConversionOverrides& overrides);

// Parses argv, runs one conversion and reports the outcome.
// Returns 0 and prints "Successful Conversion!" to `out` on success; returns 1
// with an error log line on any failure, or usage on `err` without arguments.
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace democonv
