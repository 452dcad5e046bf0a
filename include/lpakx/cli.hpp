#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace lpakx::cli {

enum class Mode { List, Extract, Help };

struct Options {
  Mode mode = Mode::Help;
  std::filesystem::path bundlePath;
  std::optional<std::string> pattern;
  std::filesystem::path destRoot = ".";
  bool verbose = false;
};

// Exit codes
inline constexpr int exitSuccess = 0;
inline constexpr int exitFailure = 1;
inline constexpr int exitUsage = 2;

// Parse command-line arguments (argv[0] is the program name)
// Returns std::nullopt on a usage error, with error message in outError if provided
std::optional<Options> parseArguments(int argc, const char *const argv[],
                                      std::string *outError = nullptr);

void printUsage(std::ostream &os, const std::string &program);

// Execute a parsed command; listings go to out, warnings and errors to err
int run(const Options &options, std::ostream &out, std::ostream &err);

// parseArguments + run
int execute(int argc, const char *const argv[], std::ostream &out, std::ostream &err);

} // namespace lpakx::cli
