#include <format>
#include <ostream>
#include <string_view>

#include <lpakx/bundle.hpp>
#include <lpakx/cli.hpp>
#include <lpakx/extractor.hpp>
#include <lpakx/index_reader.hpp>

namespace lpakx::cli {

namespace {

// Value of an option given either as "--name=value" / "-Xvalue" or as the next argument
// Short options take the attached text verbatim, so "-F=x" yields "=x"
bool takeValue(std::string_view arg, std::string_view name, int argc, const char *const argv[],
               int &i, std::string &value, std::string *outError) {
  if (arg.size() > name.size()) {
    const bool longForm = name.starts_with("--");
    value = std::string(arg.substr(name.size() + (longForm ? 1 : 0)));
    return true;
  }
  if (i + 1 >= argc) {
    if (outError) {
      *outError = std::format("option {} requires an argument", name);
    }
    return false;
  }
  value = argv[++i];
  return true;
}

bool setMode(Options &options, Mode mode, bool &modeSet, std::string *outError) {
  if (modeSet && options.mode != mode) {
    if (outError) {
      *outError = "options --list and --extract are mutually exclusive";
    }
    return false;
  }
  options.mode = mode;
  modeSet = true;
  return true;
}

int listBundle(const Options &options, const EntryTable &table, std::ostream &out) {
  for (const Entry &entry : selectEntries(table, options.pattern)) {
    if (options.verbose) {
      out << std::format("{:>10} {:>10} {} {}\n", entry.offset, entry.size,
                         entry.compressed ? 'C' : '-', entry.path);
    } else {
      out << entry.path << '\n';
    }
  }
  return exitSuccess;
}

int extractBundle(const Options &options, const Bundle &bundle, const EntryTable &table,
                  std::ostream &out, std::ostream &err) {
  Extractor extractor(bundle);
  ExtractionRequest request{options.pattern, options.destRoot};

  ExtractionReport report = extractor.extract(table, request);
  for (const SkippedEntry &skipped : report.skipped) {
    err << "warning: " << skipped.path << ": " << skipped.message << '\n';
  }
  if (options.verbose) {
    for (const std::string &path : report.writtenPaths) {
      out << path << '\n';
    }
    out << std::format("Extracted {} files to {}\n", report.written, options.destRoot.string());
  }
  return exitSuccess;
}

} // namespace

std::optional<Options> parseArguments(int argc, const char *const argv[], std::string *outError) {
  Options options;
  bool modeSet = false;
  bool help = false;
  bool bundleSet = false;
  bool endOfOptions = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (endOfOptions || arg.empty() || arg[0] != '-' || arg == "-") {
      if (bundleSet) {
        if (outError) {
          *outError = std::format("unexpected argument: {}", arg);
        }
        return std::nullopt;
      }
      options.bundlePath = std::string(arg);
      bundleSet = true;
      continue;
    }

    if (arg == "--") {
      endOfOptions = true;
    } else if (arg == "-h" || arg == "--help") {
      help = true;
    } else if (arg == "-l" || arg == "--list") {
      if (!setMode(options, Mode::List, modeSet, outError)) {
        return std::nullopt;
      }
    } else if (arg == "-x" || arg == "--extract") {
      if (!setMode(options, Mode::Extract, modeSet, outError)) {
        return std::nullopt;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg.starts_with("--filter") || arg.starts_with("-F")) {
      std::string_view name = arg.starts_with("--") ? "--filter" : "-F";
      if (name == "--filter" && arg.size() > name.size() && arg[name.size()] != '=') {
        if (outError) {
          *outError = std::format("unknown option: {}", arg);
        }
        return std::nullopt;
      }
      std::string value;
      if (!takeValue(arg, name, argc, argv, i, value, outError)) {
        return std::nullopt;
      }
      options.pattern = std::move(value);
    } else if (arg.starts_with("--directory") || arg.starts_with("-C")) {
      std::string_view name = arg.starts_with("--") ? "--directory" : "-C";
      if (name == "--directory" && arg.size() > name.size() && arg[name.size()] != '=') {
        if (outError) {
          *outError = std::format("unknown option: {}", arg);
        }
        return std::nullopt;
      }
      std::string value;
      if (!takeValue(arg, name, argc, argv, i, value, outError)) {
        return std::nullopt;
      }
      if (value.empty()) {
        if (outError) {
          *outError = "destination directory must not be empty";
        }
        return std::nullopt;
      }
      options.destRoot = value;
    } else {
      if (outError) {
        *outError = std::format("unknown option: {}", arg);
      }
      return std::nullopt;
    }
  }

  if (help) {
    options.mode = Mode::Help;
    return options;
  }

  if (!modeSet) {
    if (outError) {
      *outError = "one of the options --list or --extract is required";
    }
    return std::nullopt;
  }

  if (!bundleSet) {
    if (outError) {
      *outError = "missing bundle file argument";
    }
    return std::nullopt;
  }

  return options;
}

void printUsage(std::ostream &os, const std::string &program) {
  os << "Usage: " << program << " (-l | -x) [-F PATTERN] [-C DIR] [-v] BUNDLE\n"
     << "\n"
     << "List or extract files from a DoubleFine LPAK bundle as found in\n"
     << "Day of the Tentacle Remastered.\n"
     << "\n"
     << "  -l, --list               list bundle content\n"
     << "  -x, --extract            extract bundle content\n"
     << "  -F, --filter PATTERN     only process files matching the glob PATTERN\n"
     << "  -C, --directory DIR      extract under DIR (default: current directory)\n"
     << "  -v, --verbose            show offsets and sizes, or extracted files\n"
     << "  -h, --help               show this help and exit\n";
}

int run(const Options &options, std::ostream &out, std::ostream &err) {
  if (options.mode == Mode::Help) {
    printUsage(out, "lpakx");
    return exitSuccess;
  }

  try {
    Bundle bundle = Bundle::open(options.bundlePath);
    EntryTable table = IndexReader::parse(bundle);

    if (options.mode == Mode::List) {
      return listBundle(options, table, out);
    }
    return extractBundle(options, bundle, table, out, err);
  } catch (const FormatError &e) {
    err << std::format("error: {}: {} ({})\n", options.bundlePath.string(), e.what(),
                       toString(e.kind()));
  } catch (const IoError &e) {
    err << "error: " << e.what() << '\n';
    if (options.mode == Mode::Extract && !e.entryPath().empty()) {
      err << std::format("error: extraction stopped after {} files\n", e.written());
    }
  }
  return exitFailure;
}

int execute(int argc, const char *const argv[], std::ostream &out, std::ostream &err) {
  std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "lpakx";

  std::string error;
  auto options = parseArguments(argc, argv, &error);
  if (!options) {
    err << program << ": error: " << error << '\n';
    printUsage(err, program);
    return exitUsage;
  }

  return run(*options, out, err);
}

} // namespace lpakx::cli
