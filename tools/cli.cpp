#include <exception>
#include <string_view>
#include <utility>

#include <argparse/argparse.hpp>

#include "cli.hpp"

namespace nres::tool {

namespace {

constexpr auto kVersion = "1.0.0";

void addHelp(argparse::ArgumentParser &parser) {
  parser.add_argument("-h", "--help")
      .help("Show this help.")
      .default_value(false)
      .implicit_value(true);
}

// Options and inputs every file-handling command takes
void addFileOptions(argparse::ArgumentParser &parser, std::string_view inputs) {
  addHelp(parser);
  parser.add_argument("-d", "--output_directory", "--output-directory")
      .help("Directory: where output goes.")
      .default_value(std::string("."));
  parser.add_argument("-n", "--dry_run", "--dry-run")
      .help("Validate everything, write nothing.")
      .default_value(false)
      .implicit_value(true);
  parser.add_argument("-f", "--force")
      .help("Overwrite existing files.")
      .default_value(false)
      .implicit_value(true);
  parser.add_argument("patterns")
      .help(std::string(inputs))
      .nargs(argparse::nargs_pattern::any);
}

// The parser tree. Subparsers are held by reference, so all live together.
struct Parsers {
  explicit Parsers(const std::string &name)
      : program(name, kVersion, argparse::default_arguments::none),
        unarchive("unarchive", kVersion, argparse::default_arguments::none),
        archive("archive", kVersion, argparse::default_arguments::none),
        list("list", kVersion, argparse::default_arguments::none),
        helpCommand("help", kVersion, argparse::default_arguments::none) {
    program.add_description("Tools for the NRes archives used by Parkan games.");
    addHelp(program);
    auto &level = program.add_mutually_exclusive_group();
    level.add_argument("-v", "--verbose")
        .help("Debug output.")
        .default_value(false)
        .implicit_value(true);
    level.add_argument("-s", "--silent")
        .help("Errors only.")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file").help("Also append the log to this file.");

    unarchive.add_description("Unpack archives into DIR/<archive name>/.");
    addFileOptions(unarchive, "Archives to unpack (glob patterns).");

    archive.add_description("Pack files into one archive.");
    addFileOptions(archive, "Files to pack (glob patterns).");
    archive.add_argument("-o", "--output").help("Archive to create, relative to DIR.");

    list.add_description("Show the table of contents of archives.");
    addFileOptions(list, "Archives to list (glob patterns).");

    helpCommand.add_description("Show this help.");

    program.add_subparser(unarchive);
    program.add_subparser(archive);
    program.add_subparser(list);
    program.add_subparser(helpCommand);
  }

  argparse::ArgumentParser program;
  argparse::ArgumentParser unarchive;
  argparse::ArgumentParser archive;
  argparse::ArgumentParser list;
  argparse::ArgumentParser helpCommand;
};

bool fail(std::string *outError, std::string message) {
  if (outError) {
    *outError = std::move(message);
  }
  return false;
}

CliOptions helpFor(argparse::ArgumentParser &parser) {
  CliOptions options;
  options.command = Command::Help;
  options.helpText = parser.help().str();
  return options;
}

void readFileOptions(argparse::ArgumentParser &parser, CliOptions &options) {
  options.outputDirectory = parser.get<std::string>("--output_directory");
  options.dryRun = parser.get<bool>("--dry_run");
  options.force = parser.get<bool>("--force");
  options.patterns =
      parser.present<std::vector<std::string>>("patterns").value_or(std::vector<std::string>{});
}

} // namespace

std::optional<CliOptions> parseArguments(int argc, char **argv, std::string *outError) {
  Parsers parsers(argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "nrestool");
  try {
    parsers.program.parse_args(argc, argv);
  } catch (const std::exception &e) {
    fail(outError, e.what());
    return std::nullopt;
  }

  if (parsers.program.get<bool>("--help") || parsers.program.is_subcommand_used(parsers.helpCommand)) {
    return helpFor(parsers.program);
  }

  CliOptions options;
  argparse::ArgumentParser *command = nullptr;
  if (parsers.program.is_subcommand_used(parsers.unarchive)) {
    options.command = Command::Unarchive;
    command = &parsers.unarchive;
  } else if (parsers.program.is_subcommand_used(parsers.archive)) {
    options.command = Command::Archive;
    command = &parsers.archive;
  } else if (parsers.program.is_subcommand_used(parsers.list)) {
    options.command = Command::List;
    command = &parsers.list;
  } else {
    fail(outError, "No command given");
    return std::nullopt;
  }

  if (command->get<bool>("--help")) {
    return helpFor(*command);
  }

  if (parsers.program.get<bool>("--verbose")) {
    options.logLevel = LogLevel::Debug;
  } else if (parsers.program.get<bool>("--silent")) {
    options.logLevel = LogLevel::Error;
  }
  if (auto logFile = parsers.program.present("--log-file")) {
    options.logFile = *logFile;
  }

  readFileOptions(*command, options);
  if (options.command == Command::Archive) {
    auto output = command->present("--output");
    if (!output || output->empty()) {
      fail(outError, "The archive command needs -o/--output");
      return std::nullopt;
    }
    options.output = *output;
  }

  return options;
}

std::string usage(const std::string &program) {
  Parsers parsers(program);
  return parsers.program.help().str();
}

} // namespace nres::tool
