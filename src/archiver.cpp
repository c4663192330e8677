#include <algorithm>
#include <string_view>

#include <fmt/format.h>

#include <nres/archiver.hpp>
#include <nres/reader.hpp>
#include <nres/writer.hpp>

namespace fs = std::filesystem;

namespace nres {

namespace {

// Stored names must not escape the destination directory
bool isPlainFileName(const std::string &name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find_first_of("/\\") == std::string::npos;
}

// Archive-level failure: action is what was being done to report.archivePath
ArchiveReport failArchive(ArchiveReport report, std::string_view action, Error error,
                          Reporter &reporter) {
  reporter.error(fmt::format("Failed to {} {}: {}", action, report.archivePath.string(),
                             error.message));
  report.outcome = Outcome::Failed;
  report.error = std::move(error);
  return report;
}

} // namespace

const char *toString(Outcome outcome) noexcept {
  switch (outcome) {
  case Outcome::Succeeded:
    return "Succeeded";
  case Outcome::Skipped:
    return "Skipped";
  case Outcome::Failed:
    return "Failed";
  }
  return "Unknown";
}

size_t ArchiveReport::count(Outcome wanted) const {
  return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                           [&](const ItemResult &item) {
                                             return item.outcome == wanted;
                                           }));
}

bool ArchiveReport::ok() const {
  return outcome != Outcome::Failed && count(Outcome::Failed) == 0;
}

size_t BatchReport::succeeded() const {
  return static_cast<size_t>(std::count_if(archives.begin(), archives.end(), [](const auto &a) {
    return a.outcome == Outcome::Succeeded && a.ok();
  }));
}

size_t BatchReport::skipped() const {
  return static_cast<size_t>(std::count_if(archives.begin(), archives.end(), [](const auto &a) {
    return a.outcome == Outcome::Skipped;
  }));
}

size_t BatchReport::failed() const {
  return static_cast<size_t>(
      std::count_if(archives.begin(), archives.end(), [](const auto &a) { return !a.ok(); }));
}

bool BatchReport::ok() const {
  return failed() == 0;
}

ArchiveReport unarchive(const fs::path &archivePath, const fs::path &outputDir,
                        const Options &options, OutputPolicy &policy, Reporter &reporter) {
  ArchiveReport report;
  report.archivePath = archivePath;

  std::string archiveName = archivePath.stem().string();
  fs::path destDir = outputDir / archiveName;
  reporter.info(fmt::format("Unarchiving {} to {}", archivePath.string(), destDir.string()));

  Error error;
  reporter.debug("Reading and decoding archive metadata");
  auto reader = Reader::open(archivePath, &error);
  if (!reader) {
    return failArchive(std::move(report), "unarchive", std::move(error), reporter);
  }
  reporter.debug(fmt::format("Metadata: {}", reader->header().describe()));

  if (!reader->readToc(&error)) {
    return failArchive(std::move(report), "unarchive", std::move(error), reporter);
  }

  // One directory per archive, created before any payload is written
  if (!policy.ensureDirectory(destDir, options.simulate, &error)) {
    return failArchive(std::move(report), "unarchive", std::move(error), reporter);
  }

  for (const auto &entry : reader->files()) {
    reporter.debug(fmt::format("Processing toc entry: {}", entry.describe()));

    // Archive name joined with the entry name gives context in logs
    std::string contextName = fmt::format("{}/{}", archiveName, entry.fileName);

    ItemResult item;
    item.name = entry.fileName;

    if (!isPlainFileName(entry.fileName)) {
      item.outcome = Outcome::Failed;
      setError(&item.error, ErrorCode::InvalidText,
               fmt::format("Entry name '{}' is not a plain file name", entry.fileName));
      reporter.error(fmt::format("Skipping {}: {}", contextName, item.error.message));
      report.entries.push_back(std::move(item));
      continue;
    }
    item.path = destDir / entry.fileName;

    reporter.debug(fmt::format("Unpacking {} ({} bytes)", contextName, entry.fileSize));
    auto data = reader->extractToMemory(entry, &item.error);
    if (!data) {
      item.outcome = Outcome::Failed;
      reporter.error(item.error.message);
      report.entries.push_back(std::move(item));
      continue;
    }

    reporter.debug(fmt::format("Copying archived file {} to {}", contextName, item.path.string()));

    if (!policy.mayWrite(item.path, options.force)) {
      item.outcome = Outcome::Skipped;
      report.entries.push_back(std::move(item));
      continue;
    }

    if (options.simulate) {
      reporter.info(fmt::format("Dry-run: skipping writing file {}", item.path.string()));
      item.outcome = Outcome::Skipped;
      report.entries.push_back(std::move(item));
      continue;
    }

    if (!writeFileAtomic(item.path, *data, &item.error)) {
      item.outcome = Outcome::Failed;
      reporter.error(item.error.message);
    } else {
      reporter.debug(fmt::format("Copied {} bytes to {}", data->size(), item.path.string()));
    }
    report.entries.push_back(std::move(item));
  }

  reader->close();
  return report;
}

BatchReport unarchiveAll(const std::vector<fs::path> &archivePaths, const fs::path &outputDir,
                         const Options &options, OutputPolicy &policy, Reporter &reporter) {
  BatchReport batch;
  batch.archives.reserve(archivePaths.size());
  for (const auto &path : archivePaths) {
    batch.archives.push_back(unarchive(path, outputDir, options, policy, reporter));
  }
  return batch;
}

ArchiveReport archive(const std::vector<fs::path> &inputs, const fs::path &archivePath,
                      const Options &options, OutputPolicy &policy, Reporter &reporter) {
  ArchiveReport report;
  report.archivePath = archivePath;

  if (!policy.mayWrite(archivePath, options.force)) {
    report.outcome = Outcome::Skipped;
    return report;
  }

  Error error;
  Writer writer;
  for (const auto &input : inputs) {
    if (!writer.addFile(input, &error)) {
      return failArchive(std::move(report), "create archive", std::move(error), reporter);
    }
  }

  // Sizes every input so a bad one fails before the archive exists
  auto entries = writer.plan(&error);
  if (!entries) {
    return failArchive(std::move(report), "create archive", std::move(error), reporter);
  }
  for (const auto &entry : *entries) {
    reporter.debug(fmt::format("Appending entry to table of contents: {}", entry.describe()));
  }

  fs::path parent = archivePath.parent_path();
  if (!parent.empty() && !policy.ensureDirectory(parent, options.simulate, &error)) {
    return failArchive(std::move(report), "create archive", std::move(error), reporter);
  }

  if (options.simulate) {
    reporter.info(fmt::format("Dry-run: skipping writing archive {} ({} files, {} bytes)",
                              archivePath.string(), entries->size(), writer.archiveSize()));
  } else {
    reporter.info(fmt::format("Creating archive at {}", archivePath.string()));
    if (!writer.write(archivePath, &error)) {
      return failArchive(std::move(report), "create archive", std::move(error), reporter);
    }
  }

  Outcome itemOutcome = options.simulate ? Outcome::Skipped : Outcome::Succeeded;
  for (size_t i = 0; i < entries->size(); ++i) {
    ItemResult item;
    item.name = (*entries)[i].fileName;
    item.path = inputs[i];
    item.outcome = itemOutcome;
    report.entries.push_back(std::move(item));
  }
  report.outcome = options.simulate ? Outcome::Skipped : Outcome::Succeeded;
  return report;
}

} // namespace nres
