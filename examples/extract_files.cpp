#include <filesystem>
#include <iostream>
#include <vector>

#include <nres/nres.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.lib> <output_dir> [entry...]\n";
    return 1;
  }

  nres::Error error;
  auto reader = nres::Reader::open(argv[1], &error);
  if (!reader || !reader->readToc(&error)) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  // Extract everything, or only the named entries
  std::vector<const nres::ArchiveEntry *> selected;
  if (argc == 3) {
    for (const auto &entry : reader->files()) {
      selected.push_back(&entry);
    }
  } else {
    for (int i = 3; i < argc; ++i) {
      const auto *entry = reader->findFile(argv[i]);
      if (!entry) {
        std::cerr << "No entry named " << argv[i] << " in " << argv[1] << "\n";
        return 1;
      }
      selected.push_back(entry);
    }
  }

  std::filesystem::path outputDir = argv[2];
  std::filesystem::create_directories(outputDir);

  int extractedCount = 0;
  for (const auto *entry : selected) {
    std::filesystem::path outputPath = outputDir / entry->fileName;

    if (!reader->extract(*entry, outputPath, &error)) {
      std::cerr << "Failed to extract " << entry->fileName << ": " << error.message << "\n";
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " files to " << outputDir << "\n";
  return 0;
}
