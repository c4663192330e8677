#include <iostream>

#include <nres/nres.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.lib>\n";
    return 1;
  }

  nres::Error error;
  auto reader = nres::Reader::open(argv[1], &error);
  if (!reader || !reader->readToc(&error)) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::cout << "Archive contains " << reader->fileCount() << " files ("
            << reader->header().archiveSize << " bytes):\n";
  for (const auto &entry : reader->files()) {
    std::cout << "  [" << entry.fileId << "] " << entry.fileName << " (" << entry.fileType
              << ", " << entry.fileSize << " bytes at " << entry.fileOffset << ")\n";
  }

  return 0;
}
