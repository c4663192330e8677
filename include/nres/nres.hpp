#pragma once

// NRes Archive Library
// Reads and writes the NRes container used by Parkan games: a 16-byte
// header, the packed files back to back, then a table of contents of
// 64-byte entries.

#include "archiver.hpp"
#include "codec.hpp"
#include "fileio.hpp"
#include "reader.hpp"
#include "report.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides three levels of abstraction:
//
// 1. Codec: encode/decode functions for the header and TOC entries
//    - Pure functions over byte buffers, no I/O
//
// 2. Reader / Writer classes
//    - Use Reader::open() and readToc() to read existing archives
//    - Use Writer to create new archives
//
// 3. Batch operations: unarchive(), unarchiveAll(), archive()
//    - Per-file results collected into reports, progress sent to a Reporter
//
// Example usage:
//
//   // Reading an archive
//   auto reader = nres::Reader::open("sounds.lib");
//   if (reader && reader->readToc()) {
//     for (const auto& entry : reader->files()) {
//       std::cout << entry.fileName << std::endl;
//     }
//   }
//
//   // Creating a new archive
//   nres::Writer writer;
//   writer.addFile("texture.tex");
//   writer.write("output.lib");
