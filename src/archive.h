#ifndef ARCHIVE_H_
#define ARCHIVE_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Packs the regular files directly inside dir into an uncompressed ustar archive,
//   which is what the engine expects as a build context.
// Subdirectories are not descended into; names must fit in 99 bytes.
bool MakeTarArchive(const fs::path& dir, std::string& out);

#endif  // ARCHIVE_H_
