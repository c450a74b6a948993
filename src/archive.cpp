#include "archive.h"

#include <ctime>
#include <cstring>
#include <fstream>
#include <vector>
#include <iterator>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr size_t kBlockSize = 512;

struct UstarHeader {
  char name[100];
  char mode[8];
  char uid[8];
  char gid[8];
  char size[12];
  char mtime[12];
  char chksum[8];
  char typeflag;
  char linkname[100];
  char magic[6];
  char version[2];
  char uname[32];
  char gname[32];
  char devmajor[8];
  char devminor[8];
  char prefix[155];
  char pad[12];
};
static_assert(sizeof(UstarHeader) == kBlockSize);

// zero-padded octal with a trailing NUL, as the format wants
template <size_t N>
void PutOctal(char (&field)[N], unsigned long value) {
  std::string str = fmt::format("{:0{}o}", value, N - 1);
  memcpy(field, str.data(), N - 1);
  field[N - 1] = '\0';
}

void AppendHeader(std::string& out, const std::string& name, size_t size, long mtime) {
  UstarHeader header;
  memset(&header, 0, sizeof(header));
  memcpy(header.name, name.data(), name.size());
  PutOctal(header.mode, 0644);
  PutOctal(header.uid, 0);
  PutOctal(header.gid, 0);
  PutOctal(header.size, size);
  PutOctal(header.mtime, mtime);
  header.typeflag = '0';
  memcpy(header.magic, "ustar", 6);
  memcpy(header.version, "00", 2);

  memset(header.chksum, ' ', sizeof(header.chksum));
  unsigned long sum = 0;
  const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
  for (size_t i = 0; i < sizeof(header); i++) sum += bytes[i];
  std::string chksum = fmt::format("{:06o}", sum);
  memcpy(header.chksum, chksum.data(), 6);
  header.chksum[6] = '\0';
  header.chksum[7] = ' ';

  out.append(reinterpret_cast<const char*>(&header), sizeof(header));
}

void PadBlock(std::string& out) {
  if (size_t rem = out.size() % kBlockSize; rem) out.append(kBlockSize - rem, '\0');
}

} // namespace

bool MakeTarArchive(const fs::path& dir, std::string& out) {
  spdlog::debug("Archive {}", dir.c_str());
  out.clear();
  std::error_code ec;
  std::vector<fs::path> files;
  for (auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) {
      spdlog::warn("Skip non-regular file {} in build context", entry.path().c_str());
      continue;
    }
    files.push_back(entry.path());
  }
  if (ec) {
    spdlog::warn("Failed listing {}: {}", dir.c_str(), strerror(ec.value()));
    return false;
  }
  std::sort(files.begin(), files.end());
  long mtime = time(nullptr);
  for (auto& path : files) {
    std::string name = path.filename();
    if (name.size() >= sizeof(UstarHeader::name)) {
      spdlog::warn("File name too long for archive: {}", name);
      return false;
    }
    std::ifstream fin(path, std::ios::binary);
    if (!fin) {
      spdlog::warn("Failed reading {}", path.c_str());
      return false;
    }
    std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
    AppendHeader(out, name, content.size(), mtime);
    out += content;
    PadBlock(out);
  }
  out.append(kBlockSize * 2, '\0');
  return true;
}
