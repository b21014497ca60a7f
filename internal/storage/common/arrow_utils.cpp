#include "arrow_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/storage/common/path_utils.hpp"

namespace capsule::storage::common {

namespace {

void SyncDescriptor(int fd, const std::filesystem::path& path) {
  if (::fsync(fd) != 0) {
    throw util::IOFailure("fsync failed for " + path.string() + ": " + std::strerror(errno));
  }
}

// Makes a completed rename durable.
void SyncDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    throw util::IOFailure("cannot open directory " + dir.string() + ": " + std::strerror(errno));
  }
  const int rc  = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    throw util::IOFailure("fsync failed for directory " + dir.string() + ": " + std::strerror(err));
  }
}

void DiscardTemp(const std::filesystem::path& tmp_path) {
  std::error_code ec;
  std::filesystem::remove(tmp_path, ec);
}

} // namespace

std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer;
}

void WriteFileAtomic(const std::filesystem::path& final_path, const uint8_t* data, int64_t size, bool fsync, bool no_clobber) {
  const auto tmp_path = TempPathFor(final_path);

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(data, size));
    Unwrap(out->Flush());

    if (fsync) SyncDescriptor(out->file_descriptor(), tmp_path);

    Unwrap(out->Close());
  } catch (const util::IOFailure&) {
    DiscardTemp(tmp_path);
    throw;
  }

  std::error_code ec;
  if (no_clobber && std::filesystem::exists(final_path, ec)) {
    DiscardTemp(tmp_path);
    throw util::IOFailure("refusing to overwrite existing object " + final_path.string());
  }

  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    DiscardTemp(tmp_path);
    throw util::IOFailure("rename to " + final_path.string() + " failed: " + ec.message());
  }

  if (fsync) SyncDirectory(final_path.has_parent_path() ? final_path.parent_path() : std::filesystem::path{"."});
}

void CreateDirectories(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw util::IOFailure("cannot create directory " + dir.string() + ": " + ec.message());
  }
}

} // namespace capsule::storage::common
