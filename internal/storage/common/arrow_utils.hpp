#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace capsule::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::IOFailure
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::IOFailure(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::IOFailure(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      write tmp -> flush -> (fsync) -> rename -> (fsync parent dir)

  With `no_clobber` an existing target fails the write and the temp file is
  discarded.
*/
void WriteFileAtomic(const std::filesystem::path& final_path, const uint8_t* data, int64_t size, bool fsync, bool no_clobber);

inline void WriteFileAtomic(const std::filesystem::path& final_path, std::string_view data, bool fsync) {
  WriteFileAtomic(final_path, reinterpret_cast<const uint8_t*>(data.data()), static_cast<int64_t>(data.size()), fsync, false);
}

// filesystem_error -> IOFailure
void CreateDirectories(const std::filesystem::path& dir);

} // namespace capsule::storage::common
