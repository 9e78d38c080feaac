/*
 * POSIX-only file I/O for whole-image loads and saves (no Qt includes)
 * src/core/fs_ops.h
 */

#ifndef ROMHEX_FS_OPS_H
#define ROMHEX_FS_OPS_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace RomHex::FsOps {

struct Error {
    int code = 0;
    std::string message;

    bool isSet() const { return code != 0 || !message.empty(); }
};

struct FileStatus {
    std::uint64_t size = 0;
    bool isRegular = false;
    std::int64_t mtimeSec = 0;
};

// Receives the final file size and returns the destination for the contents,
// or nullptr to abort the read.
using AllocateCallback = std::function<std::uint8_t*(std::size_t)>;

bool stat_file(const std::string& path, FileStatus& out, Error& err);

// Reads a regular file straight into caller-owned storage sized from fstat().
// A file that shrinks during the read reports the short count in bytesRead.
bool read_file_sized(const std::string& path, const AllocateCallback& allocate, std::size_t& bytesRead, Error& err);

// Replaces |path| through a sibling temp file, fsync and rename. Missing
// parent directories are created. The target is never left truncated.
bool write_file_atomic(const std::string& path, const std::uint8_t* data, std::size_t size, Error& err);

bool make_dir_parents(const std::string& path, Error& err);

}  // namespace RomHex::FsOps

#endif  // ROMHEX_FS_OPS_H
