/*
 * In-memory byte store for a loaded file
 * src/hex/bytebuffer.cpp
 */

#include "bytebuffer.h"

#include <QFile>
#include <QObject>

#include <cerrno>

#include "../core/fs_ops.h"

namespace RomHex {

namespace {

// FsOps messages already name the path.
void setFromFsError(HexError& errorOut, const FsOps::Error& err) {
    const HexError::Kind kind = err.code == ENOENT ? HexError::Kind::FileNotFound : HexError::Kind::IOFailure;
    errorOut.set(kind, QString::fromLocal8Bit(err.message.c_str()));
}

}  // namespace

bool readFileBytes(const QString& path, QByteArray& out, HexError& errorOut) {
    errorOut.clear();
    const QByteArray native = QFile::encodeName(path);

    QByteArray data;
    std::size_t bytesRead = 0;
    FsOps::Error err;
    const bool ok = FsOps::read_file_sized(
        native.toStdString(),
        [&data](std::size_t n) -> std::uint8_t* {
            data.resize(static_cast<qsizetype>(n));
            return reinterpret_cast<std::uint8_t*>(data.data());
        },
        bytesRead, err);
    if (!ok) {
        setFromFsError(errorOut, err);
        return false;
    }
    if (bytesRead < static_cast<std::size_t>(data.size())) {
        data.truncate(static_cast<qsizetype>(bytesRead));
    }
    out = std::move(data);
    return true;
}

bool writeFileBytes(const QString& path, const QByteArray& data, HexError& errorOut) {
    errorOut.clear();
    const QByteArray native = QFile::encodeName(path);
    FsOps::Error err;
    if (!FsOps::write_file_atomic(native.toStdString(), reinterpret_cast<const std::uint8_t*>(data.constData()),
                                  static_cast<std::size_t>(data.size()), err)) {
        // A missing parent directory is still a write failure, not a lookup failure.
        errorOut.set(HexError::Kind::IOFailure, QString::fromLocal8Bit(err.message.c_str()));
        return false;
    }
    return true;
}

bool fileSize(const QString& path, std::uint64_t& sizeOut, HexError& errorOut) {
    errorOut.clear();
    FsOps::FileStatus status;
    FsOps::Error err;
    if (!FsOps::stat_file(QFile::encodeName(path).toStdString(), status, err)) {
        setFromFsError(errorOut, err);
        return false;
    }
    if (!status.isRegular) {
        errorOut.set(HexError::Kind::IOFailure, QObject::tr("%1 is not a regular file.").arg(path));
        return false;
    }
    sizeOut = status.size;
    return true;
}

ByteBuffer::ByteBuffer(const QByteArray& bytes) : bytes_(bytes) {}

bool ByteBuffer::load(const QString& path, HexError& errorOut) {
    QByteArray data;
    if (!readFileBytes(path, data, errorOut)) {
        return false;
    }
    reset(data);
    return true;
}

bool ByteBuffer::save(const QString& path, HexError& errorOut) {
    if (!writeFileBytes(path, bytes_, errorOut)) {
        return false;
    }
    markClean();
    return true;
}

void ByteBuffer::reset(const QByteArray& bytes) {
    bytes_ = bytes;
    baseline_.clear();
    modified_.clear();
    dirty_ = false;
}

QByteArray ByteBuffer::read(std::uint64_t offset, std::uint64_t length) const {
    if (offset >= size()) {
        return {};
    }
    const std::uint64_t available = size() - offset;
    const std::uint64_t n = length < available ? length : available;
    return bytes_.mid(static_cast<qsizetype>(offset), static_cast<qsizetype>(n));
}

std::uint8_t ByteBuffer::originalAt(std::uint64_t offset) const {
    const auto it = baseline_.find(offset);
    if (it != baseline_.end()) {
        return static_cast<std::uint8_t>(it->second);
    }
    return at(offset);
}

void ByteBuffer::markClean() {
    baseline_.clear();
    modified_.clear();
    dirty_ = false;
}

void ByteBuffer::store(std::uint64_t offset, const QByteArray& data) {
    char* dst = bytes_.data();
    for (qsizetype i = 0; i < data.size(); ++i) {
        const std::uint64_t pos = offset + static_cast<std::uint64_t>(i);
        if (pos >= size()) {
            break;
        }
        const char value = data.at(i);
        auto base = baseline_.find(pos);
        if (base == baseline_.end()) {
            base = baseline_.emplace(pos, dst[pos]).first;
        }
        dst[pos] = value;
        if (value == base->second) {
            modified_.erase(pos);
        }
        else {
            modified_.insert(pos);
        }
    }
    dirty_ = true;
}

}  // namespace RomHex
