/*
 * In-memory byte store for a loaded file
 * src/hex/bytebuffer.h
 */

#ifndef ROMHEX_BYTEBUFFER_H
#define ROMHEX_BYTEBUFFER_H

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <map>
#include <set>

#include "hexerror.h"

namespace RomHex {

// Whole-file helpers. ENOENT maps to FileNotFound, everything else to IOFailure.
bool readFileBytes(const QString& path, QByteArray& out, HexError& errorOut);
bool writeFileBytes(const QString& path, const QByteArray& data, HexError& errorOut);
bool fileSize(const QString& path, std::uint64_t& sizeOut, HexError& errorOut);

// ByteBuffer holds the entire file. Its length never changes after load; all
// edits are overwrites and must go through UndoEngine.
class ByteBuffer {
   public:
    ByteBuffer() = default;
    explicit ByteBuffer(const QByteArray& bytes);

    bool load(const QString& path, HexError& errorOut);
    // Always writes the full buffer. Clears the modified set and dirty flag on success.
    bool save(const QString& path, HexError& errorOut);

    void reset(const QByteArray& bytes);

    std::uint64_t size() const { return static_cast<std::uint64_t>(bytes_.size()); }
    bool isEmpty() const { return bytes_.isEmpty(); }
    bool contains(std::uint64_t offset) const { return offset < size(); }

    // Caller guarantees contains(offset).
    std::uint8_t at(std::uint64_t offset) const {
        return static_cast<std::uint8_t>(bytes_.at(static_cast<qsizetype>(offset)));
    }
    // Clamped at the end of the buffer.
    QByteArray read(std::uint64_t offset, std::uint64_t length) const;
    const QByteArray& bytes() const { return bytes_; }

    // Modified means the byte differs from what was last loaded or saved.
    bool isModified(std::uint64_t offset) const { return modified_.count(offset) != 0; }
    const std::set<std::uint64_t>& modifiedOffsets() const { return modified_; }
    // Byte as last loaded or saved.
    std::uint8_t originalAt(std::uint64_t offset) const;
    bool isDirty() const { return dirty_; }
    void markClean();

   private:
    friend class UndoEngine;

    void store(std::uint64_t offset, const QByteArray& data);

    QByteArray bytes_;
    std::map<std::uint64_t, char> baseline_;
    std::set<std::uint64_t> modified_;
    bool dirty_ = false;
};

}  // namespace RomHex

#endif  // ROMHEX_BYTEBUFFER_H
