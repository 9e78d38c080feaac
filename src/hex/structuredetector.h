/*
 * Magic-byte identification, signature scans and string extraction
 * src/hex/structuredetector.h
 */

#ifndef ROMHEX_STRUCTUREDETECTOR_H
#define ROMHEX_STRUCTUREDETECTOR_H

#include <QByteArray>
#include <QString>

#include <cstddef>
#include <cstdint>
#include <vector>

#include "patternmatcher.h"

namespace RomHex {

enum class FileType {
    Unknown,
    AndroidBootImage,
    Elf,
    Zip,
    SparseImage,
    Png,
    Jpeg,
    Gzip,
    Lz4,
    Xz,
    Gpt,
    Tar,
    Ext4,
    F2fs,
    Erofs,
    Text,
    Binary,
};

struct StructureNode {
    QString name;
    QString location;
    std::vector<StructureNode> children;
};

struct StringMatch {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    QString preview;
};

struct StringScan {
    std::vector<StringMatch> matches;
    bool truncated = false;
};

namespace StructureDetector {

constexpr std::uint64_t kDefaultStride = 512;
constexpr int kDefaultMinStringLength = 4;
constexpr std::size_t kDefaultMaxStrings = 1000;
constexpr int kStringPreviewLength = 50;
constexpr int kTextSniffLength = 1000;

FileType detectFileType(const QByteArray& data);
QString fileTypeLabel(FileType type);

// Checks the fixed signature table only at multiples of |stride|; the first
// hit per signature becomes a child of the whole-file root node.
StructureNode scanSignatures(const QByteArray& data, std::uint64_t stride = kDefaultStride);

// Unaligned scan for well-known magics; previewText carries the pattern name.
SearchResults findKnownPatterns(const QByteArray& data, std::size_t maxResults = PatternMatcher::kDefaultMaxResults);

StringScan extractStrings(const QByteArray& data,
                          int minLength = kDefaultMinStringLength,
                          std::size_t maxMatches = kDefaultMaxStrings);

}  // namespace StructureDetector

}  // namespace RomHex

#endif  // ROMHEX_STRUCTUREDETECTOR_H
