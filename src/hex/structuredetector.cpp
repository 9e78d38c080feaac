/*
 * Magic-byte identification, signature scans and string extraction
 * src/hex/structuredetector.cpp
 */

#include "structuredetector.h"

#include <QObject>

#include <cstring>
#include <algorithm>

namespace RomHex::StructureDetector {

namespace {

struct Magic {
    FileType type;
    std::uint64_t offset;
    const char* bytes;
    std::size_t length;
};

// Order matters: the first match wins.
const Magic kFileMagics[] = {
    {FileType::AndroidBootImage, 0, "ANDROID!", 8},
    {FileType::Elf, 0, "\x7F" "ELF", 4},
    {FileType::Zip, 0, "PK\x03\x04", 4},
    {FileType::SparseImage, 0, "\x3A\xFF\x26\xED", 4},
    {FileType::Png, 0, "\x89PNG", 4},
    {FileType::Jpeg, 0, "\xFF\xD8\xFF", 3},
    {FileType::Gzip, 0, "\x1F\x8B", 2},
    {FileType::Lz4, 0, "\x04\x22\x4D\x18", 4},
    {FileType::Xz, 0, "\xFD" "7zXZ\x00", 6},
    {FileType::Gpt, 512, "EFI PART", 8},
    {FileType::Tar, 257, "ustar", 5},
    {FileType::Ext4, 1080, "\x53\xEF", 2},
    {FileType::F2fs, 1024, "\x10\x20\xF5\xF2", 4},
    {FileType::Erofs, 1024, "\xE2\xE1\xF5\xE0", 4},
};

struct Signature {
    const char* name;
    const char* bytes;
    std::size_t length;
};

const Signature kStrideSignatures[] = {
    {"Android Boot Header", "ANDROID!", 8},
    {"GPT Header", "EFI PART", 8},
    {"FAT Boot Sector", "MSDOS5.0", 8},
    {"EXT Superblock", "\x53\xEF", 2},
    {"SquashFS", "hsqs", 4},
    {"GZIP Data", "\x1F\x8B", 2},
    {"XZ Data", "\xFD" "7zXZ\x00", 6},
};

const Signature kKnownPatterns[] = {
    {"Android Boot Image", "ANDROID!", 8},
    {"ELF Header", "\x7F" "ELF", 4},
    {"ZIP Header", "PK\x03\x04", 4},
    {"PNG Header", "\x89PNG", 4},
    {"JPEG Header", "\xFF\xD8\xFF", 3},
    {"DEX Header", "dex\n", 4},
    {"GZIP Header", "\x1F\x8B", 2},
};

bool matchesAt(const QByteArray& data, std::uint64_t offset, const char* bytes, std::size_t length) {
    const auto size = static_cast<std::uint64_t>(data.size());
    if (offset > size || size - offset < length) {
        return false;
    }
    return std::memcmp(data.constData() + offset, bytes, length) == 0;
}

bool looksLikeText(const QByteArray& data) {
    const qsizetype sniffed = std::min<qsizetype>(data.size(), kTextSniffLength);
    for (qsizetype i = 0; i < sniffed; ++i) {
        const auto b = static_cast<unsigned char>(data.at(i));
        if (b < 9 || (b > 13 && b < 32 && b != 27)) {
            return false;
        }
    }
    return true;
}

QString hexOffset(std::uint64_t value, int width = 0) {
    return QStringLiteral("0x") + QStringLiteral("%1").arg(value, width, 16, QLatin1Char('0')).toUpper();
}

StringMatch makeStringMatch(const QByteArray& data, qsizetype start, qsizetype end) {
    StringMatch match;
    match.offset = static_cast<std::uint64_t>(start);
    match.length = static_cast<std::uint64_t>(end - start);
    QString text = QString::fromLatin1(data.constData() + start, end - start);
    if (text.size() > kStringPreviewLength) {
        text = text.left(kStringPreviewLength) + QStringLiteral("...");
    }
    match.preview = text;
    return match;
}

}  // namespace

FileType detectFileType(const QByteArray& data) {
    if (data.size() < 4) {
        return FileType::Unknown;
    }
    for (const Magic& magic : kFileMagics) {
        if (matchesAt(data, magic.offset, magic.bytes, magic.length)) {
            return magic.type;
        }
    }
    return looksLikeText(data) ? FileType::Text : FileType::Binary;
}

QString fileTypeLabel(FileType type) {
    switch (type) {
        case FileType::Unknown:
            return QObject::tr("Unknown");
        case FileType::AndroidBootImage:
            return QObject::tr("Android Boot Image");
        case FileType::Elf:
            return QObject::tr("ELF Executable");
        case FileType::Zip:
            return QObject::tr("ZIP Archive (possibly APK)");
        case FileType::SparseImage:
            return QObject::tr("Android Sparse Image");
        case FileType::Png:
            return QObject::tr("PNG Image");
        case FileType::Jpeg:
            return QObject::tr("JPEG Image");
        case FileType::Gzip:
            return QObject::tr("GZIP Compressed");
        case FileType::Lz4:
            return QObject::tr("LZ4 Compressed");
        case FileType::Xz:
            return QObject::tr("XZ Compressed");
        case FileType::Gpt:
            return QObject::tr("GPT Disk Image");
        case FileType::Tar:
            return QObject::tr("TAR Archive");
        case FileType::Ext4:
            return QObject::tr("EXT4 Filesystem");
        case FileType::F2fs:
            return QObject::tr("F2FS Filesystem");
        case FileType::Erofs:
            return QObject::tr("EROFS Filesystem");
        case FileType::Text:
            return QObject::tr("Text File");
        case FileType::Binary:
            return QObject::tr("Binary File");
    }
    return QObject::tr("Unknown");
}

StructureNode scanSignatures(const QByteArray& data, std::uint64_t stride) {
    if (stride == 0) {
        stride = kDefaultStride;
    }

    StructureNode root;
    root.name = fileTypeLabel(detectFileType(data));
    const auto size = static_cast<std::uint64_t>(data.size());
    root.location = QStringLiteral("0x0 - %1").arg(hexOffset(size == 0 ? 0 : size - 1));

    for (const Signature& sig : kStrideSignatures) {
        for (std::uint64_t offset = 0; offset + sig.length <= size; offset += stride) {
            if (matchesAt(data, offset, sig.bytes, sig.length)) {
                StructureNode child;
                child.name = QString::fromLatin1(sig.name);
                child.location = QStringLiteral("@ %1").arg(hexOffset(offset, 8));
                root.children.push_back(std::move(child));
                break;
            }
        }
    }
    return root;
}

SearchResults findKnownPatterns(const QByteArray& data, std::size_t maxResults) {
    SearchResults out;
    const auto size = static_cast<std::uint64_t>(data.size());
    for (std::uint64_t offset = 0; offset < size; ++offset) {
        for (const Signature& sig : kKnownPatterns) {
            if (!matchesAt(data, offset, sig.bytes, sig.length)) {
                continue;
            }
            if (out.hits.size() >= maxResults) {
                out.truncated = true;
                return out;
            }
            SearchResult hit;
            hit.offset = offset;
            hit.length = sig.length;
            hit.previewText = QString::fromLatin1(sig.name);
            out.hits.push_back(std::move(hit));
        }
    }
    return out;
}

StringScan extractStrings(const QByteArray& data, int minLength, std::size_t maxMatches) {
    StringScan out;
    if (minLength < 1) {
        minLength = 1;
    }

    qsizetype start = -1;
    for (qsizetype i = 0; i <= data.size(); ++i) {
        const bool printable = i < data.size() && static_cast<unsigned char>(data.at(i)) >= 0x20 &&
                               static_cast<unsigned char>(data.at(i)) <= 0x7E;
        if (printable) {
            if (start < 0) {
                start = i;
            }
            continue;
        }
        if (start >= 0 && i - start >= minLength) {
            if (out.matches.size() >= maxMatches) {
                out.truncated = true;
                break;
            }
            out.matches.push_back(makeStringMatch(data, start, i));
        }
        start = -1;
    }
    return out;
}

}  // namespace RomHex::StructureDetector
