/*
 * Whole-buffer checksums and byte histogram
 * src/hex/checksumengine.h
 */

#ifndef ROMHEX_CHECKSUMENGINE_H
#define ROMHEX_CHECKSUMENGINE_H

#include <QByteArray>
#include <QString>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace RomHex {

struct ByteFrequency {
    std::uint8_t value = 0;
    std::uint64_t count = 0;
};

// Snapshot of one exact buffer state; recompute after any edit.
struct ChecksumReport {
    std::uint64_t size = 0;
    std::uint32_t crc32 = 0;
    QByteArray md5;
    QByteArray sha1;
    QByteArray sha256;
    QByteArray blake3;
    std::array<std::uint64_t, 256> histogram{};
    std::vector<ByteFrequency> topBytes;
};

namespace ChecksumEngine {

constexpr std::size_t kTopByteCount = 20;

ChecksumReport compute(const QByteArray& data);

// Reflected CRC-32 (poly 0xEDB88320). Feed |crc| from a previous call to continue.
std::uint32_t crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t length);
std::uint32_t crc32(const QByteArray& data);

QString crc32Hex(std::uint32_t crc);
QString digestHex(const QByteArray& digest);
double percentage(std::uint64_t count, std::uint64_t total);

}  // namespace ChecksumEngine

}  // namespace RomHex

#endif  // ROMHEX_CHECKSUMENGINE_H
