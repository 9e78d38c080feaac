/*
 * Whole-buffer checksums and byte histogram
 * src/hex/checksumengine.cpp
 */

#include "checksumengine.h"

#include <QCryptographicHash>

#include <algorithm>
#include <b3sum/blake3.h>

namespace RomHex::ChecksumEngine {

namespace {

constexpr qsizetype kChunk = 2 * 1024 * 1024;

std::array<std::uint32_t, 256> makeCrcTable() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (c >> 1) ^ 0xEDB88320u : c >> 1;
        }
        table[i] = c;
    }
    return table;
}

const std::array<std::uint32_t, 256>& crcTable() {
    static const std::array<std::uint32_t, 256> table = makeCrcTable();
    return table;
}

std::uint32_t crcStep(std::uint32_t state, const std::uint8_t* data, std::size_t length) {
    const auto& table = crcTable();
    for (std::size_t i = 0; i < length; ++i) {
        state = table[(state ^ data[i]) & 0xFFu] ^ (state >> 8);
    }
    return state;
}

}  // namespace

std::uint32_t crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t length) {
    return crcStep(crc ^ 0xFFFFFFFFu, data, length) ^ 0xFFFFFFFFu;
}

std::uint32_t crc32(const QByteArray& data) {
    return crc32Update(0, reinterpret_cast<const std::uint8_t*>(data.constData()),
                       static_cast<std::size_t>(data.size()));
}

ChecksumReport compute(const QByteArray& data) {
    ChecksumReport report;
    report.size = static_cast<std::uint64_t>(data.size());

    QCryptographicHash md5(QCryptographicHash::Md5);
    QCryptographicHash sha1(QCryptographicHash::Sha1);
    QCryptographicHash sha256(QCryptographicHash::Sha256);
    blake3_hasher b3;
    blake3_hasher_init(&b3);
    std::uint32_t crc = 0xFFFFFFFFu;

    for (qsizetype pos = 0; pos < data.size(); pos += kChunk) {
        const qsizetype len = std::min<qsizetype>(kChunk, data.size() - pos);
        const char* chunk = data.constData() + pos;
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(chunk);

        md5.addData(QByteArrayView(chunk, len));
        sha1.addData(QByteArrayView(chunk, len));
        sha256.addData(QByteArrayView(chunk, len));
        blake3_hasher_update(&b3, bytes, static_cast<size_t>(len));
        crc = crcStep(crc, bytes, static_cast<std::size_t>(len));
        for (qsizetype i = 0; i < len; ++i) {
            report.histogram[bytes[i]]++;
        }
    }

    report.crc32 = crc ^ 0xFFFFFFFFu;
    report.md5 = md5.result();
    report.sha1 = sha1.result();
    report.sha256 = sha256.result();

    uint8_t out[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&b3, out, BLAKE3_OUT_LEN);
    report.blake3 = QByteArray(reinterpret_cast<const char*>(out), BLAKE3_OUT_LEN);

    std::vector<ByteFrequency> freq;
    for (int i = 0; i < 256; ++i) {
        const std::uint64_t c = report.histogram[static_cast<std::size_t>(i)];
        if (c > 0) {
            freq.push_back(ByteFrequency{static_cast<std::uint8_t>(i), c});
        }
    }
    std::stable_sort(freq.begin(), freq.end(),
                     [](const ByteFrequency& a, const ByteFrequency& b) { return a.count > b.count; });
    if (freq.size() > kTopByteCount) {
        freq.resize(kTopByteCount);
    }
    report.topBytes = std::move(freq);
    return report;
}

QString crc32Hex(std::uint32_t crc) {
    return QStringLiteral("%1").arg(crc, 8, 16, QLatin1Char('0')).toUpper();
}

QString digestHex(const QByteArray& digest) {
    return QString::fromLatin1(digest.toHex().toUpper());
}

double percentage(std::uint64_t count, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(count) * 100.0 / static_cast<double>(total);
}

}  // namespace RomHex::ChecksumEngine
