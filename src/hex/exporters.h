/*
 * Text and raw exports of the loaded buffer
 * src/hex/exporters.h
 */

#ifndef ROMHEX_EXPORTERS_H
#define ROMHEX_EXPORTERS_H

#include <QByteArray>
#include <QDateTime>
#include <QString>

#include <cstdint>

#include "checksumengine.h"
#include "hexerror.h"

namespace RomHex::Exporters {

constexpr int kBytesPerDumpLine = 16;

// "1.50 KB" style, base 1024, two decimals.
QString formatFileSize(std::uint64_t bytes);

// One dump row for the 16 bytes starting at |offset|; short rows are padded.
QString formatHexDumpLine(const QByteArray& data, std::uint64_t offset);
QString hexDumpHeader(const QString& sourcePath, std::uint64_t size, const QDateTime& generatedAt);

QString analysisReport(const ChecksumReport& report,
                       const QString& typeLabel,
                       const QString& sourcePath,
                       const QDateTime& generatedAt);

bool exportHexDump(const QByteArray& data,
                   const QString& sourcePath,
                   const QString& outPath,
                   const QDateTime& generatedAt,
                   HexError& errorOut);
bool exportAnalysis(const ChecksumReport& report,
                    const QString& typeLabel,
                    const QString& sourcePath,
                    const QString& outPath,
                    const QDateTime& generatedAt,
                    HexError& errorOut);
// Raw bytes [start, start + length), clamped to the buffer.
bool exportRange(const QByteArray& data,
                 std::uint64_t start,
                 std::uint64_t length,
                 const QString& outPath,
                 HexError& errorOut);

}  // namespace RomHex::Exporters

#endif  // ROMHEX_EXPORTERS_H
