/*
 * Text and raw exports of the loaded buffer
 * src/hex/exporters.cpp
 */

#include "exporters.h"

#include <QObject>
#include <QSaveFile>
#include <QStringList>

#include <algorithm>

#include "bytebuffer.h"

namespace RomHex::Exporters {

namespace {

constexpr int kDumpLinesPerWrite = 4096;

bool openSaveFile(QSaveFile& file, HexError& errorOut) {
    if (!file.open(QIODevice::WriteOnly)) {
        errorOut.set(HexError::Kind::IOFailure,
                     QObject::tr("Cannot write %1: %2").arg(file.fileName(), file.errorString()));
        return false;
    }
    return true;
}

bool writeChunk(QSaveFile& file, const QByteArray& chunk, HexError& errorOut) {
    if (file.write(chunk) != chunk.size()) {
        errorOut.set(HexError::Kind::IOFailure,
                     QObject::tr("Cannot write %1: %2").arg(file.fileName(), file.errorString()));
        file.cancelWriting();
        return false;
    }
    return true;
}

bool commit(QSaveFile& file, HexError& errorOut) {
    if (!file.commit()) {
        errorOut.set(HexError::Kind::IOFailure,
                     QObject::tr("Cannot write %1: %2").arg(file.fileName(), file.errorString()));
        return false;
    }
    return true;
}

}  // namespace

QString formatFileSize(std::uint64_t bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 2).arg(QLatin1String(kUnits[unit]));
}

QString formatHexDumpLine(const QByteArray& data, std::uint64_t offset) {
    QString hex;
    QString ascii;
    hex.reserve(kBytesPerDumpLine * 3);
    const auto size = static_cast<std::uint64_t>(data.size());
    for (int j = 0; j < kBytesPerDumpLine; ++j) {
        const std::uint64_t pos = offset + static_cast<std::uint64_t>(j);
        if (pos < size) {
            const auto b = static_cast<unsigned char>(data.at(static_cast<qsizetype>(pos)));
            hex += QStringLiteral("%1 ").arg(static_cast<uint>(b), 2, 16, QLatin1Char('0')).toUpper();
            ascii += (b >= 32 && b < 127) ? QChar(static_cast<char16_t>(b)) : QChar(u'.');
        }
        else {
            hex += QStringLiteral("   ");
        }
    }
    const QString offsetText = QStringLiteral("%1").arg(offset, 8, 16, QLatin1Char('0')).toUpper();
    return offsetText + QStringLiteral("   ") + hex + QLatin1Char(' ') + ascii;
}

QString hexDumpHeader(const QString& sourcePath, std::uint64_t size, const QDateTime& generatedAt) {
    QStringList lines;
    lines << QStringLiteral("Hex Dump of: %1").arg(sourcePath);
    lines << QStringLiteral("Size: %1").arg(formatFileSize(size));
    lines << QStringLiteral("Generated: %1").arg(generatedAt.toString(Qt::ISODate));
    lines << QString(80, QLatin1Char('='));
    lines << QString();
    lines << QStringLiteral("Offset     00 01 02 03 04 05 06 07 08 09 0A 0B 0C 0D 0E 0F  ASCII");
    lines << QString(80, QLatin1Char('-'));
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString analysisReport(const ChecksumReport& report,
                       const QString& typeLabel,
                       const QString& sourcePath,
                       const QDateTime& generatedAt) {
    QStringList lines;
    lines << QStringLiteral("File Analysis Report");
    lines << QString(60, QLatin1Char('='));
    lines << QStringLiteral("File: %1").arg(sourcePath);
    lines << QStringLiteral("Size: %1 (%2 bytes)").arg(formatFileSize(report.size)).arg(report.size);
    lines << QStringLiteral("Generated: %1").arg(generatedAt.toString(Qt::ISODate));
    lines << QString();
    lines << QStringLiteral("Checksums:");
    lines << QStringLiteral("  CRC32:  %1").arg(ChecksumEngine::crc32Hex(report.crc32));
    lines << QStringLiteral("  MD5:    %1").arg(ChecksumEngine::digestHex(report.md5));
    lines << QStringLiteral("  SHA1:   %1").arg(ChecksumEngine::digestHex(report.sha1));
    lines << QStringLiteral("  SHA256: %1").arg(ChecksumEngine::digestHex(report.sha256));
    lines << QStringLiteral("  BLAKE3: %1").arg(ChecksumEngine::digestHex(report.blake3));
    lines << QString();
    lines << QStringLiteral("File Type: %1").arg(typeLabel);
    lines << QString();
    lines << QStringLiteral("Byte Distribution:");
    for (const ByteFrequency& f : report.topBytes) {
        lines << QStringLiteral("  0x%1: %2 (%3%)")
                     .arg(QStringLiteral("%1").arg(static_cast<uint>(f.value), 2, 16, QLatin1Char('0')).toUpper())
                     .arg(f.count, 10)
                     .arg(ChecksumEngine::percentage(f.count, report.size), 0, 'f', 2);
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

bool exportHexDump(const QByteArray& data,
                   const QString& sourcePath,
                   const QString& outPath,
                   const QDateTime& generatedAt,
                   HexError& errorOut) {
    errorOut.clear();
    QSaveFile file(outPath);
    if (!openSaveFile(file, errorOut)) {
        return false;
    }
    const auto size = static_cast<std::uint64_t>(data.size());
    if (!writeChunk(file, hexDumpHeader(sourcePath, size, generatedAt).toUtf8(), errorOut)) {
        return false;
    }

    QByteArray chunk;
    int pending = 0;
    for (std::uint64_t offset = 0; offset < size; offset += kBytesPerDumpLine) {
        chunk += formatHexDumpLine(data, offset).toLatin1();
        chunk += '\n';
        if (++pending == kDumpLinesPerWrite) {
            if (!writeChunk(file, chunk, errorOut)) {
                return false;
            }
            chunk.clear();
            pending = 0;
        }
    }
    if (!chunk.isEmpty() && !writeChunk(file, chunk, errorOut)) {
        return false;
    }
    return commit(file, errorOut);
}

bool exportAnalysis(const ChecksumReport& report,
                    const QString& typeLabel,
                    const QString& sourcePath,
                    const QString& outPath,
                    const QDateTime& generatedAt,
                    HexError& errorOut) {
    errorOut.clear();
    QSaveFile file(outPath);
    if (!openSaveFile(file, errorOut)) {
        return false;
    }
    if (!writeChunk(file, analysisReport(report, typeLabel, sourcePath, generatedAt).toUtf8(), errorOut)) {
        return false;
    }
    return commit(file, errorOut);
}

bool exportRange(const QByteArray& data,
                 std::uint64_t start,
                 std::uint64_t length,
                 const QString& outPath,
                 HexError& errorOut) {
    errorOut.clear();
    const auto size = static_cast<std::uint64_t>(data.size());
    if (start >= size || length == 0) {
        errorOut.set(HexError::Kind::OutOfRange, QObject::tr("Nothing selected to export."));
        return false;
    }
    const std::uint64_t n = std::min<std::uint64_t>(length, size - start);
    return writeFileBytes(outPath, data.mid(static_cast<qsizetype>(start), static_cast<qsizetype>(n)), errorOut);
}

}  // namespace RomHex::Exporters
