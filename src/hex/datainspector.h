/*
 * Typed interpretation of bytes at an offset
 * src/hex/datainspector.h
 */

#ifndef ROMHEX_DATAINSPECTOR_H
#define ROMHEX_DATAINSPECTOR_H

#include <QByteArray>
#include <QString>

#include <cstdint>

namespace RomHex {

enum class DataKind { SignedInteger, UnsignedInteger, Float, String, Binary };
enum class Endianness { Little, Big };

inline QString dataKindName(DataKind kind) {
    switch (kind) {
        case DataKind::SignedInteger:
            return QStringLiteral("signed integer");
        case DataKind::UnsignedInteger:
            return QStringLiteral("unsigned integer");
        case DataKind::Float:
            return QStringLiteral("float");
        case DataKind::String:
            return QStringLiteral("string");
        case DataKind::Binary:
            return QStringLiteral("binary");
    }
    return QStringLiteral("unknown");
}

struct InspectorValues {
    QString int8;
    QString uint8;
    QString int16;
    QString uint16;
    QString int32;
    QString uint32;
    QString int64;
    QString uint64;
    QString float32;
    QString float64;
    QString string;
    QString binary;
};

namespace DataInspector {

constexpr int kMaxStringBytes = 64;

// Returned whenever a value cannot be produced.
inline QString unavailable() {
    return QStringLiteral("-");
}

// Integers take width 1/2/4/8, floats 4/8, binary 1. For strings, width caps
// the scanned bytes (0 means the 64-byte default).
QString decode(const QByteArray& data, std::uint64_t offset, int width, DataKind kind, Endianness endianness);

InspectorValues inspectAll(const QByteArray& data, std::uint64_t offset, Endianness endianness);

}  // namespace DataInspector

}  // namespace RomHex

#endif  // ROMHEX_DATAINSPECTOR_H
