/*
 * Typed interpretation of bytes at an offset
 * src/hex/datainspector.cpp
 */

#include "datainspector.h"

#include <QStringDecoder>
#include <QtEndian>

#include <cstring>

namespace RomHex::DataInspector {

namespace {

template <typename T>
T readEndian(const char* data, Endianness endianness) {
    T val = 0;
    std::memcpy(&val, data, sizeof(T));
    return endianness == Endianness::Little ? qFromLittleEndian(val) : qFromBigEndian(val);
}

bool windowFits(const QByteArray& data, std::uint64_t offset, int width) {
    const auto size = static_cast<std::uint64_t>(data.size());
    return width > 0 && offset < size && size - offset >= static_cast<std::uint64_t>(width);
}

QString decodeInteger(const char* p, int width, bool isSigned, Endianness e) {
    switch (width) {
        case 1:
            return isSigned ? QString::number(static_cast<qint8>(*p)) : QString::number(static_cast<quint8>(*p));
        case 2:
            return isSigned ? QString::number(readEndian<qint16>(p, e)) : QString::number(readEndian<quint16>(p, e));
        case 4:
            return isSigned ? QString::number(readEndian<qint32>(p, e)) : QString::number(readEndian<quint32>(p, e));
        case 8:
            return isSigned ? QString::number(readEndian<qint64>(p, e)) : QString::number(readEndian<quint64>(p, e));
        default:
            return unavailable();
    }
}

QString decodeFloat(const char* p, int width, Endianness e) {
    if (width == 4) {
        const quint32 bits = readEndian<quint32>(p, e);
        float f = 0.0f;
        std::memcpy(&f, &bits, sizeof(float));
        return QString::number(static_cast<double>(f), 'g', 7);
    }
    if (width == 8) {
        const quint64 bits = readEndian<quint64>(p, e);
        double d = 0.0;
        std::memcpy(&d, &bits, sizeof(double));
        return QString::number(d, 'g', 15);
    }
    return unavailable();
}

QString decodeString(const QByteArray& data, std::uint64_t offset, int width) {
    const auto size = static_cast<std::uint64_t>(data.size());
    if (offset >= size) {
        return unavailable();
    }
    const int limit = (width <= 0 || width > kMaxStringBytes) ? kMaxStringBytes : width;
    QByteArray raw = data.mid(static_cast<qsizetype>(offset), limit);
    const qsizetype nul = raw.indexOf('\0');
    if (nul >= 0) {
        raw.truncate(nul);
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder(raw);
    if (!decoder.hasError()) {
        return text;
    }

    QString ascii;
    ascii.reserve(raw.size());
    for (const char c : raw) {
        const auto b = static_cast<unsigned char>(c);
        ascii.append(QChar(b < 0x80 ? static_cast<char16_t>(b) : u'?'));
    }
    return ascii;
}

}  // namespace

QString decode(const QByteArray& data, std::uint64_t offset, int width, DataKind kind, Endianness endianness) {
    if (kind == DataKind::String) {
        return decodeString(data, offset, width);
    }
    if (!windowFits(data, offset, width)) {
        return unavailable();
    }

    const char* p = data.constData() + offset;
    switch (kind) {
        case DataKind::SignedInteger:
            return decodeInteger(p, width, true, endianness);
        case DataKind::UnsignedInteger:
            return decodeInteger(p, width, false, endianness);
        case DataKind::Float:
            return decodeFloat(p, width, endianness);
        case DataKind::Binary:
            if (width != 1) {
                return unavailable();
            }
            return QStringLiteral("%1").arg(static_cast<uint>(static_cast<quint8>(*p)), 8, 2, QLatin1Char('0'));
        case DataKind::String:
            break;
    }
    return unavailable();
}

InspectorValues inspectAll(const QByteArray& data, std::uint64_t offset, Endianness endianness) {
    InspectorValues v;
    v.int8 = decode(data, offset, 1, DataKind::SignedInteger, endianness);
    v.uint8 = decode(data, offset, 1, DataKind::UnsignedInteger, endianness);
    v.int16 = decode(data, offset, 2, DataKind::SignedInteger, endianness);
    v.uint16 = decode(data, offset, 2, DataKind::UnsignedInteger, endianness);
    v.int32 = decode(data, offset, 4, DataKind::SignedInteger, endianness);
    v.uint32 = decode(data, offset, 4, DataKind::UnsignedInteger, endianness);
    v.int64 = decode(data, offset, 8, DataKind::SignedInteger, endianness);
    v.uint64 = decode(data, offset, 8, DataKind::UnsignedInteger, endianness);
    v.float32 = decode(data, offset, 4, DataKind::Float, endianness);
    v.float64 = decode(data, offset, 8, DataKind::Float, endianness);
    v.string = decode(data, offset, kMaxStringBytes, DataKind::String, endianness);
    v.binary = decode(data, offset, 1, DataKind::Binary, endianness);
    return v;
}

}  // namespace RomHex::DataInspector
