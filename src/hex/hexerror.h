/*
 * Error reporting shared by the hex engine
 * src/hex/hexerror.h
 */

#ifndef ROMHEX_HEXERROR_H
#define ROMHEX_HEXERROR_H

#include <QString>

namespace RomHex {

struct HexError {
    enum class Kind {
        None,
        FileNotFound,
        IOFailure,
        InvalidPattern,
        OutOfRange,
        // Inspector values that cannot be produced. They surface as "-" and
        // a debug log line, never through an errorOut.
        DecodeFailure,
        Cancelled,
        NoDocument,
    };

    Kind kind = Kind::None;
    QString message;

    bool isSet() const { return kind != Kind::None; }

    void set(Kind k, const QString& text) {
        kind = k;
        message = text;
    }
    void clear() {
        kind = Kind::None;
        message.clear();
    }
};

// Stable identifier used in logs and CLI output.
inline QString errorKindName(HexError::Kind kind) {
    switch (kind) {
        case HexError::Kind::None:
            return QStringLiteral("none");
        case HexError::Kind::FileNotFound:
            return QStringLiteral("file-not-found");
        case HexError::Kind::IOFailure:
            return QStringLiteral("io-failure");
        case HexError::Kind::InvalidPattern:
            return QStringLiteral("invalid-pattern");
        case HexError::Kind::OutOfRange:
            return QStringLiteral("out-of-range");
        case HexError::Kind::DecodeFailure:
            return QStringLiteral("decode-failure");
        case HexError::Kind::Cancelled:
            return QStringLiteral("cancelled");
        case HexError::Kind::NoDocument:
            return QStringLiteral("no-document");
    }
    return QStringLiteral("unknown");
}

}  // namespace RomHex

#endif  // ROMHEX_HEXERROR_H
