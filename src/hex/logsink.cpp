/*
 * Logging sink injected into the hex engine
 * src/hex/logsink.cpp
 */

#include "logsink.h"

namespace RomHex {

Q_LOGGING_CATEGORY(lcSession, "romhex.session", QtInfoMsg)

void CategoryLogSink::message(Level level, const QString& text) {
    switch (level) {
        case Level::Debug:
            qCDebug(lcSession, "%s", qUtf8Printable(text));
            break;
        case Level::Info:
            qCInfo(lcSession, "%s", qUtf8Printable(text));
            break;
        case Level::Warning:
            qCWarning(lcSession, "%s", qUtf8Printable(text));
            break;
    }
}

}  // namespace RomHex
