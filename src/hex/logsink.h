/*
 * Logging sink injected into the hex engine
 * src/hex/logsink.h
 */

#ifndef ROMHEX_LOGSINK_H
#define ROMHEX_LOGSINK_H

#include <QLoggingCategory>
#include <QString>

namespace RomHex {

Q_DECLARE_LOGGING_CATEGORY(lcSession)

class LogSink {
   public:
    enum class Level { Debug, Info, Warning };

    virtual ~LogSink() = default;
    virtual void message(Level level, const QString& text) = 0;

    void debug(const QString& text) { message(Level::Debug, text); }
    void info(const QString& text) { message(Level::Info, text); }
    void warning(const QString& text) { message(Level::Warning, text); }
};

// Forwards to the "romhex.session" category so QT_LOGGING_RULES can filter it.
class CategoryLogSink : public LogSink {
   public:
    void message(Level level, const QString& text) override;
};

class NullLogSink : public LogSink {
   public:
    void message(Level, const QString&) override {}
};

}  // namespace RomHex

#endif  // ROMHEX_LOGSINK_H
