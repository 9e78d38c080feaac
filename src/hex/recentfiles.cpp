/*
 * Most-recently-used file list
 * src/hex/recentfiles.cpp
 */

#include "recentfiles.h"

#include <QFileInfo>
#include <QStandardPaths>

#include "bytebuffer.h"

namespace RomHex {

RecentFiles::RecentFiles(int maxEntries) : maxEntries_(maxEntries < 1 ? 1 : maxEntries) {}

QString RecentFiles::defaultStorePath() {
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) +
           QStringLiteral("/recent_hex_files.txt");
}

void RecentFiles::add(const QString& path) {
    if (path.isEmpty()) {
        return;
    }
    paths_.removeAll(path);
    paths_.prepend(path);
    while (paths_.size() > maxEntries_) {
        paths_.removeLast();
    }
}

bool RecentFiles::remove(const QString& path) {
    return paths_.removeAll(path) > 0;
}

void RecentFiles::setMaxEntries(int maxEntries) {
    maxEntries_ = maxEntries < 1 ? 1 : maxEntries;
    while (paths_.size() > maxEntries_) {
        paths_.removeLast();
    }
}

bool RecentFiles::load(const QString& storePath, HexError& errorOut) {
    paths_.clear();
    QByteArray raw;
    if (!readFileBytes(storePath, raw, errorOut)) {
        if (errorOut.kind == HexError::Kind::FileNotFound) {
            errorOut.clear();
            return true;
        }
        return false;
    }

    // Only the first maxEntries_ lines count, even if some of them are stale.
    const QStringList lines = QString::fromUtf8(raw).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (qsizetype i = 0; i < lines.size() && i < maxEntries_; ++i) {
        const QString path = lines.at(i).trimmed();
        if (path.isEmpty() || paths_.contains(path) || !QFileInfo::exists(path)) {
            continue;
        }
        paths_.append(path);
    }
    return true;
}

bool RecentFiles::save(const QString& storePath, HexError& errorOut) const {
    QString text = paths_.join(QLatin1Char('\n'));
    if (!text.isEmpty()) {
        text += QLatin1Char('\n');
    }
    return writeFileBytes(storePath, text.toUtf8(), errorOut);
}

}  // namespace RomHex
