/*
 * Text patch files: OFFSET:ORIGINAL:NEW:DESCRIPTION per line
 * src/hex/patchfile.cpp
 */

#include "patchfile.h"

#include <QObject>
#include <QStringList>

#include <utility>

#include "bytebuffer.h"
#include "patternmatcher.h"

namespace RomHex {

namespace PatchFile {

namespace {

QString compactHex(const QByteArray& data) {
    return QString::fromLatin1(data.toHex()).toUpper();
}

bool isComment(const QString& line) {
    return line.startsWith(QLatin1Char('#')) || line.startsWith(QStringLiteral("//"));
}

}  // namespace

bool parseLine(const QString& line, HexPatch& out, HexError& errorOut) {
    errorOut.clear();
    const QStringList parts = line.trimmed().split(QLatin1Char(':'));
    if (parts.size() < 3) {
        errorOut.set(HexError::Kind::InvalidPattern, QObject::tr("Expected OFFSET:ORIGINAL:NEW[:DESCRIPTION]."));
        return false;
    }

    QString offsetText = parts.at(0).trimmed();
    if (offsetText.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        offsetText = offsetText.mid(2);
    }
    bool offsetOk = false;
    const qulonglong offset = offsetText.toULongLong(&offsetOk, 16);
    if (!offsetOk) {
        errorOut.set(HexError::Kind::InvalidPattern, QObject::tr("Invalid offset \"%1\".").arg(parts.at(0).trimmed()));
        return false;
    }

    HexPatch patch;
    patch.offset = offset;
    if (!PatternMatcher::parseHexBytes(parts.at(1), patch.original, errorOut) ||
        !PatternMatcher::parseHexBytes(parts.at(2), patch.replacement, errorOut)) {
        return false;
    }
    if (parts.size() > 3) {
        patch.description = parts.mid(3).join(QLatin1Char(':')).trimmed();
    }
    out = std::move(patch);
    return true;
}

QString formatLine(const HexPatch& patch) {
    return QStringLiteral("0x%1:%2:%3:%4")
        .arg(QString::number(patch.offset, 16).toUpper(), compactHex(patch.original), compactHex(patch.replacement),
             patch.description);
}

bool load(const QString& path, std::vector<HexPatch>& out, HexError& errorOut) {
    QByteArray raw;
    if (!readFileBytes(path, raw, errorOut)) {
        return false;
    }

    std::vector<HexPatch> patches;
    const QStringList lines = QString::fromUtf8(raw).split(QLatin1Char('\n'));
    for (qsizetype i = 0; i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty() || isComment(line)) {
            continue;
        }
        HexPatch patch;
        if (!parseLine(line, patch, errorOut)) {
            errorOut.message = QObject::tr("%1 line %2: %3").arg(path).arg(i + 1).arg(errorOut.message);
            return false;
        }
        patches.push_back(std::move(patch));
    }
    out = std::move(patches);
    return true;
}

bool save(const QString& path, const std::vector<HexPatch>& patches, HexError& errorOut) {
    QString text = QStringLiteral("# Hex Patch File\n# Format: OFFSET:ORIGINAL:NEW:DESCRIPTION\n\n");
    for (const HexPatch& patch : patches) {
        text += formatLine(patch);
        text += QLatin1Char('\n');
    }
    return writeFileBytes(path, text.toUtf8(), errorOut);
}

}  // namespace PatchFile

}  // namespace RomHex
