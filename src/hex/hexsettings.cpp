/*
 * Editor configuration persisted as INI
 * src/hex/hexsettings.cpp
 */

#include "hexsettings.h"

#include <QSettings>
#include <QStandardPaths>

namespace RomHex {

HexSettings::HexSettings()
    : bytesPerLine_(16),
      undoHistoryLimit_(100),
      largeFileThresholdMiB_(500),
      littleEndian_(true),
      maxSearchResults_(1000),
      maxStringMatches_(1000),
      minStringLength_(4),
      signatureStride_(512),
      maxRecentFiles_(10) {}

QString HexSettings::defaultConfigPath() {
    return QStandardPaths::writableLocation(QStandardPaths::ConfigLocation) + QStringLiteral("/romhex/romhex.conf");
}

bool HexSettings::loadFile(const QString& filePath) {
    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return false;
    }

    settings.beginGroup(QStringLiteral("Editor"));
    setBytesPerLine(settings.value(QStringLiteral("BytesPerLine"), 16).toInt());
    setUndoHistoryLimit(settings.value(QStringLiteral("UndoHistoryLimit"), 100).toInt());
    setLargeFileThresholdMiB(settings.value(QStringLiteral("LargeFileThresholdMiB"), 500).toInt());
    setLittleEndian(settings.value(QStringLiteral("LittleEndian"), true).toBool());
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Search"));
    setMaxSearchResults(settings.value(QStringLiteral("MaxResults"), 1000).toInt());
    setMaxStringMatches(settings.value(QStringLiteral("MaxStringMatches"), 1000).toInt());
    setMinStringLength(settings.value(QStringLiteral("MinStringLength"), 4).toInt());
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Analysis"));
    setSignatureStride(settings.value(QStringLiteral("SignatureStride"), 512).toInt());
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Recent"));
    setMaxRecentFiles(settings.value(QStringLiteral("MaxRecentFiles"), 10).toInt());
    settings.endGroup();
    return true;
}

bool HexSettings::saveFile(const QString& filePath) const {
    QSettings settings(filePath, QSettings::IniFormat);

    settings.beginGroup(QStringLiteral("Editor"));
    settings.setValue(QStringLiteral("BytesPerLine"), bytesPerLine_);
    settings.setValue(QStringLiteral("UndoHistoryLimit"), undoHistoryLimit_);
    settings.setValue(QStringLiteral("LargeFileThresholdMiB"), largeFileThresholdMiB_);
    settings.setValue(QStringLiteral("LittleEndian"), littleEndian_);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Search"));
    settings.setValue(QStringLiteral("MaxResults"), maxSearchResults_);
    settings.setValue(QStringLiteral("MaxStringMatches"), maxStringMatches_);
    settings.setValue(QStringLiteral("MinStringLength"), minStringLength_);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Analysis"));
    settings.setValue(QStringLiteral("SignatureStride"), signatureStride_);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("Recent"));
    settings.setValue(QStringLiteral("MaxRecentFiles"), maxRecentFiles_);
    settings.endGroup();

    settings.sync();
    return settings.status() == QSettings::NoError;
}

}  // namespace RomHex
