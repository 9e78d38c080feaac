/*
 * Editor configuration persisted as INI
 * src/hex/hexsettings.h
 */

#ifndef ROMHEX_HEXSETTINGS_H
#define ROMHEX_HEXSETTINGS_H

#include <QString>

#include <cstdint>

namespace RomHex {

class HexSettings {
   public:
    HexSettings();

    // Default location: <config dir>/romhex/romhex.conf
    static QString defaultConfigPath();

    bool loadFile(const QString& filePath);
    bool saveFile(const QString& filePath) const;

    int bytesPerLine() const { return bytesPerLine_; }
    void setBytesPerLine(int value) { bytesPerLine_ = value < 1 ? 1 : value; }

    int undoHistoryLimit() const { return undoHistoryLimit_; }
    void setUndoHistoryLimit(int value) { undoHistoryLimit_ = value < 1 ? 1 : value; }

    std::uint64_t largeFileThresholdBytes() const {
        return static_cast<std::uint64_t>(largeFileThresholdMiB_) * 1024 * 1024;
    }
    int largeFileThresholdMiB() const { return largeFileThresholdMiB_; }
    void setLargeFileThresholdMiB(int value) { largeFileThresholdMiB_ = value < 1 ? 1 : value; }

    bool littleEndian() const { return littleEndian_; }
    void setLittleEndian(bool value) { littleEndian_ = value; }

    int maxSearchResults() const { return maxSearchResults_; }
    void setMaxSearchResults(int value) { maxSearchResults_ = value < 1 ? 1 : value; }

    int maxStringMatches() const { return maxStringMatches_; }
    void setMaxStringMatches(int value) { maxStringMatches_ = value < 1 ? 1 : value; }

    int minStringLength() const { return minStringLength_; }
    void setMinStringLength(int value) { minStringLength_ = value < 1 ? 1 : value; }

    int signatureStride() const { return signatureStride_; }
    void setSignatureStride(int value) { signatureStride_ = value < 1 ? 1 : value; }

    int maxRecentFiles() const { return maxRecentFiles_; }
    void setMaxRecentFiles(int value) { maxRecentFiles_ = value < 1 ? 1 : value; }

   private:
    int bytesPerLine_;
    int undoHistoryLimit_;
    int largeFileThresholdMiB_;
    bool littleEndian_;
    int maxSearchResults_;
    int maxStringMatches_;
    int minStringLength_;
    int signatureStride_;
    int maxRecentFiles_;
};

}  // namespace RomHex

#endif  // ROMHEX_HEXSETTINGS_H
