/*
 * Text patch files: OFFSET:ORIGINAL:NEW:DESCRIPTION per line
 * src/hex/patchfile.h
 */

#ifndef ROMHEX_PATCHFILE_H
#define ROMHEX_PATCHFILE_H

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <vector>

#include "hexerror.h"

namespace RomHex {

struct HexPatch {
    std::uint64_t offset = 0;
    QByteArray original;
    QByteArray replacement;
    QString description;
};

namespace PatchFile {

// "0x1A0:CAFE:BEEF:fix header". The offset is hex with an optional 0x prefix;
// byte fields accept spaces and dashes between pairs. Everything after the
// third colon is the description.
bool parseLine(const QString& line, HexPatch& out, HexError& errorOut);
QString formatLine(const HexPatch& patch);

// Blank lines and lines starting with '#' or "//" are skipped. A malformed
// line fails the whole load with InvalidPattern naming the line number.
bool load(const QString& path, std::vector<HexPatch>& out, HexError& errorOut);
bool save(const QString& path, const std::vector<HexPatch>& patches, HexError& errorOut);

}  // namespace PatchFile

}  // namespace RomHex

#endif  // ROMHEX_PATCHFILE_H
