/*
 * romhex command-line entry point
 * romhex/main.cpp
 */

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QTextStream>

#include <cstdio>

#include "../src/hex/exporters.h"
#include "../src/hex/hexsession.h"

using namespace RomHex;

namespace {

enum ExitCode { ExitOk = 0, ExitFailure = 1, ExitDeclined = 2 };

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

int report(const HexError& err) {
    QTextStream(stderr) << "romhex: " << errorKindName(err.kind) << ": " << err.message << Qt::endl;
    return err.kind == HexError::Kind::Cancelled ? ExitDeclined : ExitFailure;
}

bool parseOffset(QString text, std::uint64_t& offsetOut) {
    text = text.trimmed();
    int base = 10;
    if (text.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        base = 16;
        text = text.mid(2);
    }
    bool ok = false;
    offsetOut = text.toULongLong(&ok, base);
    return ok;
}

void printStructure(const StructureNode& node, int depth) {
    out() << QString(depth * 2, QLatin1Char(' ')) << node.name << "  [" << node.location << "]\n";
    for (const StructureNode& child : node.children) {
        printStructure(child, depth + 1);
    }
}

void printInfo(const HexSession& session) {
    const ChecksumReport report = session.computeChecksums();
    out() << "File:   " << session.path() << '\n';
    out() << "Size:   " << Exporters::formatFileSize(report.size) << " (" << report.size << " bytes)\n";
    out() << "Type:   " << StructureDetector::fileTypeLabel(session.detectFileType()) << '\n';
    out() << "CRC32:  " << ChecksumEngine::crc32Hex(report.crc32) << '\n';
    out() << "MD5:    " << ChecksumEngine::digestHex(report.md5) << '\n';
    out() << "SHA1:   " << ChecksumEngine::digestHex(report.sha1) << '\n';
    out() << "SHA256: " << ChecksumEngine::digestHex(report.sha256) << '\n';
    out() << "BLAKE3: " << ChecksumEngine::digestHex(report.blake3) << '\n';
}

void printHits(const SearchResults& results) {
    for (const SearchResult& hit : results.hits) {
        out() << QStringLiteral("%1").arg(hit.offset, 8, 16, QLatin1Char('0')).toUpper() << "  " << hit.previewText
              << '\n';
    }
    if (results.truncated) {
        out() << "(stopped after " << results.hits.size() << " matches)\n";
    }
}

void printInspector(const InspectorValues& v) {
    out() << "int8:    " << v.int8 << '\n';
    out() << "uint8:   " << v.uint8 << '\n';
    out() << "int16:   " << v.int16 << '\n';
    out() << "uint16:  " << v.uint16 << '\n';
    out() << "int32:   " << v.int32 << '\n';
    out() << "uint32:  " << v.uint32 << '\n';
    out() << "int64:   " << v.int64 << '\n';
    out() << "uint64:  " << v.uint64 << '\n';
    out() << "float32: " << v.float32 << '\n';
    out() << "float64: " << v.float64 << '\n';
    out() << "string:  " << v.string << '\n';
    out() << "binary:  " << v.binary << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("romhex"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Inspect and patch firmware images"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                    QCoreApplication::translate("main", "Read settings from INI file"),
                                    QCoreApplication::translate("main", "FILE"));
    parser.addOption(configOption);
    QCommandLineOption infoOption({QStringLiteral("i"), QStringLiteral("info")},
                                  QCoreApplication::translate("main", "Print type, size and checksums"));
    parser.addOption(infoOption);
    QCommandLineOption structureOption(QStringLiteral("structure"),
                                       QCoreApplication::translate("main", "Print detected signature tree"));
    parser.addOption(structureOption);
    QCommandLineOption strideOption(QStringLiteral("stride"),
                                    QCoreApplication::translate("main", "Signature scan stride in bytes"),
                                    QCoreApplication::translate("main", "BYTES"));
    parser.addOption(strideOption);
    QCommandLineOption stringsOption(QStringLiteral("strings"),
                                     QCoreApplication::translate("main", "List printable ASCII strings"));
    parser.addOption(stringsOption);
    QCommandLineOption minLengthOption(QStringLiteral("min-length"),
                                       QCoreApplication::translate("main", "Minimum string length"),
                                       QCoreApplication::translate("main", "N"));
    parser.addOption(minLengthOption);
    QCommandLineOption patternsOption(QStringLiteral("find-patterns"),
                                      QCoreApplication::translate("main", "Scan for well-known magic bytes"));
    parser.addOption(patternsOption);
    QCommandLineOption searchOption({QStringLiteral("s"), QStringLiteral("search")},
                                    QCoreApplication::translate("main", "Search hex bytes (\"FF 00\") or text"),
                                    QCoreApplication::translate("main", "QUERY"));
    parser.addOption(searchOption);
    QCommandLineOption inspectOption(QStringLiteral("inspect"),
                                     QCoreApplication::translate("main", "Decode values at offset"),
                                     QCoreApplication::translate("main", "OFFSET"));
    parser.addOption(inspectOption);
    QCommandLineOption bigEndianOption(QStringLiteral("big-endian"),
                                       QCoreApplication::translate("main", "Decode multi-byte values as big-endian"));
    parser.addOption(bigEndianOption);
    QCommandLineOption compareOption(QStringLiteral("compare"),
                                     QCoreApplication::translate("main", "Report bytes that differ from FILE"),
                                     QCoreApplication::translate("main", "FILE"));
    parser.addOption(compareOption);
    QCommandLineOption setOption(QStringLiteral("set"),
                                 QCoreApplication::translate("main", "Overwrite bytes, e.g. 0x10:DEADBEEF"),
                                 QCoreApplication::translate("main", "OFFSET:HEX"));
    parser.addOption(setOption);
    QCommandLineOption replaceOption(QStringLiteral("replace"),
                                     QCoreApplication::translate("main", "Replace every match, e.g. \"FF FF\"=0000"),
                                     QCoreApplication::translate("main", "QUERY=HEX"));
    parser.addOption(replaceOption);
    QCommandLineOption patchOption(QStringLiteral("patch"),
                                   QCoreApplication::translate("main", "Apply an OFFSET:ORIGINAL:NEW patch file"),
                                   QCoreApplication::translate("main", "FILE"));
    parser.addOption(patchOption);
    QCommandLineOption savePatchOption(QStringLiteral("save-patch"),
                                       QCoreApplication::translate("main", "Write this run's edits as a patch file"),
                                       QCoreApplication::translate("main", "FILE"));
    parser.addOption(savePatchOption);
    QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                    QCoreApplication::translate("main", "Write the edited image to FILE"),
                                    QCoreApplication::translate("main", "FILE"));
    parser.addOption(outputOption);
    QCommandLineOption inPlaceOption(QStringLiteral("in-place"),
                                     QCoreApplication::translate("main", "Write edits back to the input file"));
    parser.addOption(inPlaceOption);
    QCommandLineOption dumpOption(QStringLiteral("dump"),
                                  QCoreApplication::translate("main", "Export a hex dump to FILE"),
                                  QCoreApplication::translate("main", "FILE"));
    parser.addOption(dumpOption);
    QCommandLineOption analysisOption(QStringLiteral("analysis"),
                                      QCoreApplication::translate("main", "Export an analysis report to FILE"),
                                      QCoreApplication::translate("main", "FILE"));
    parser.addOption(analysisOption);
    QCommandLineOption forceOption({QStringLiteral("f"), QStringLiteral("force")},
                                   QCoreApplication::translate("main", "Load files above the size threshold"));
    parser.addOption(forceOption);

    parser.addPositionalArgument(QStringLiteral("file"), QCoreApplication::translate("main", "Image to open"));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(ExitFailure);
    }

    HexSettings settings;
    if (parser.isSet(configOption) && !settings.loadFile(parser.value(configOption))) {
        QTextStream(stderr) << "romhex: cannot read settings from " << parser.value(configOption) << Qt::endl;
        return ExitFailure;
    }
    if (parser.isSet(strideOption)) {
        settings.setSignatureStride(parser.value(strideOption).toInt());
    }
    if (parser.isSet(minLengthOption)) {
        settings.setMinStringLength(parser.value(minLengthOption).toInt());
    }
    if (parser.isSet(bigEndianOption)) {
        settings.setLittleEndian(false);
    }

    CategoryLogSink log;
    HexSession session(log, settings);
    const bool force = parser.isSet(forceOption);
    session.setLoadConfirmation([force](const QString&, std::uint64_t) { return force; });
    session.setSavePrompt([](const QString&) { return HexSession::SaveDecision::Discard; });

    HexError err;
    if (!session.open(QFileInfo(args.front()).absoluteFilePath(), err)) {
        return report(err);
    }

    if (parser.isSet(infoOption)) {
        printInfo(session);
    }
    if (parser.isSet(structureOption)) {
        printStructure(session.analyzeStructure(), 0);
    }
    if (parser.isSet(patternsOption)) {
        printHits(session.findKnownPatterns());
    }
    if (parser.isSet(stringsOption)) {
        const StringScan scan = session.extractStrings();
        for (const StringMatch& m : scan.matches) {
            out() << QStringLiteral("%1").arg(m.offset, 8, 16, QLatin1Char('0')).toUpper() << "  " << m.preview
                  << '\n';
        }
        if (scan.truncated) {
            out() << "(stopped after " << scan.matches.size() << " strings)\n";
        }
    }
    if (parser.isSet(searchOption)) {
        printHits(session.search(parser.value(searchOption)));
    }
    if (parser.isSet(inspectOption)) {
        std::uint64_t offset = 0;
        if (!parseOffset(parser.value(inspectOption), offset) || offset >= session.buffer().size()) {
            QTextStream(stderr) << "romhex: invalid offset " << parser.value(inspectOption) << Qt::endl;
            return ExitFailure;
        }
        session.setCursor(offset);
        printInspector(session.inspectAll());
    }
    if (parser.isSet(compareOption)) {
        CompareResult diff;
        if (!session.compareWithFile(parser.value(compareOption), diff, err)) {
            return report(err);
        }
        out() << session.lastStatus() << '\n';
    }

    bool edited = false;
    for (const QString& spec : parser.values(setOption)) {
        const qsizetype colon = spec.indexOf(QLatin1Char(':'));
        std::uint64_t offset = 0;
        if (colon <= 0 || !parseOffset(spec.left(colon), offset)) {
            QTextStream(stderr) << "romhex: expected OFFSET:HEX, got " << spec << Qt::endl;
            return ExitFailure;
        }
        QByteArray bytes;
        if (!PatternMatcher::parseHexBytes(spec.mid(colon + 1), bytes, err)) {
            return report(err);
        }
        if (!session.buffer().contains(offset)) {
            QTextStream(stderr) << "romhex: offset " << spec.left(colon) << " is past the end of the file"
                                << Qt::endl;
            return ExitFailure;
        }
        edited = session.writeBytes(offset, bytes) || edited;
    }
    for (const QString& spec : parser.values(replaceOption)) {
        const qsizetype eq = spec.lastIndexOf(QLatin1Char('='));
        if (eq <= 0) {
            QTextStream(stderr) << "romhex: expected QUERY=HEX, got " << spec << Qt::endl;
            return ExitFailure;
        }
        session.search(spec.left(eq));
        const std::size_t replaced = session.replaceAll(spec.mid(eq + 1), err);
        if (err.isSet()) {
            return report(err);
        }
        out() << "Replaced " << replaced << " occurrence(s) of " << spec.left(eq) << '\n';
        edited = replaced > 0 || edited;
    }
    for (const QString& patchPath : parser.values(patchOption)) {
        std::size_t applied = 0;
        const bool complete = session.applyPatchFile(patchPath, applied, err);
        out() << session.lastStatus() << '\n';
        edited = applied > 0 || edited;
        if (!complete) {
            return report(err);
        }
    }

    if (parser.isSet(savePatchOption) && !session.savePatchFile(parser.value(savePatchOption), err)) {
        return report(err);
    }

    if (edited) {
        if (parser.isSet(outputOption)) {
            if (!session.saveAs(parser.value(outputOption), err)) {
                return report(err);
            }
        }
        else if (parser.isSet(inPlaceOption)) {
            if (!session.save(err)) {
                return report(err);
            }
        }
        else {
            QTextStream(stderr) << "romhex: edits made; pass --output FILE or --in-place to keep them" << Qt::endl;
            return ExitFailure;
        }
    }

    if (parser.isSet(dumpOption) && !session.exportHexDump(parser.value(dumpOption), err)) {
        return report(err);
    }
    if (parser.isSet(analysisOption) && !session.exportAnalysis(parser.value(analysisOption), err)) {
        return report(err);
    }

    out().flush();
    return ExitOk;
}
