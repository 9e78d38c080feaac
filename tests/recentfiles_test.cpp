/*
 * Tests for the recent-files list
 * tests/recentfiles_test.cpp
 */

#include <QFile>
#include <QTemporaryDir>
#include <QTest>

#include "../src/hex/recentfiles.h"

using namespace RomHex;

namespace {

QString touch(QTemporaryDir& dir, const QString& name) {
    const QString path = dir.path() + QLatin1Char('/') + name;
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) {
        f.write("x");
    }
    return path;
}

}  // namespace

class RecentFilesTest : public QObject {
    Q_OBJECT

   private slots:
    void addMovesToFront();
    void listIsBounded();
    void missingStoreIsEmpty();
    void saveThenLoadDropsStaleEntries();
    void loadConsidersOnlyFirstEntries();
};

void RecentFilesTest::addMovesToFront() {
    RecentFiles recent;
    recent.add(QStringLiteral("/a"));
    recent.add(QStringLiteral("/b"));
    recent.add(QStringLiteral("/a"));
    QCOMPARE(recent.paths(), QStringList({QStringLiteral("/a"), QStringLiteral("/b")}));

    QVERIFY(recent.remove(QStringLiteral("/b")));
    QVERIFY(!recent.remove(QStringLiteral("/b")));
    QCOMPARE(recent.paths().size(), qsizetype(1));
}

void RecentFilesTest::listIsBounded() {
    RecentFiles recent(3);
    for (int i = 0; i < 5; ++i) {
        recent.add(QStringLiteral("/f%1").arg(i));
    }
    QCOMPARE(recent.paths(), QStringList({QStringLiteral("/f4"), QStringLiteral("/f3"), QStringLiteral("/f2")}));

    recent.setMaxEntries(1);
    QCOMPARE(recent.paths(), QStringList({QStringLiteral("/f4")}));
}

void RecentFilesTest::missingStoreIsEmpty() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    RecentFiles recent;
    recent.add(QStringLiteral("/stale"));
    HexError err;
    QVERIFY(recent.load(dir.path() + QStringLiteral("/none.txt"), err));
    QVERIFY(!err.isSet());
    QVERIFY(recent.paths().isEmpty());
}

void RecentFilesTest::saveThenLoadDropsStaleEntries() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString a = touch(dir, QStringLiteral("a.img"));
    const QString b = touch(dir, QStringLiteral("b.img"));
    const QString store = dir.path() + QStringLiteral("/cfg/recent_hex_files.txt");

    RecentFiles recent;
    recent.add(a);
    recent.add(dir.path() + QStringLiteral("/gone.img"));
    recent.add(b);
    HexError err;
    QVERIFY2(recent.save(store, err), qPrintable(err.message));

    RecentFiles reloaded;
    QVERIFY(reloaded.load(store, err));
    QCOMPARE(reloaded.paths(), QStringList({b, a}));
}

void RecentFilesTest::loadConsidersOnlyFirstEntries() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString a = touch(dir, QStringLiteral("a.img"));
    const QString b = touch(dir, QStringLiteral("b.img"));
    const QString store = dir.path() + QStringLiteral("/recent.txt");

    QFile f(store);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write((dir.path() + QStringLiteral("/gone.img\n") + a + QLatin1Char('\n') + b + QLatin1Char('\n')).toUtf8());
    f.close();

    RecentFiles recent(2);
    HexError err;
    QVERIFY(recent.load(store, err));
    QCOMPARE(recent.paths(), QStringList({a}));
}

QTEST_MAIN(RecentFilesTest)
#include "recentfiles_test.moc"
