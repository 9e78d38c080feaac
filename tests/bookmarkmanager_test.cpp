/*
 * Tests for bookmarks
 * tests/bookmarkmanager_test.cpp
 */

#include <QTest>

#include "../src/hex/bookmarkmanager.h"

using namespace RomHex;

class BookmarkManagerTest : public QObject {
    Q_OBJECT

   private slots:
    void addKeepsOffsetOrder();
    void defaultDescriptionCarriesTime();
    void sameOffsetKeepsBoth();
    void nextAndPreviousAreStrict();
    void renameAndRemoveById();
};

void BookmarkManagerTest::addKeepsOffsetOrder() {
    BookmarkManager bm;
    bm.add(QStringLiteral("kernel"), 0x800);
    bm.add(QStringLiteral("header"), 0x0);
    bm.add(QStringLiteral("ramdisk"), 0x400);

    QCOMPARE(bm.size(), std::size_t(3));
    QCOMPARE(bm.list()[0].name, QStringLiteral("header"));
    QCOMPARE(bm.list()[1].name, QStringLiteral("ramdisk"));
    QCOMPARE(bm.list()[2].name, QStringLiteral("kernel"));
}

void BookmarkManagerTest::defaultDescriptionCarriesTime() {
    BookmarkManager bm;
    const QDateTime when(QDate(2024, 3, 1), QTime(14, 5, 9));
    const Bookmark b = bm.add(QStringLiteral("mark"), 16, QString(), when);
    QCOMPARE(b.description, QStringLiteral("Added at 14:05:09"));
    QCOMPARE(b.createdAt, when);

    const Bookmark custom = bm.add(QStringLiteral("other"), 32, QStringLiteral("dtb start"));
    QCOMPARE(custom.description, QStringLiteral("dtb start"));
}

void BookmarkManagerTest::sameOffsetKeepsBoth() {
    BookmarkManager bm;
    const Bookmark a = bm.add(QStringLiteral("first"), 100);
    const Bookmark b = bm.add(QStringLiteral("second"), 100);
    QVERIFY(a.id != b.id);

    const std::vector<Bookmark> here = bm.atOffset(100);
    QCOMPARE(here.size(), std::size_t(2));
    QCOMPARE(here[0].name, QStringLiteral("first"));
    QCOMPARE(here[1].name, QStringLiteral("second"));
}

void BookmarkManagerTest::nextAndPreviousAreStrict() {
    BookmarkManager bm;
    bm.add(QStringLiteral("a"), 10);
    bm.add(QStringLiteral("b"), 20);
    bm.add(QStringLiteral("c"), 30);

    QCOMPARE(bm.next(10)->offset, std::uint64_t(20));
    QCOMPARE(bm.next(0)->offset, std::uint64_t(10));
    QVERIFY(!bm.next(30).has_value());

    QCOMPARE(bm.previous(20)->offset, std::uint64_t(10));
    QCOMPARE(bm.previous(100)->offset, std::uint64_t(30));
    QVERIFY(!bm.previous(10).has_value());
}

void BookmarkManagerTest::renameAndRemoveById() {
    BookmarkManager bm;
    const Bookmark b = bm.add(QStringLiteral("old"), 5);

    QVERIFY(bm.rename(b.id, QStringLiteral("new")));
    QVERIFY(bm.setDescription(b.id, QStringLiteral("note")));
    QCOMPARE(bm.find(b.id)->name, QStringLiteral("new"));
    QCOMPARE(bm.find(b.id)->description, QStringLiteral("note"));

    QVERIFY(!bm.rename(b.id + 1, QStringLiteral("missing")));
    QVERIFY(bm.remove(b.id));
    QVERIFY(!bm.remove(b.id));
    QVERIFY(bm.isEmpty());
    QVERIFY(!bm.find(b.id).has_value());
}

QTEST_MAIN(BookmarkManagerTest)
#include "bookmarkmanager_test.moc"
