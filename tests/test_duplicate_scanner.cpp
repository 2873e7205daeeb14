#include <QtTest>
#include "../src/duplicate_scanner.h"
#include "fake_stores.h"

class TestDuplicateScanner : public QObject {
    Q_OBJECT
private slots:
    void testGroupByNameOrder();
    void testRecursiveScan();
    void testPaginationMidFolder();
    void testTrashedEntriesExcluded();
    void testFailedSubtreeGivesPartialResult();
    void testFailureAfterFirstPage();
    void testNoDuplicates();
};

void TestDuplicateScanner::testGroupByNameOrder()
{
    QVector<RemoteFileRecord> files;
    auto rec = [](const QString& id, const QString& name) {
        RemoteFileRecord r;
        r.id = id;
        r.name = name;
        return r;
    };
    files << rec("1", "b.mp4") << rec("2", "a.mp4") << rec("3", "a.mp4") << rec("4", "c.mp4")
          << rec("5", "b.mp4") << rec("6", "a.mp4");

    const QVector<DuplicateGroup> groups = DuplicateScanner::groupByName(files);
    QCOMPARE(groups.size(), 2);
    QCOMPARE(groups[0].name, QString("a.mp4"));
    QCOMPARE(groups[0].records.size(), 3);
    QCOMPARE(groups[0].records[0].id, QString("2"));
    QCOMPARE(groups[1].name, QString("b.mp4"));
    QCOMPARE(groups[1].records[1].id, QString("5"));
}

void TestDuplicateScanner::testRecursiveScan()
{
    FakeDestinationStore store;
    const QString camA = store.addFolder("root", "camera-1");
    const QString camB = store.addFolder("root", "camera-2");
    const QString deep = store.addFolder(camB, "2024");
    store.addFile(camA, "x.mp4", "id1");
    store.addFile(camB, "x.mp4", "id2");
    store.addFile(camA, "y.mp4", "idy");
    store.addFile(deep, "x.mp4", "id3");
    store.addFile("root", "loose.mp4", "idl");

    DuplicateScanner scanner(store);
    const DuplicateScanResult result = scanner.scan("root");
    QVERIFY(result.complete);
    QCOMPARE(result.foldersVisited, 4);
    QCOMPARE(result.files.size(), 5);
    QVERIFY(result.hasDuplicates());
    QCOMPARE(result.groups.size(), 1);
    const DuplicateGroup* g = result.group("x.mp4");
    QVERIFY(g);
    QCOMPARE(g->records.size(), 3);
    QCOMPARE(result.redundantCount(), 2);
    QVERIFY(!result.group("y.mp4"));
    for (const RemoteFileRecord& r : result.files) QVERIFY(!r.isFolder);
}

void TestDuplicateScanner::testPaginationMidFolder()
{
    FakeDestinationStore store;
    store.pageSize = 2;
    const QString folder = store.addFolder("root", "camera-1");
    for (int i = 0; i < 5; ++i) store.addFile(folder, QString("f%1.mp4").arg(i));
    // Same name split across pages three and one.
    store.addFile(folder, "f0.mp4", "late");

    DuplicateScanner scanner(store);
    const DuplicateScanResult result = scanner.scan("root");
    QVERIFY(result.complete);
    QCOMPARE(result.files.size(), 6);
    const DuplicateGroup* g = result.group("f0.mp4");
    QVERIFY(g);
    QCOMPARE(g->records.size(), 2);
    QCOMPARE(g->records.last().id, QString("late"));
}

void TestDuplicateScanner::testTrashedEntriesExcluded()
{
    FakeDestinationStore store;
    store.addFile("root", "x.mp4", "a");
    store.addFile("root", "x.mp4", "b");
    store.setTrashed("b", true);

    DuplicateScanner scanner(store);
    const DuplicateScanResult result = scanner.scan("root");
    QCOMPARE(result.files.size(), 1);
    QVERIFY(!result.hasDuplicates());
}

void TestDuplicateScanner::testFailedSubtreeGivesPartialResult()
{
    FakeDestinationStore store;
    const QString good = store.addFolder("root", "good");
    const QString bad = store.addFolder("root", "bad");
    store.addFile(good, "x.mp4", "g1");
    store.addFile("root", "x.mp4", "r1");
    store.addFile(bad, "x.mp4", "b1");
    store.failListingIn.insert(bad);

    DuplicateScanner scanner(store);
    const DuplicateScanResult result = scanner.scan("root");
    QVERIFY(!result.complete);
    QCOMPARE(result.foldersVisited, 3);
    QCOMPARE(result.files.size(), 2);
    const DuplicateGroup* g = result.group("x.mp4");
    QVERIFY(g);
    QCOMPARE(g->records.size(), 2);
}

void TestDuplicateScanner::testFailureAfterFirstPage()
{
    FakeDestinationStore store;
    store.pageSize = 2;
    for (int i = 0; i < 5; ++i) store.addFile("root", "same.mp4");
    store.failListingAfterPages.insert("root", 1);

    DuplicateScanner scanner(store);
    const DuplicateScanResult result = scanner.scan("root");
    QVERIFY(!result.complete);
    // The first page survives the failure of the second.
    QCOMPARE(result.files.size(), 2);
    QCOMPARE(result.redundantCount(), 1);
}

void TestDuplicateScanner::testNoDuplicates()
{
    FakeDestinationStore store;
    store.addFile("root", "a.mp4");
    store.addFile("root", "b.mp4");
    DuplicateScanner scanner(store);
    const DuplicateScanResult result = scanner.scan("root");
    QVERIFY(result.complete);
    QVERIFY(!result.hasDuplicates());
    QCOMPARE(result.redundantCount(), 0);
}

QTEST_APPLESS_MAIN(TestDuplicateScanner)
#include "test_duplicate_scanner.moc"
