#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include <QSignalSpy>
#include "../src/transfer_pipeline.h"
#include "../src/error_log.h"
#include "fake_stores.h"

namespace {

QStringList errorLogEntries(const ErrorLog& log)
{
    QFile f(log.path());
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return {};
    QStringList lines = QString::fromUtf8(f.readAll()).split('\n', Qt::SkipEmptyParts);
    if (!lines.isEmpty()) lines.removeFirst();   // header
    return lines;
}

void writeFile(const QString& path, const QByteArray& data)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) f.write(data);
}

}

class TestTransferPipeline : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testExistingInDestinationIsSkipped();
    void testExistingInSourceBucketIsSkipped();
    void testExistingFoundPastEmptyPages();
    void testFolderFoundPastEmptyPages();
    void testFolderWithOutputNameIsNotASkip();
    void testKeysEscapingWorkDirAreRejected();
    void testAbsoluteKeyStaysInWorkDir();
    void testSkipRemovesLocalLeftovers();
    void testHappyPath();
    void testCategoryFolderCreatedOnce();
    void testTranscodeFailureAfterFreshFetch();
    void testTranscodeFailureKeepsPreexistingInput();
    void testFetchFailure();
    void testUploadFailureStillDone();
    void testNoPublishTargetKeepsOutput();
    void testPublishToSourceBucket();
    void testExistenceCheckErrorTreatedAsAbsent();
    void testNameCollision();
    void testDuplicateKeyInWorkListIsSkippedSecondTime();
    void testRunSummary();

private:
    TransferPipeline* makePipeline(bool withDestination = true);

    QTemporaryDir* m_dir = nullptr;
    RunConfig m_config;
    FakeSourceStore* m_source = nullptr;
    FakeDestinationStore* m_dest = nullptr;
    FakeTranscoder* m_transcoder = nullptr;
    ErrorLog* m_errorLog = nullptr;
    TransferPipeline* m_pipeline = nullptr;
};

void TestTransferPipeline::init()
{
    m_dir = new QTemporaryDir;
    m_config = RunConfig();
    m_config.workDir = m_dir->path();
    m_source = new FakeSourceStore;
    m_dest = new FakeDestinationStore;
    m_transcoder = new FakeTranscoder;
    m_errorLog = new ErrorLog(m_dir->filePath("error_transcode.txt"));
    QVERIFY(m_errorLog->ensureInitialized());
}

void TestTransferPipeline::cleanup()
{
    delete m_pipeline;
    m_pipeline = nullptr;
    delete m_errorLog;
    delete m_transcoder;
    delete m_dest;
    delete m_source;
    delete m_dir;
}

TransferPipeline* TestTransferPipeline::makePipeline(bool withDestination)
{
    delete m_pipeline;
    m_pipeline = new TransferPipeline(m_config, *m_source, withDestination ? m_dest : nullptr, *m_transcoder,
                                      *m_errorLog);
    return m_pipeline;
}

void TestTransferPipeline::testExistingInDestinationIsSkipped()
{
    const QString folder = m_dest->addFolder("root", "other-videos");
    m_dest->addFile(folder, "a_converted.mp4");
    m_source->objects.insert("a.mov", "raw");

    const ItemOutcome out = makePipeline()->processItem("a.mov");
    QCOMPARE(out.item.status, ItemStatus::SkippedExisting);
    QCOMPARE(out.item.history,
             QVector<ItemStatus>({ItemStatus::Pending, ItemStatus::CheckingDestination, ItemStatus::SkippedExisting}));
    QVERIFY(m_source->fetchCalls.isEmpty());
    QVERIFY(m_transcoder->requests.isEmpty());
    QCOMPARE(m_dest->uploadCalls, 0);
    QCOMPARE(m_dest->createCalls, 0);
    QVERIFY(errorLogEntries(*m_errorLog).isEmpty());
}

void TestTransferPipeline::testExistingInSourceBucketIsSkipped()
{
    m_source->objects.insert("cams/camera-4/b.mov", "raw");
    m_source->objects.insert("cams/camera-4/b_converted.mp4", "done");

    const ItemOutcome out = makePipeline()->processItem("cams/camera-4/b.mov");
    QCOMPARE(out.item.status, ItemStatus::SkippedExisting);
    QCOMPARE(m_source->headCalls, QStringList({"cams/camera-4/b_converted.mp4"}));
    QVERIFY(m_source->fetchCalls.isEmpty());
    // Found in the bucket, so the drive is never consulted.
    QCOMPARE(m_dest->listCalls, 0);
}

void TestTransferPipeline::testExistingFoundPastEmptyPages()
{
    const QString folder = m_dest->addFolder("root", "other-videos");
    m_dest->addFile(folder, "a_converted.mp4");
    m_source->objects.insert("a.mov", "raw");
    // Listings may return empty pages that still carry a continuation token.
    m_dest->emptyLeadingPages = 2;

    const ItemOutcome out = makePipeline()->processItem("a.mov");
    QCOMPARE(out.item.status, ItemStatus::SkippedExisting);
    QVERIFY(m_source->fetchCalls.isEmpty());
    QVERIFY(m_transcoder->requests.isEmpty());
    QCOMPARE(m_dest->uploadCalls, 0);
    QCOMPARE(m_dest->createCalls, 0);
    QCOMPARE(m_dest->childNames(folder), QStringList({"a_converted.mp4"}));
}

void TestTransferPipeline::testFolderFoundPastEmptyPages()
{
    const QString folder = m_dest->addFolder("root", "camera-3");
    m_source->objects.insert("camera-3/c.mov", "raw");
    m_dest->emptyLeadingPages = 1;

    const ItemOutcome out = makePipeline()->processItem("camera-3/c.mov");
    QCOMPARE(out.item.status, ItemStatus::Done);
    QCOMPARE(m_dest->createCalls, 0);
    QCOMPARE(m_dest->childNames("root"), QStringList({"camera-3"}));
    QCOMPARE(m_dest->childNames(folder), QStringList({"c_converted.mp4"}));
}

void TestTransferPipeline::testFolderWithOutputNameIsNotASkip()
{
    const QString folder = m_dest->addFolder("root", "other-videos");
    m_dest->addFolder(folder, "a_converted.mp4");
    m_source->objects.insert("a.mov", "raw");

    const ItemOutcome out = makePipeline()->processItem("a.mov");
    QCOMPARE(out.item.status, ItemStatus::Done);
    QCOMPARE(m_dest->uploadCalls, 1);
}

void TestTransferPipeline::testKeysEscapingWorkDirAreRejected()
{
    QTemporaryDir outer;
    m_config.workDir = QDir(outer.path()).filePath("work");
    QDir().mkpath(m_config.workDir);
    m_source->objects.insert("../x.mov", "raw");
    m_source->objects.insert("a/../../y.mov", "raw");
    TransferPipeline* p = makePipeline();

    for (const QString& key : {QString("../x.mov"), QString("a/../../y.mov")}) {
        const ItemOutcome out = p->processItem(key);
        QCOMPARE(out.item.status, ItemStatus::Failed);
        QCOMPARE(out.error.kind, ErrorKind::Config);
        QVERIFY(p->localInputPath(out.item).isEmpty());
    }
    QVERIFY(m_source->fetchCalls.isEmpty());
    QVERIFY(m_transcoder->requests.isEmpty());
    QVERIFY(!QFile::exists(QDir(outer.path()).filePath("x.mov")));
    QVERIFY(!QFile::exists(QDir(outer.path()).filePath("y.mov")));
    QCOMPARE(errorLogEntries(*m_errorLog).size(), 2);
}

void TestTransferPipeline::testAbsoluteKeyStaysInWorkDir()
{
    m_source->objects.insert("/site/camera-5/d.mov", "raw");
    TransferPipeline* p = makePipeline();
    const WorkItem item = WorkItem::fromSourceKey("/site/camera-5/d.mov");
    QCOMPARE(p->localInputPath(item), QDir(m_dir->path()).filePath("site/camera-5/d.mov"));
    QCOMPARE(p->localOutputPath(item), QDir(m_dir->path()).filePath("site/camera-5/d_converted.mp4"));

    QCOMPARE(p->processItem("/site/camera-5/d.mov").item.status, ItemStatus::Done);
    QCOMPARE(m_transcoder->requests.first().inputPath, QDir(m_dir->path()).filePath("site/camera-5/d.mov"));
    QCOMPARE(m_source->fetchCalls, QStringList({"/site/camera-5/d.mov"}));
}

void TestTransferPipeline::testSkipRemovesLocalLeftovers()
{
    const QString folder = m_dest->addFolder("root", "camera-1");
    m_dest->addFile(folder, "a_converted.mp4");
    TransferPipeline* p = makePipeline();
    const WorkItem item = WorkItem::fromSourceKey("s/camera-1/a.mov");
    writeFile(p->localInputPath(item), "stale input");
    writeFile(p->localOutputPath(item), "stale output");

    QCOMPARE(p->processItem("s/camera-1/a.mov").item.status, ItemStatus::SkippedExisting);
    QVERIFY(!QFile::exists(p->localInputPath(item)));
    QVERIFY(!QFile::exists(p->localOutputPath(item)));
}

void TestTransferPipeline::testHappyPath()
{
    m_source->objects.insert("site/camera-12/clip.mov", QByteArray(4096, 'x'));
    TransferPipeline* p = makePipeline();
    QSignalSpy finished(p, &TransferPipeline::itemFinished);
    QSignalSpy statuses(p, &TransferPipeline::statusChanged);

    const ItemOutcome out = p->processItem("site/camera-12/clip.mov");
    QCOMPARE(out.item.status, ItemStatus::Done);
    QCOMPARE(out.item.history,
             QVector<ItemStatus>({ItemStatus::Pending, ItemStatus::CheckingDestination, ItemStatus::Fetching,
                                  ItemStatus::Transcoding, ItemStatus::Publishing, ItemStatus::CleaningUp,
                                  ItemStatus::Done}));
    QVERIFY(out.freshlyFetched);
    QVERIFY(out.transcoded);
    QVERIFY(out.published);
    QVERIFY(!out.publishFailed);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(statuses.count(), 6);
    QCOMPARE(statuses.first().at(0).toString(), QString("site/camera-12/clip.mov"));
    QCOMPARE(statuses.first().at(1).value<ItemStatus>(), ItemStatus::CheckingDestination);
    QCOMPARE(statuses.last().at(1).value<ItemStatus>(), ItemStatus::Done);

    QCOMPARE(m_transcoder->requests.size(), 1);
    const TranscodeRequest& req = m_transcoder->requests.first();
    QCOMPARE(req.inputPath, QDir(m_dir->path()).filePath("site/camera-12/clip.mov"));
    QCOMPARE(req.outputPath, QDir(m_dir->path()).filePath("site/camera-12/clip_converted.mp4"));
    QCOMPARE(req.encoder, EncoderChoice::Software);
    QCOMPARE(req.inputCodec, QString("hevc"));

    QString folderId;
    QVERIFY(DestinationOps::findFolder(*m_dest, "root", "camera-12", &folderId, nullptr));
    QVERIFY(!folderId.isEmpty());
    QCOMPARE(m_dest->childNames(folderId), QStringList({"clip_converted.mp4"}));

    QVERIFY(!QFile::exists(req.inputPath));
    QVERIFY(!QFile::exists(req.outputPath));
    QVERIFY(errorLogEntries(*m_errorLog).isEmpty());
}

void TestTransferPipeline::testCategoryFolderCreatedOnce()
{
    m_source->objects.insert("camera-2/a.mov", "a");
    m_source->objects.insert("camera-2/b.mov", "b");
    TransferPipeline* p = makePipeline();
    QCOMPARE(p->processItem("camera-2/a.mov").item.status, ItemStatus::Done);
    QCOMPARE(p->processItem("camera-2/b.mov").item.status, ItemStatus::Done);
    QCOMPARE(m_dest->createCalls, 1);
    QCOMPARE(m_dest->childNames("root"), QStringList({"camera-2"}));
}

void TestTransferPipeline::testTranscodeFailureAfterFreshFetch()
{
    m_source->objects.insert("a.mov", "raw");
    m_transcoder->exitCode = 1;
    TransferPipeline* p = makePipeline();
    const WorkItem item = WorkItem::fromSourceKey("a.mov");

    const ItemOutcome out = p->processItem("a.mov");
    QCOMPARE(out.item.status, ItemStatus::Failed);
    QCOMPARE(out.error.kind, ErrorKind::Transcode);
    QCOMPARE(out.error.exitCode, 1);
    QVERIFY(!out.publishAttempted);
    QCOMPARE(m_dest->uploadCalls, 0);

    const QStringList entries = errorLogEntries(*m_errorLog);
    QCOMPARE(entries.size(), 1);
    QVERIFY(entries.first().startsWith("a.mov"));

    QVERIFY(!QFile::exists(p->localOutputPath(item)));
    QVERIFY(!QFile::exists(p->localInputPath(item)));
}

void TestTransferPipeline::testTranscodeFailureKeepsPreexistingInput()
{
    m_transcoder->exitCode = 1;
    TransferPipeline* p = makePipeline();
    const WorkItem item = WorkItem::fromSourceKey("camera-3/left-over.mov");
    writeFile(p->localInputPath(item), "from an interrupted run");

    const ItemOutcome out = p->processItem(item.sourceKey);
    QCOMPARE(out.item.status, ItemStatus::Failed);
    QVERIFY(!out.freshlyFetched);
    QVERIFY(m_source->fetchCalls.isEmpty());
    QVERIFY(QFile::exists(p->localInputPath(item)));
    QVERIFY(!QFile::exists(p->localOutputPath(item)));
    QCOMPARE(errorLogEntries(*m_errorLog).size(), 1);
}

void TestTransferPipeline::testFetchFailure()
{
    m_source->objects.insert("a.mov", "raw");
    m_source->fetchFailures.insert("a.mov");
    TransferPipeline* p = makePipeline();

    const ItemOutcome out = p->processItem("a.mov");
    QCOMPARE(out.item.status, ItemStatus::Failed);
    QCOMPARE(out.error.kind, ErrorKind::TransientIO);
    QVERIFY(m_transcoder->requests.isEmpty());
    QVERIFY(!QFile::exists(p->localInputPath(out.item)));
    QCOMPARE(errorLogEntries(*m_errorLog).size(), 1);

    // A missing object is reported as such.
    const ItemOutcome missing = p->processItem("gone.mov");
    QCOMPARE(missing.item.status, ItemStatus::Failed);
    QCOMPARE(missing.error.kind, ErrorKind::RemoteNotFound);
}

void TestTransferPipeline::testUploadFailureStillDone()
{
    m_source->objects.insert("a.mov", "raw");
    m_dest->failUploads = true;
    TransferPipeline* p = makePipeline();

    const ItemOutcome out = p->processItem("a.mov");
    QCOMPARE(out.item.status, ItemStatus::Done);
    QVERIFY(out.publishAttempted);
    QVERIFY(out.publishFailed);
    QVERIFY(!out.published);
    QVERIFY(!QFile::exists(p->localOutputPath(out.item)));
    QVERIFY(!QFile::exists(p->localInputPath(out.item)));
    QCOMPARE(errorLogEntries(*m_errorLog).size(), 1);
}

void TestTransferPipeline::testNoPublishTargetKeepsOutput()
{
    m_source->objects.insert("a.mov", "raw");
    TransferPipeline* p = makePipeline(false);

    const ItemOutcome out = p->processItem("a.mov");
    QCOMPARE(out.item.status, ItemStatus::Done);
    QVERIFY(!out.publishAttempted);
    QVERIFY(!out.item.history.contains(ItemStatus::Publishing));
    QVERIFY(QFile::exists(p->localOutputPath(out.item)));
    QVERIFY(!QFile::exists(p->localInputPath(out.item)));
}

void TestTransferPipeline::testPublishToSourceBucket()
{
    m_config.publishToSourceBucket = true;
    m_source->objects.insert("camera-9/a.mov", "raw");
    TransferPipeline* p = makePipeline(false);

    const ItemOutcome out = p->processItem("camera-9/a.mov");
    QCOMPARE(out.item.status, ItemStatus::Done);
    QVERIFY(out.published);
    QCOMPARE(m_source->putCalls, QStringList({"camera-9/a_converted.mp4"}));
    QCOMPARE(m_source->objects.value("camera-9/a_converted.mp4"), QByteArray("h264"));

    // The published copy now short-circuits a rerun.
    QCOMPARE(p->processItem("camera-9/a.mov").item.status, ItemStatus::SkippedExisting);
}

void TestTransferPipeline::testExistenceCheckErrorTreatedAsAbsent()
{
    m_source->objects.insert("a.mov", "raw");
    m_source->headFailures.insert("a_converted.mp4");
    m_dest->failListingIn.insert("root");
    TransferPipeline* p = makePipeline();

    const ItemOutcome out = p->processItem("a.mov");
    QCOMPARE(out.item.history.at(2), ItemStatus::Fetching);
    QCOMPARE(m_source->fetchCalls, QStringList({"a.mov"}));
    // Folder lookup keeps failing at publish time, so the upload lands in the root.
    QCOMPARE(out.item.status, ItemStatus::Done);
    QVERIFY(out.published);
    m_dest->failListingIn.clear();
    QVERIFY(m_dest->childNames("root").contains("a_converted.mp4"));
}

void TestTransferPipeline::testNameCollision()
{
    m_source->objects.insert("x/camera-1/a.mov", "one");
    m_source->objects.insert("y/camera-1/a.mkv", "two");
    TransferPipeline* p = makePipeline();

    QCOMPARE(p->processItem("x/camera-1/a.mov").item.status, ItemStatus::Done);
    const ItemOutcome second = p->processItem("y/camera-1/a.mkv");
    QCOMPARE(second.item.status, ItemStatus::Failed);
    QCOMPARE(second.error.kind, ErrorKind::NameCollision);
    QCOMPARE(m_source->fetchCalls, QStringList({"x/camera-1/a.mov"}));
    QCOMPARE(m_dest->uploadCalls, 1);

    const QStringList entries = errorLogEntries(*m_errorLog);
    QCOMPARE(entries.size(), 1);
    QVERIFY(entries.first().startsWith("y/camera-1/a.mkv"));
}

void TestTransferPipeline::testDuplicateKeyInWorkListIsSkippedSecondTime()
{
    m_config.checkSourceForConverted = false;
    m_source->objects.insert("a.mov", "raw");
    TransferPipeline* p = makePipeline();

    const RunSummary s = p->run({"a.mov", "a.mov"});
    QCOMPARE(s.done, 1);
    QCOMPARE(s.skipped, 1);
    QCOMPARE(m_source->fetchCalls.size(), 1);
}

void TestTransferPipeline::testRunSummary()
{
    const QString folder = m_dest->addFolder("root", "camera-1");
    m_dest->addFile(folder, "done_converted.mp4");
    m_source->objects.insert("camera-1/new.mov", "raw");
    m_source->objects.insert("camera-1/done.mov", "raw");

    TransferPipeline* p = makePipeline();
    QSignalSpy started(p, &TransferPipeline::itemStarted);
    const RunSummary s = p->run({"camera-1/new.mov", "camera-1/done.mov", "camera-1/missing.mov"});
    QCOMPARE(s.total, 3);
    QCOMPARE(s.done, 1);
    QCOMPARE(s.skipped, 1);
    QCOMPARE(s.failed, 1);
    QCOMPARE(s.publishWarnings, 0);
    QCOMPARE(started.count(), 3);
    QCOMPARE(started.at(2).at(0).toInt(), 2);
}

QTEST_GUILESS_MAIN(TestTransferPipeline)
#include "test_transfer_pipeline.moc"
