#include <QtTest>
#include <QJsonObject>
#include "../src/drive_auth.h"
#include "../src/drive_store.h"
#include "../src/http_client.h"

class TestDriveQuery : public QObject {
    Q_OBJECT
private slots:
    void testEscape();
    void testBuild_data();
    void testBuild();
    void testParseFileList();
    void testParseFileListInvalid();
    void testParseCredentials();
    void testParseCredentialsMissingClient();
    void testMergeTokens();
    void testHttpErrorMapping();
    void testFormEncode();
};

void TestDriveQuery::testEscape()
{
    QCOMPARE(DriveQuery::escape("plain"), QString("'plain'"));
    QCOMPARE(DriveQuery::escape("it's"), QString("'it\\'s'"));
    QCOMPARE(DriveQuery::escape("a\\b"), QString("'a\\\\b'"));
}

void TestDriveQuery::testBuild_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<bool>("foldersOnly");
    QTest::addColumn<bool>("filesOnly");
    QTest::addColumn<QString>("expected");

    QTest::newRow("children") << QString() << false << false
                              << QString("'p1' in parents and trashed=false");
    QTest::newRow("folder by name")
        << QString("camera-1") << true << false
        << QString("'p1' in parents and trashed=false and name='camera-1' and "
                   "mimeType='application/vnd.google-apps.folder'");
    QTest::newRow("files only")
        << QString() << false << true
        << QString("'p1' in parents and trashed=false and mimeType!='application/vnd.google-apps.folder'");
    QTest::newRow("quoted name") << QString("o'clock.mp4") << false << false
                                 << QString("'p1' in parents and trashed=false and name='o\\'clock.mp4'");
}

void TestDriveQuery::testBuild()
{
    QFETCH(QString, name);
    QFETCH(bool, foldersOnly);
    QFETCH(bool, filesOnly);
    QFETCH(QString, expected);

    ListQuery q;
    q.name = name;
    q.foldersOnly = foldersOnly;
    q.filesOnly = filesOnly;
    QCOMPARE(DriveQuery::build("p1", q), expected);
}

void TestDriveQuery::testParseFileList()
{
    const QByteArray body = R"({
        "nextPageToken": "tok2",
        "files": [
            {"id": "f1", "name": "camera-1", "mimeType": "application/vnd.google-apps.folder", "parents": ["root"]},
            {"id": "f2", "name": "a.mp4", "mimeType": "video/mp4", "parents": ["f1"]},
            {"id": "f3", "name": "orphan.mp4", "mimeType": "video/mp4"}
        ]
    })";
    ListPage page;
    OpError err;
    QVERIFY(DriveQuery::parseFileList(body, &page, &err));
    QCOMPARE(page.nextPageToken, QString("tok2"));
    QCOMPARE(page.records.size(), 3);
    QVERIFY(page.records[0].isFolder);
    QCOMPARE(page.records[0].parentId, QString("root"));
    QVERIFY(!page.records[1].isFolder);
    QCOMPARE(page.records[1].name, QString("a.mp4"));
    QCOMPARE(page.records[1].parentId, QString("f1"));
    QVERIFY(page.records[2].parentId.isEmpty());

    QVERIFY(DriveQuery::parseFileList(R"({"files": []})", &page, &err));
    QVERIFY(page.records.isEmpty());
    QVERIFY(page.nextPageToken.isEmpty());
}

void TestDriveQuery::testParseFileListInvalid()
{
    ListPage page;
    OpError err;
    QVERIFY(!DriveQuery::parseFileList("<html>502</html>", &page, &err));
    QCOMPARE(err.kind, ErrorKind::TransientIO);
}

void TestDriveQuery::testParseCredentials()
{
    OAuthClient client;
    OpError err;
    QVERIFY(DriveAuth::parseCredentials(
        R"({"installed": {"client_id": "cid", "client_secret": "sec", "redirect_uris": ["http://localhost"]}})",
        &client, &err));
    QCOMPARE(client.clientId, QString("cid"));
    QCOMPARE(client.clientSecret, QString("sec"));
    QCOMPARE(client.redirectUri, QString("http://localhost"));

    QVERIFY(DriveAuth::parseCredentials(R"({"web": {"client_id": "w", "client_secret": "s"}})", &client, &err));
    QCOMPARE(client.clientId, QString("w"));
    QVERIFY(client.redirectUri.isEmpty());
}

void TestDriveQuery::testParseCredentialsMissingClient()
{
    OAuthClient client;
    OpError err;
    QVERIFY(!DriveAuth::parseCredentials(R"({"installed": {"client_id": "cid"}})", &client, &err));
    QCOMPARE(err.kind, ErrorKind::AuthSetup);
    QVERIFY(!DriveAuth::parseCredentials("not json", &client, &err));
    QCOMPARE(err.kind, ErrorKind::AuthSetup);
}

void TestDriveQuery::testMergeTokens()
{
    QJsonObject stored;
    stored.insert("access_token", "old");
    stored.insert("refresh_token", "keep-me");
    stored.insert("expiry_date", 1000.0);

    QJsonObject response;
    response.insert("access_token", "new");
    response.insert("expires_in", 3600);
    response.insert("token_type", "Bearer");

    const QJsonObject merged = DriveAuth::mergeTokens(stored, response, 5000);
    QCOMPARE(merged.value("access_token").toString(), QString("new"));
    QCOMPARE(merged.value("refresh_token").toString(), QString("keep-me"));
    QCOMPARE(qint64(merged.value("expiry_date").toDouble()), qint64(5000 + 3600 * 1000));
    QVERIFY(!merged.contains("expires_in"));
    QCOMPARE(merged.value("token_type").toString(), QString("Bearer"));
}

void TestDriveQuery::testHttpErrorMapping()
{
    HttpResponse resp;
    resp.status = 404;
    resp.body = "{\"error\": \"File not found\"}";
    OpError err = Http::toError(resp, "files.get");
    QCOMPARE(err.kind, ErrorKind::RemoteNotFound);
    QVERIFY(err.message.contains("HTTP 404"));

    resp.status = 403;
    QCOMPARE(Http::toError(resp, "x").kind, ErrorKind::RemotePermissionDenied);
    resp.status = 401;
    QCOMPARE(Http::toError(resp, "x").kind, ErrorKind::RemotePermissionDenied);
    resp.status = 503;
    QCOMPARE(Http::toError(resp, "x").kind, ErrorKind::TransientIO);

    HttpResponse noReply;
    noReply.networkError = "Connection refused";
    err = Http::toError(noReply, "files.list");
    QCOMPARE(err.kind, ErrorKind::TransientIO);
    QVERIFY(err.message.contains("Connection refused"));

    noReply.timedOut = true;
    QCOMPARE(Http::toError(noReply, "x").kind, ErrorKind::Timeout);
}

void TestDriveQuery::testFormEncode()
{
    const QByteArray body = Http::formEncode({{"grant_type", "refresh_token"}, {"refresh_token", "1//a+b/c="}});
    QCOMPARE(body, QByteArray("grant_type=refresh_token&refresh_token=1%2F%2Fa%2Bb%2Fc%3D"));
}

QTEST_APPLESS_MAIN(TestDriveQuery)
#include "test_drive_query.moc"
