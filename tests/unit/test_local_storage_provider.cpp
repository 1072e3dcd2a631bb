// Tests for the filesystem StorageProvider and permission gate

#include "../common/test_base.h"
#include "../../src/core/storage/local_storage_provider.h"
#include "../../src/core/storage/permission_gate.h"
#include "../../src/core/catalog/catalog_builder.h"

#include <QFileInfo>
#include <QTest>

#include <algorithm>

class TestLocalStorageProvider : public TestBase
{
    Q_OBJECT

private slots:
    void testListChildren();
    void testListMissingDirectory();
    void testReadAll();
    void testReadMissingFile();
    void testReplaceFileOverwritesAtomically();
    void testReplaceFileInMissingDirectory();
    void testChildRefAndLocalPath();
    void testUnreadableDirectory();
    void testPermissionGate();
    void testScanRealTree();
};

void TestLocalStorageProvider::testListChildren()
{
    const QString root = createDirectory("list");
    createFile("list/a.mp4");
    createFile("list/.hidden.srt");
    QDir().mkpath(root + "/nested");

    LocalStorageProvider storage;
    QVector<StorageEntry> children;
    StorageError error = storage.listChildren(LocalStorageProvider::refForPath(root), children);
    QVERIFY(error.ok());
    QCOMPARE(int(children.size()), 3);

    auto nested = std::find_if(children.begin(), children.end(),
                               [](const StorageEntry& e) { return e.name == "nested"; });
    QVERIFY(nested != children.end());
    QVERIFY(nested->isDirectory);
    QCOMPARE(nested->ref, LocalStorageProvider::refForPath(root + "/nested"));
}

void TestLocalStorageProvider::testListMissingDirectory()
{
    LocalStorageProvider storage;
    QVector<StorageEntry> children;
    StorageError error = storage.listChildren(m_testDataDir->filePath("does-not-exist"), children);
    QCOMPARE(error.status, StorageStatus::NotFound);
    QVERIFY(children.isEmpty());
}

void TestLocalStorageProvider::testReadAll()
{
    const QString path = createFile("read/state.json", "{\"lastFile\":\"a.mp4\"}");

    LocalStorageProvider storage;
    QByteArray data;
    QVERIFY(storage.readAll(LocalStorageProvider::refForPath(path), data).ok());
    QCOMPARE(data, QByteArray("{\"lastFile\":\"a.mp4\"}"));

    StorageError error;
    std::unique_ptr<QIODevice> device = storage.openForRead(path, error);
    QVERIFY(error.ok());
    QVERIFY(device);
    QCOMPARE(device->readAll(), data);
}

void TestLocalStorageProvider::testReadMissingFile()
{
    LocalStorageProvider storage;
    QByteArray data;
    StorageError error = storage.readAll(m_testDataDir->filePath("missing.json"), data);
    QCOMPARE(error.status, StorageStatus::NotFound);
    QVERIFY(!error.message.isEmpty());
}

void TestLocalStorageProvider::testReplaceFileOverwritesAtomically()
{
    const QString dir = LocalStorageProvider::refForPath(createDirectory("write"));

    LocalStorageProvider storage;
    QVERIFY(storage.replaceFile(dir, ".player-state.json", "first").ok());
    QVERIFY(storage.replaceFile(dir, ".player-state.json", "second, longer content").ok());

    QByteArray data;
    QVERIFY(storage.readAll(storage.childRef(dir, ".player-state.json"), data).ok());
    QCOMPARE(data, QByteArray("second, longer content"));

    // No temporary siblings left behind
    QCOMPARE(QDir(dir).entryList(QDir::Files | QDir::Hidden), QStringList{".player-state.json"});
}

void TestLocalStorageProvider::testReplaceFileInMissingDirectory()
{
    LocalStorageProvider storage;
    StorageError error = storage.replaceFile(m_testDataDir->filePath("nowhere/deeper"), "x.json", "data");
    QVERIFY(!error.ok());
}

void TestLocalStorageProvider::testChildRefAndLocalPath()
{
    LocalStorageProvider storage;
    QCOMPARE(storage.childRef("/media/films", "a.mp4"), QString("/media/films/a.mp4"));
    QCOMPARE(storage.childRef("/media/films/", "a.mp4"), QString("/media/films/a.mp4"));
    QCOMPARE(storage.localPath("/media/films/a.mp4"), QString("/media/films/a.mp4"));
    QCOMPARE(LocalStorageProvider::refForPath("/media/./films/../films"), QString("/media/films"));
}

void TestLocalStorageProvider::testUnreadableDirectory()
{
    const QString root = createDirectory("locked");
    createFile("locked/a.mp4");
    QFile::setPermissions(root, QFileDevice::WriteOwner);
    if (QFileInfo(root).isReadable()) {
        QFile::setPermissions(root, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
        QSKIP("Permission bits are not enforced for this user");
    }

    LocalStorageProvider storage;
    QVector<StorageEntry> children;
    StorageError error = storage.listChildren(root, children);
    QFile::setPermissions(root, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    QCOMPARE(error.status, StorageStatus::PermissionDenied);
}

void TestLocalStorageProvider::testPermissionGate()
{
    const QString root = createDirectory("gate");
    LocalPermissionGate gate;
    QCOMPARE(gate.queryAccess(root, AccessMode::Read), AccessState::Granted);
    QCOMPARE(gate.queryAccess(root, AccessMode::ReadWrite), AccessState::Granted);
    QCOMPARE(gate.queryAccess(m_testDataDir->filePath("gone"), AccessMode::Read), AccessState::Denied);

    QFile::setPermissions(root, QFileDevice::ReadOwner | QFileDevice::ExeOwner);
    const bool enforced = !QFileInfo(root).isWritable();
    if (enforced) {
        QCOMPARE(gate.queryAccess(root, AccessMode::Read), AccessState::Granted);
        QCOMPARE(gate.queryAccess(root, AccessMode::ReadWrite), AccessState::Denied);
    }
    QFile::setPermissions(root, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
}

void TestLocalStorageProvider::testScanRealTree()
{
    const QString root = createDirectory("tree");
    createFile("tree/a.mp4");
    createFile("tree/sub/b.mkv");
    createFile("tree/sub/b.srt");
    createFile("tree/sub/notes.txt");

    LocalStorageProvider storage;
    CatalogBuilder builder(storage, FileTypePreferences::defaults());
    ScanResult result = builder.build(LocalStorageProvider::refForPath(root));

    QVERIFY(!result.degraded);
    QCOMPARE(int(result.items.size()), 2);
    QCOMPARE(result.items[0].relativePath(), QString("a.mp4"));
    QCOMPARE(result.items[1].relativePath(), QString("sub/b.mkv"));
    QCOMPARE(int(result.items[1].subtitles().size()), 1);
    QCOMPARE(result.items[1].subtitles().first().relativePath, QString("sub/b.srt"));
    QCOMPARE(storage.localPath(result.items[1].sourceRef()), LocalStorageProvider::refForPath(root + "/sub/b.mkv"));
}

QTEST_MAIN(TestLocalStorageProvider)
#include "test_local_storage_provider.moc"
