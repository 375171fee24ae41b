#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "core/backuprecord.h"

class TestBackupRecord : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_tmpDir;

    BackupConfiguration makeConfig(const QString &destination)
    {
        return BackupConfiguration(m_tmpDir.path() + "/minecraft",
                                   {Folder::Saves, Folder::Mods, Folder::Screenshots},
                                   destination, true, {"log", "tmp"});
    }

private slots:
    void construct_setsCurrentTime()
    {
        QDateTime before = QDateTime::currentDateTimeUtc();
        BackupRecord record(makeConfig("/tmp/out.zip"), 300, 2);
        QDateTime after = QDateTime::currentDateTimeUtc();

        QVERIFY(!record.isNull());
        QVERIFY(record.timestamp() >= before);
        QVERIFY(record.timestamp() <= after);
        QCOMPARE(record.sizeInBytes(), quint64(300));
        QCOMPARE(record.fileCount(), 2);
        QCOMPARE(record.jsonSizeInBytes(), quint64(0));
    }

    void defaultRecord_isNull()
    {
        BackupRecord record;
        QVERIFY(record.isNull());
    }

    void toJson_fields()
    {
        BackupRecord record(makeConfig("/tmp/out.zip"), 1234, 7);
        QJsonObject obj = record.toJson();

        QVERIFY(obj["timestamp"].isString());
        QCOMPARE(obj["size_in_bytes"].toInteger(), qint64(1234));
        QCOMPARE(obj["file_count"].toInt(), 7);
        QCOMPARE(obj["compress"].toBool(), true);
        QCOMPARE(obj["folders"].toArray().size(), 3);
        QCOMPARE(obj["folders"].toArray().at(0).toString(), QString("saves"));
        QCOMPARE(obj["folders"].toArray().at(2).toString(), QString("screenshots"));
        QCOMPARE(obj["excluded_extensions"].toArray().size(), 2);
        QCOMPARE(obj["destination"].toString(), QString("/tmp/out.zip"));
    }

    void toJson_emptyExclusionsIsArray()
    {
        BackupConfiguration config(m_tmpDir.path(), {Folder::Saves}, "/tmp/out", false);
        BackupRecord record(config, 0, 0);
        QJsonObject obj = record.toJson();
        QVERIFY(obj["excluded_extensions"].isArray());
        QVERIFY(obj["excluded_extensions"].toArray().isEmpty());
    }

    void writeJson_roundTrip()
    {
        QString destination = m_tmpDir.path() + "/roundtrip/backup";
        BackupRecord record(makeConfig(destination), 987654321, 42);

        QString errorString;
        QCOMPARE(record.writeJson(&errorString), ErrorKind::None);
        QVERIFY2(errorString.isEmpty(), qPrintable(errorString));

        QString path = record.metadataPath();
        QVERIFY(QFile::exists(path));
        QCOMPARE(record.jsonSizeInBytes(), quint64(QFileInfo(path).size()));

        QFile f(path);
        QVERIFY(f.open(QIODevice::ReadOnly));
        BackupRecord parsed = BackupRecord::fromJson(f.readAll(), &errorString);
        QVERIFY2(!parsed.isNull(), qPrintable(errorString));

        QCOMPARE(parsed.timestamp(), record.timestamp());
        QCOMPARE(parsed.sizeInBytes(), record.sizeInBytes());
        QCOMPARE(parsed.fileCount(), record.fileCount());
        QCOMPARE(parsed.configuration().folders(), record.configuration().folders());
        QCOMPARE(parsed.configuration().excludedExtensions(), QStringList({"log", "tmp"}));
        QCOMPARE(parsed.configuration().compress(), true);
        QCOMPARE(parsed.configuration().destination(), destination);
        QCOMPARE(parsed.jsonSizeInBytes(), record.jsonSizeInBytes());
    }

    void metadataPath_besideDestination()
    {
        QString destination = m_tmpDir.path() + "/sidecar/mirror";
        BackupRecord record(makeConfig(destination), 1, 1);

        QString path = record.metadataPath();
        QCOMPARE(QFileInfo(path).absolutePath(), QFileInfo(destination).absolutePath());
        QVERIFY(QFileInfo(path).fileName().startsWith("mirror_"));
        QVERIFY(path.endsWith(".json"));
        QVERIFY(!path.startsWith(destination + "/"));
        // Same record, same path
        QCOMPARE(record.metadataPath(), path);
    }

    void writeJson_explicitPath()
    {
        BackupRecord record(makeConfig("/tmp/out"), 10, 1);
        QString path = m_tmpDir.path() + "/explicit/nested/meta.json";

        QCOMPARE(record.writeJson(path), ErrorKind::None);
        QVERIFY(QFile::exists(path));
        QVERIFY(record.jsonSizeInBytes() > 0);
    }

    void writeJson_unwritableDestination()
    {
        // A regular file where the parent directory should be
        QString blocker = m_tmpDir.path() + "/blocker";
        QFile f(blocker);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("x");
        f.close();

        BackupRecord record(makeConfig("/tmp/out"), 10, 1);
        QString errorString;
        QCOMPARE(record.writeJson(blocker + "/meta.json", &errorString), ErrorKind::IOError);
        QVERIFY(!errorString.isEmpty());
        QCOMPARE(record.jsonSizeInBytes(), quint64(0));
    }

    void writeJson_replacesExistingFile()
    {
        QString path = m_tmpDir.path() + "/replace/meta.json";
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile stale(path);
        QVERIFY(stale.open(QIODevice::WriteOnly));
        stale.write(QByteArray(4096, ' '));
        stale.close();

        BackupRecord record(makeConfig("/tmp/out"), 10, 1);
        QCOMPARE(record.writeJson(path), ErrorKind::None);
        QCOMPARE(record.jsonSizeInBytes(), quint64(record.toJsonBytes().size()));

        QFile f(path);
        QVERIFY(f.open(QIODevice::ReadOnly));
        QCOMPARE(f.readAll(), record.toJsonBytes());
    }

    void writeJson_pathIsDirectory()
    {
        QString path = m_tmpDir.path() + "/occupied";
        QVERIFY(QDir().mkpath(path));

        BackupRecord record(makeConfig("/tmp/out"), 10, 1);
        QString errorString;
        QCOMPARE(record.writeJson(path, &errorString), ErrorKind::IOError);
        QVERIFY(!errorString.isEmpty());
        QCOMPARE(record.jsonSizeInBytes(), quint64(0));
        QVERIFY(QFileInfo(path).isDir());
    }

    void fromJson_invalidDocument()
    {
        QString errorString;
        QVERIFY(BackupRecord::fromJson("not json", &errorString).isNull());
        QVERIFY(!errorString.isEmpty());

        QVERIFY(BackupRecord::fromJson("[1, 2]", &errorString).isNull());
        QVERIFY(BackupRecord::fromJson(R"({"size_in_bytes": 5})", &errorString).isNull());
    }

    void fromJson_unknownFolder()
    {
        QByteArray json = R"({"timestamp": "2024-05-01T10:00:00.000Z", "size_in_bytes": 5,
                              "folders": ["saves", "shaderpacks"]})";
        QString errorString;
        QVERIFY(BackupRecord::fromJson(json, &errorString).isNull());
        QVERIFY(errorString.contains("shaderpacks"));
    }
};

QTEST_MAIN(TestBackupRecord)
#include "test_backuprecord.moc"
