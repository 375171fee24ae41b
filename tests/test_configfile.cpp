#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include <QTextStream>
#include "core/configfile.h"

class TestConfigFile : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_tmpDir;

    QString writeFile(const QString &name, const QString &content)
    {
        QString path = m_tmpDir.path() + "/" + name;
        QFile f(path);
        if (!f.open(QIODevice::WriteOnly | QIODevice::Text))
            qFatal("Failed to open %s for writing", qPrintable(path));
        QTextStream out(&f);
        out << content;
        return path;
    }

private slots:
    void load_allKeys()
    {
        QString path = writeFile("full.yaml",
            "source: /games/minecraft\n"
            "destination: /backups/mc.zip\n"
            "compress: true\n"
            "folders: [saves, Mods, config]\n"
            "exclude: [.log, TMP]\n"
            "compression_level: 9\n");

        BackupConfiguration config;
        int level = 6;
        QString errorString;
        QVERIFY2(ConfigFile::load(path, config, &level, &errorString), qPrintable(errorString));

        QCOMPARE(config.sourceRoot(), QString("/games/minecraft"));
        QCOMPARE(config.destination(), QString("/backups/mc.zip"));
        QCOMPARE(config.compress(), true);
        QCOMPARE(config.folders(), QList<Folder>({Folder::Saves, Folder::Mods, Folder::Config}));
        QCOMPARE(config.excludedExtensions(), QStringList({"log", "tmp"}));
        QCOMPARE(level, 9);
    }

    void load_missingKeysKeepValues()
    {
        QString path = writeFile("partial.yaml", "destination: /backups/plain\n");

        BackupConfiguration config("/existing", {Folder::Logs}, "/old", true, {"bak"});
        QVERIFY(ConfigFile::load(path, config));

        QCOMPARE(config.sourceRoot(), QString("/existing"));
        QCOMPARE(config.destination(), QString("/backups/plain"));
        QCOMPARE(config.folders(), QList<Folder>({Folder::Logs}));
        QCOMPARE(config.compress(), true);
        QCOMPARE(config.excludedExtensions(), QStringList({"bak"}));
    }

    void load_expandsHome()
    {
        QString path = writeFile("home.yaml", "source: ~/.minecraft\n");
        BackupConfiguration config;
        QVERIFY(ConfigFile::load(path, config));
        QCOMPARE(config.sourceRoot(), QDir::homePath() + "/.minecraft");
    }

    void load_unknownFolder()
    {
        QString path = writeFile("unknown.yaml", "folders: [saves, shaderpacks]\n");
        BackupConfiguration config("/keep", {Folder::Saves}, "/dst", false);
        QString errorString;
        QVERIFY(!ConfigFile::load(path, config, nullptr, &errorString));
        QVERIFY(errorString.contains("shaderpacks"));
        // Untouched on failure
        QCOMPARE(config.sourceRoot(), QString("/keep"));
    }

    void load_foldersNotAList()
    {
        QString path = writeFile("scalar.yaml", "folders: saves\n");
        BackupConfiguration config;
        QString errorString;
        QVERIFY(!ConfigFile::load(path, config, nullptr, &errorString));
        QVERIFY(!errorString.isEmpty());
    }

    void load_invalidLevel()
    {
        QString path = writeFile("level.yaml", "compression_level: 12\n");
        BackupConfiguration config;
        int level = 6;
        QVERIFY(!ConfigFile::load(path, config, &level));
        QCOMPARE(level, 6);
    }

    void load_syntaxError()
    {
        QString path = writeFile("broken.yaml", "folders: [saves, mods\n");
        BackupConfiguration config;
        QString errorString;
        QVERIFY(!ConfigFile::load(path, config, nullptr, &errorString));
        QVERIFY(!errorString.isEmpty());
    }

    void load_missingFile()
    {
        BackupConfiguration config;
        QString errorString;
        QVERIFY(!ConfigFile::load(m_tmpDir.path() + "/nope.yaml", config, nullptr, &errorString));
        QVERIFY(!errorString.isEmpty());
    }

    void saveThenLoad()
    {
        BackupConfiguration original("/games/mc", {Folder::Screenshots, Folder::Saves},
                                     "/backups/out.zip", true, {"log"});
        QString path = m_tmpDir.path() + "/saved.yaml";
        QString errorString;
        QVERIFY2(ConfigFile::save(path, original, 3, &errorString), qPrintable(errorString));

        BackupConfiguration loaded;
        int level = 6;
        QVERIFY(ConfigFile::load(path, loaded, &level));
        QCOMPARE(loaded.sourceRoot(), original.sourceRoot());
        QCOMPARE(loaded.destination(), original.destination());
        QCOMPARE(loaded.folders(), original.folders());
        QCOMPARE(loaded.excludedExtensions(), original.excludedExtensions());
        QCOMPARE(loaded.compress(), true);
        QCOMPARE(level, 3);
    }

    void expandHome_onlyLeadingTilde()
    {
        QCOMPARE(ConfigFile::expandHome("~"), QDir::homePath());
        QCOMPARE(ConfigFile::expandHome("/data/~backup"), QString("/data/~backup"));
        QCOMPARE(ConfigFile::expandHome("~user/x"), QString("~user/x"));
    }
};

QTEST_MAIN(TestConfigFile)
#include "test_configfile.moc"
