#include "core/backupconfig.h"
#include "core/backupmanager.h"
#include "core/configfile.h"
#include "minecraft/minecraftutils.h"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QDebug>

static int exitCodeFor(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return 0;
    case ErrorKind::IOError:
        return 1;
    case ErrorKind::SerializationError:
        return 2;
    case ErrorKind::InvalidConfiguration:
        return 3;
    }
    return 1;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("craft-backup");
    app.setOrganizationName("CraftBackup");
    app.setApplicationVersion("0.2.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Back up Minecraft saves, mods and settings.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption sourceOption({"s", "source"}, "Minecraft directory to back up.", "dir");
    QCommandLineOption destinationOption({"d", "destination"},
                                         "Target directory, or zip file with --compress.", "path");
    QCommandLineOption foldersOption({"f", "folders"},
                                     "Comma separated folders: saves, mods, config, logs, "
                                     "screenshots, backups.", "list");
    QCommandLineOption compressOption({"z", "compress"}, "Write a single zip archive.");
    QCommandLineOption excludeOption({"x", "exclude"}, "Skip files with this extension.", "ext");
    QCommandLineOption configOption({"c", "config"}, "Read settings from a YAML file.", "file");
    QCommandLineOption levelOption({"l", "level"}, "Compression level (1-9).", "level");
    QCommandLineOption listOption("list", "Only list the files that would be backed up.");
    QCommandLineOption instancesOption("instances", "Print launcher profile game directories.");

    parser.addOptions({sourceOption, destinationOption, foldersOption, compressOption,
                       excludeOption, configOption, levelOption, listOption, instancesOption});
    parser.process(app);

    QTextStream out(stdout);

    BackupConfiguration config;
    config.setFolders({Folder::Saves});
    int compressionLevel = 6;

    if (parser.isSet(configOption)) {
        QString errorString;
        if (!ConfigFile::load(parser.value(configOption), config, &compressionLevel, &errorString)) {
            qCritical().noquote() << errorString;
            return exitCodeFor(ErrorKind::InvalidConfiguration);
        }
    }

    if (parser.isSet(sourceOption)) {
        config.setSourceRoot(ConfigFile::expandHome(parser.value(sourceOption)));
    }
    if (config.sourceRoot().isEmpty()) {
        config.setSourceRoot(MinecraftUtils::findMinecraftPath());
        if (config.sourceRoot().isEmpty()) {
            qCritical() << "No Minecraft installation found, use --source";
            return exitCodeFor(ErrorKind::InvalidConfiguration);
        }
    }

    if (parser.isSet(instancesOption)) {
        for (const QString &dir : MinecraftUtils::launcherGameDirs(config.sourceRoot())) {
            out << dir << Qt::endl;
        }
        return 0;
    }

    if (parser.isSet(destinationOption)) {
        config.setDestination(ConfigFile::expandHome(parser.value(destinationOption)));
    }
    if (parser.isSet(compressOption)) {
        config.setCompress(true);
    }
    if (parser.isSet(foldersOption)) {
        QList<Folder> folders;
        const QStringList names = parser.value(foldersOption).split(',', Qt::SkipEmptyParts);
        for (const QString &name : names) {
            bool ok = false;
            Folder folder = folderFromString(name, &ok);
            if (!ok) {
                qCritical().noquote() << "Unknown folder:" << name;
                return exitCodeFor(ErrorKind::InvalidConfiguration);
            }
            folders.append(folder);
        }
        config.setFolders(folders);
    }
    for (const QString &ext : parser.values(excludeOption)) {
        config.addExcludedExtension(ext);
    }
    if (parser.isSet(levelOption)) {
        bool ok = false;
        compressionLevel = parser.value(levelOption).toInt(&ok);
        if (!ok || compressionLevel < 1 || compressionLevel > 9) {
            qCritical() << "Compression level must be between 1 and 9";
            return exitCodeFor(ErrorKind::InvalidConfiguration);
        }
    }

    if (parser.isSet(listOption)) {
        QString errorString;
        const QStringList files = config.listAllFiles(&errorString);
        if (!errorString.isEmpty()) {
            qCritical().noquote() << errorString;
            return exitCodeFor(ErrorKind::IOError);
        }
        for (const QString &file : files) {
            out << config.relativePath(file) << Qt::endl;
        }
        out << files.size() << " files, " << BackupConfiguration::sizeOfFiles(files) << " bytes"
            << Qt::endl;
        return 0;
    }

    BackupManager manager;
    manager.setCompressionLevel(compressionLevel);

    QObject::connect(&manager, &BackupManager::operationStarted, [&out](const QString &description) {
        out << description << Qt::endl;
    });
    QObject::connect(&manager, &BackupManager::backupCreated, [&out](const QString &outputPath) {
        out << "Backup written to " << outputPath << Qt::endl;
    });
    QObject::connect(&manager, &BackupManager::error, [](ErrorKind, const QString &message) {
        qCritical().noquote() << message;
    });

    if (!manager.runBackup(config)) {
        return exitCodeFor(manager.lastErrorKind());
    }

    BackupRecord record = manager.lastRecord();
    out << record.fileCount() << " files, " << record.sizeInBytes() << " bytes" << Qt::endl;
    return 0;
}
