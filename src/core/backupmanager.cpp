#include "backupmanager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QDateTime>
#include <QDebug>
#include <archive.h>
#include <archive_entry.h>

const char *const BackupManager::MetadataEntryName = "backup_metadata.json";

BackupManager::BackupManager(QObject *parent)
    : QObject(parent)
{
}

void BackupManager::setCompressionLevel(int level)
{
    if (level >= 1 && level <= 9) {
        m_compressionLevel = level;
    }
}

int BackupManager::compressionLevel() const
{
    return m_compressionLevel;
}

bool BackupManager::runBackup(const BackupConfiguration &config)
{
    if (config.compress()) {
        return zipBackup(config);
    }
    return plainCopy(config);
}

bool BackupManager::plainCopy(const BackupConfiguration &config)
{
    if (!beginRun(config)) {
        return false;
    }

    QString enumerationError;
    const QStringList files = config.listAllFiles(&enumerationError);
    if (!enumerationError.isEmpty()) {
        return fail(ErrorKind::IOError, enumerationError);
    }
    const int total = static_cast<int>(files.size());
    m_lastRecord = BackupRecord(config, BackupConfiguration::sizeOfFiles(files), total);

    QString destinationRoot = QDir::cleanPath(QFileInfo(config.destination()).absoluteFilePath());
    if (!QDir().mkpath(destinationRoot)) {
        return fail(ErrorKind::IOError, "Failed to create destination directory: " + destinationRoot);
    }

    emit operationStarted(QString("Copying %1 files...").arg(total));

    int done = 0;
    for (const QString &source : files) {
        QString target = destinationRoot + "/" + config.relativePath(source);
        QString errorString;
        if (!copyFile(source, target, &errorString)) {
            return fail(ErrorKind::IOError, errorString);
        }
        emit progress(++done, total);
    }

    QString metadataError;
    ErrorKind kind = m_lastRecord.writeJson(&metadataError);
    if (kind != ErrorKind::None) {
        return fail(kind, metadataError);
    }

    m_lastOutputPath = destinationRoot;
    qDebug() << "Plain backup finished:" << total << "files," << m_lastRecord.sizeInBytes()
             << "bytes ->" << destinationRoot;

    emit backupCreated(destinationRoot);
    emit operationFinished();
    return true;
}

bool BackupManager::zipBackup(const BackupConfiguration &config)
{
    if (!beginRun(config)) {
        return false;
    }

    QString enumerationError;
    const QStringList files = config.listAllFiles(&enumerationError);
    if (!enumerationError.isEmpty()) {
        return fail(ErrorKind::IOError, enumerationError);
    }
    const int total = static_cast<int>(files.size());
    m_lastRecord = BackupRecord(config, BackupConfiguration::sizeOfFiles(files), total);

    QString archivePath = archivePathFor(m_lastRecord);
    QString parentDir = QFileInfo(archivePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        return fail(ErrorKind::IOError, "Failed to create archive directory: " + parentDir);
    }

    emit operationStarted(QString("Compressing %1 files...").arg(total));

    struct archive *a = archive_write_new();
    archive_write_set_format_zip(a);

    if (archive_write_set_options(a, "zip:compression=deflate") != ARCHIVE_OK) {
        QString message = QString("Failed to select deflate compression: %1")
                              .arg(QString::fromUtf8(archive_error_string(a)));
        archive_write_free(a);
        return fail(ErrorKind::IOError, message);
    }

    QString levelOpts = QString("zip:compression-level=%1").arg(m_compressionLevel);
    if (archive_write_set_options(a, levelOpts.toUtf8().constData()) != ARCHIVE_OK) {
        qWarning() << "Compression level not supported by libarchive, using default:"
                   << archive_error_string(a);
    }

    // The archive only replaces archivePath on commit(); until then any
    // previous archive stays in place.
    QSaveFile archiveFile(archivePath);
    if (!archiveFile.open(QIODevice::WriteOnly)) {
        archive_write_free(a);
        return fail(ErrorKind::IOError, "Failed to open archive for writing: " + archivePath
                                            + ": " + archiveFile.errorString());
    }

    if (archive_write_open_fd(a, archiveFile.handle()) != ARCHIVE_OK) {
        QString message = QString("Failed to open archive for writing: %1")
                              .arg(QString::fromUtf8(archive_error_string(a)));
        archive_write_free(a);
        archiveFile.cancelWriting();
        return fail(ErrorKind::IOError, message);
    }

    auto discard = [&](ErrorKind kind, const QString &message) {
        archive_write_free(a);
        archiveFile.cancelWriting();
        return fail(kind, message);
    };

    int done = 0;
    for (const QString &file : files) {
        QString errorString;
        if (!addFileToArchive(a, file, config.relativePath(file), &errorString)) {
            return discard(ErrorKind::IOError, errorString);
        }
        emit progress(++done, total);
    }

    QByteArray metadata = m_lastRecord.toJsonBytes();
    if (metadata.isEmpty()) {
        return discard(ErrorKind::SerializationError, "Failed to serialize backup metadata");
    }
    m_lastRecord.setJsonSizeInBytes(static_cast<quint64>(metadata.size()));

    QString errorString;
    if (!addDataToArchive(a, metadata, MetadataEntryName, m_lastRecord.timestamp(), &errorString)) {
        return discard(ErrorKind::IOError, errorString);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        QString message = QString("Failed to finish archive: %1")
                              .arg(QString::fromUtf8(archive_error_string(a)));
        return discard(ErrorKind::IOError, message);
    }
    archive_write_free(a);

    if (!archiveFile.commit()) {
        return fail(ErrorKind::IOError, "Failed to move archive into place: " + archivePath
                                            + ": " + archiveFile.errorString());
    }

    m_lastOutputPath = archivePath;
    qDebug() << "Zip backup finished:" << total << "files," << m_lastRecord.sizeInBytes()
             << "bytes ->" << archivePath << "(" << QFileInfo(archivePath).size() << "bytes compressed)";

    emit backupCreated(archivePath);
    emit operationFinished();
    return true;
}

QString BackupManager::archivePathFor(const BackupRecord &record)
{
    QFileInfo destination(record.configuration().destination());
    if (destination.isDir()) {
        QString name = "minecraft-backup-"
                       + record.timestamp().toString("yyyyMMdd'T'HHmmsszzz") + ".zip";
        return QDir::cleanPath(destination.absoluteFilePath() + "/" + name);
    }
    return QDir::cleanPath(destination.absoluteFilePath());
}

bool BackupManager::beginRun(const BackupConfiguration &config)
{
    m_lastRecord = BackupRecord();
    m_lastOutputPath.clear();
    m_lastError.clear();
    m_lastErrorKind = ErrorKind::None;

    QString reason;
    ErrorKind kind = config.validate(&reason);
    if (kind != ErrorKind::None) {
        return fail(kind, reason);
    }
    return true;
}

bool BackupManager::fail(ErrorKind kind, const QString &message)
{
    m_lastErrorKind = kind;
    m_lastError = message;
    qWarning() << "Backup failed:" << message;
    emit error(kind, message);
    emit operationFinished();
    return false;
}

bool BackupManager::copyFile(const QString &source, const QString &destination, QString *errorString)
{
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        *errorString = "Failed to read " + source + ": " + in.errorString();
        return false;
    }

    QString targetDir = QFileInfo(destination).absolutePath();
    if (!QDir().mkpath(targetDir)) {
        *errorString = "Failed to create directory: " + targetDir;
        return false;
    }

    QSaveFile out(destination);
    if (!out.open(QIODevice::WriteOnly)) {
        *errorString = "Failed to write " + destination + ": " + out.errorString();
        return false;
    }

    char buf[8192];
    qint64 bytesRead;
    while ((bytesRead = in.read(buf, sizeof(buf))) > 0) {
        if (out.write(buf, bytesRead) != bytesRead) {
            *errorString = "Failed to write " + destination + ": " + out.errorString();
            out.cancelWriting();
            return false;
        }
    }
    if (bytesRead < 0) {
        *errorString = "Failed to read " + source + ": " + in.errorString();
        out.cancelWriting();
        return false;
    }

    if (!out.commit()) {
        *errorString = "Failed to write " + destination + ": " + out.errorString();
        return false;
    }
    return true;
}

// --- libarchive entries ---

bool BackupManager::addFileToArchive(struct archive *a, const QString &filePath,
                                     const QString &entryName, QString *errorString)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorString = "Failed to read " + filePath + ": " + file.errorString();
        return false;
    }

    QFileInfo fi(filePath);
    struct archive_entry *entry = archive_entry_new();
    archive_entry_set_pathname(entry, entryName.toUtf8().constData());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, fi.isExecutable() ? 0755 : 0644);
    archive_entry_set_size(entry, file.size());
    archive_entry_set_mtime(entry, fi.lastModified().toSecsSinceEpoch(), 0);

    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        *errorString = QString("Failed to add %1 to archive: %2")
                           .arg(entryName, QString::fromUtf8(archive_error_string(a)));
        archive_entry_free(entry);
        return false;
    }
    archive_entry_free(entry);

    char buf[8192];
    qint64 bytesRead;
    while ((bytesRead = file.read(buf, sizeof(buf))) > 0) {
        if (archive_write_data(a, buf, static_cast<size_t>(bytesRead)) < 0) {
            *errorString = QString("Failed to compress %1: %2")
                               .arg(entryName, QString::fromUtf8(archive_error_string(a)));
            return false;
        }
    }
    if (bytesRead < 0) {
        *errorString = "Failed to read " + filePath + ": " + file.errorString();
        return false;
    }
    return true;
}

bool BackupManager::addDataToArchive(struct archive *a, const QByteArray &data,
                                     const QString &entryName, const QDateTime &mtime,
                                     QString *errorString)
{
    struct archive_entry *entry = archive_entry_new();
    archive_entry_set_pathname(entry, entryName.toUtf8().constData());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, data.size());
    archive_entry_set_mtime(entry, mtime.toSecsSinceEpoch(), 0);

    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        *errorString = QString("Failed to add %1 to archive: %2")
                           .arg(entryName, QString::fromUtf8(archive_error_string(a)));
        archive_entry_free(entry);
        return false;
    }
    archive_entry_free(entry);

    if (archive_write_data(a, data.constData(), static_cast<size_t>(data.size())) < 0) {
        *errorString = QString("Failed to compress %1: %2")
                           .arg(entryName, QString::fromUtf8(archive_error_string(a)));
        return false;
    }
    return true;
}
