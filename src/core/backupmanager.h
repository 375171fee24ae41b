#ifndef BACKUPMANAGER_H
#define BACKUPMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "backupconfig.h"
#include "backuprecord.h"
#include "backuperror.h"

class BackupManager : public QObject {
    Q_OBJECT

public:
    static const char *const MetadataEntryName;

    explicit BackupManager(QObject *parent = nullptr);

    void setCompressionLevel(int level);
    int compressionLevel() const;

    // Zip archive when config.compress() is set, plain copy otherwise.
    bool runBackup(const BackupConfiguration &config);
    bool plainCopy(const BackupConfiguration &config);
    bool zipBackup(const BackupConfiguration &config);

    // Where zipBackup() writes for this record: the destination itself, or a
    // timestamped file inside it when the destination is an existing directory.
    static QString archivePathFor(const BackupRecord &record);

    BackupRecord lastRecord() const { return m_lastRecord; }
    QString lastOutputPath() const { return m_lastOutputPath; }
    QString lastError() const { return m_lastError; }
    ErrorKind lastErrorKind() const { return m_lastErrorKind; }

signals:
    void operationStarted(const QString &description);
    void progress(int done, int total);
    void backupCreated(const QString &outputPath);
    void operationFinished();
    void error(ErrorKind kind, const QString &message);

private:
    bool beginRun(const BackupConfiguration &config);
    bool fail(ErrorKind kind, const QString &message);

    static bool copyFile(const QString &source, const QString &destination, QString *errorString);
    static bool addFileToArchive(struct archive *a, const QString &filePath,
                                 const QString &entryName, QString *errorString);
    static bool addDataToArchive(struct archive *a, const QByteArray &data,
                                 const QString &entryName, const QDateTime &mtime,
                                 QString *errorString);

    int m_compressionLevel = 6;
    BackupRecord m_lastRecord;
    QString m_lastOutputPath;
    QString m_lastError;
    ErrorKind m_lastErrorKind = ErrorKind::None;
};

#endif // BACKUPMANAGER_H
