#ifndef BACKUPRECORD_H
#define BACKUPRECORD_H

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QByteArray>
#include "backupconfig.h"

class BackupRecord {
public:
    BackupRecord() = default;
    BackupRecord(const BackupConfiguration &config, quint64 sizeInBytes, int fileCount);

    bool isNull() const { return !m_timestamp.isValid(); }

    QDateTime timestamp() const { return m_timestamp; }
    quint64 sizeInBytes() const { return m_sizeInBytes; }
    int fileCount() const { return m_fileCount; }
    const BackupConfiguration &configuration() const { return m_config; }

    // Zero until the record has been written or embedded.
    quint64 jsonSizeInBytes() const { return m_jsonSizeInBytes; }
    void setJsonSizeInBytes(quint64 size) { m_jsonSizeInBytes = size; }

    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;
    static BackupRecord fromJson(const QByteArray &data, QString *errorString = nullptr);

    // Sidecar path beside the destination: <destination>_<timestamp>.json
    QString metadataPath() const;

    ErrorKind writeJson(QString *errorString = nullptr);
    ErrorKind writeJson(const QString &path, QString *errorString = nullptr);

private:
    BackupConfiguration m_config;
    QDateTime m_timestamp;
    quint64 m_sizeInBytes = 0;
    int m_fileCount = 0;
    quint64 m_jsonSizeInBytes = 0;
};

#endif // BACKUPRECORD_H
