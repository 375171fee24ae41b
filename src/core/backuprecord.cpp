#include "backuprecord.h"
#include <QDir>
#include <QSaveFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

BackupRecord::BackupRecord(const BackupConfiguration &config, quint64 sizeInBytes, int fileCount)
    : m_config(config)
    , m_timestamp(QDateTime::currentDateTimeUtc())
    , m_sizeInBytes(sizeInBytes)
    , m_fileCount(fileCount)
{
}

QJsonObject BackupRecord::toJson() const
{
    QJsonArray folders;
    for (Folder folder : m_config.folders()) {
        folders.append(folderPath(folder));
    }

    QJsonObject obj;
    obj["timestamp"] = m_timestamp.toString(Qt::ISODateWithMs);
    obj["size_in_bytes"] = static_cast<qint64>(m_sizeInBytes);
    obj["file_count"] = m_fileCount;
    obj["folders"] = folders;
    obj["compress"] = m_config.compress();
    obj["excluded_extensions"] = QJsonArray::fromStringList(m_config.excludedExtensions());
    obj["source_root"] = m_config.sourceRoot();
    obj["destination"] = m_config.destination();
    return obj;
}

QByteArray BackupRecord::toJsonBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

BackupRecord BackupRecord::fromJson(const QByteArray &data, QString *errorString)
{
    auto fail = [errorString](const QString &message) {
        if (errorString) *errorString = message;
        return BackupRecord();
    };

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail("Invalid backup metadata: " + parseError.errorString());
    }
    if (!doc.isObject()) {
        return fail("Backup metadata is not a JSON object");
    }

    QJsonObject obj = doc.object();
    QDateTime timestamp = QDateTime::fromString(obj["timestamp"].toString(), Qt::ISODateWithMs);
    if (!timestamp.isValid()) {
        return fail("Backup metadata has no valid timestamp");
    }

    QList<Folder> folders;
    const QJsonArray folderArray = obj["folders"].toArray();
    for (const QJsonValue &value : folderArray) {
        bool ok = false;
        Folder folder = folderFromString(value.toString(), &ok);
        if (!ok) {
            return fail("Unknown folder in backup metadata: " + value.toString());
        }
        folders.append(folder);
    }

    QStringList excluded;
    const QJsonArray excludedArray = obj["excluded_extensions"].toArray();
    for (const QJsonValue &value : excludedArray) {
        excluded << value.toString();
    }

    BackupConfiguration config(obj["source_root"].toString(), folders,
                               obj["destination"].toString(), obj["compress"].toBool(),
                               excluded);

    BackupRecord record;
    record.m_config = config;
    record.m_timestamp = timestamp;
    record.m_sizeInBytes = static_cast<quint64>(obj["size_in_bytes"].toInteger());
    record.m_fileCount = obj["file_count"].toInt();
    record.m_jsonSizeInBytes = static_cast<quint64>(data.size());

    if (errorString) errorString->clear();
    return record;
}

QString BackupRecord::metadataPath() const
{
    QString destination = QDir::cleanPath(QFileInfo(m_config.destination()).absoluteFilePath());
    return destination + "_" + m_timestamp.toString("yyyyMMdd'T'HHmmsszzz") + ".json";
}

ErrorKind BackupRecord::writeJson(QString *errorString)
{
    return writeJson(metadataPath(), errorString);
}

ErrorKind BackupRecord::writeJson(const QString &path, QString *errorString)
{
    QByteArray json = toJsonBytes();
    if (json.isEmpty()) {
        if (errorString) *errorString = "Failed to serialize backup metadata";
        return ErrorKind::SerializationError;
    }

    QString parentDir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        if (errorString) *errorString = "Failed to create metadata directory: " + parentDir;
        return ErrorKind::IOError;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) *errorString = "Failed to open metadata file " + path + ": " + file.errorString();
        return ErrorKind::IOError;
    }

    if (file.write(json) != json.size()) {
        if (errorString) *errorString = "Failed to write metadata file " + path + ": " + file.errorString();
        file.cancelWriting();
        return ErrorKind::IOError;
    }
    if (!file.commit()) {
        if (errorString) *errorString = "Failed to write metadata file " + path + ": " + file.errorString();
        return ErrorKind::IOError;
    }

    m_jsonSizeInBytes = static_cast<quint64>(QFileInfo(path).size());
    qDebug() << "Backup metadata written:" << path << "(" << m_jsonSizeInBytes << "bytes)";

    if (errorString) errorString->clear();
    return ErrorKind::None;
}
