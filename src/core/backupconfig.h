#ifndef BACKUPCONFIG_H
#define BACKUPCONFIG_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QFileInfo>
#include "folder.h"
#include "backuperror.h"

class BackupConfiguration {
public:
    BackupConfiguration() = default;
    BackupConfiguration(const QString &sourceRoot, const QList<Folder> &folders,
                        const QString &destination, bool compress,
                        const QStringList &excludedExtensions = QStringList());

    QString sourceRoot() const { return m_sourceRoot; }
    void setSourceRoot(const QString &path) { m_sourceRoot = path; }

    QList<Folder> folders() const { return m_folders; }
    void setFolders(const QList<Folder> &folders);
    void addFolder(Folder folder);

    QString destination() const { return m_destination; }
    void setDestination(const QString &path) { m_destination = path; }

    bool compress() const { return m_compress; }
    void setCompress(bool compress) { m_compress = compress; }

    // Stored lowercase, without a leading dot.
    QStringList excludedExtensions() const { return m_excludedExtensions; }
    void setExcludedExtensions(const QStringList &extensions);
    void addExcludedExtension(const QString &extension);
    bool isExcluded(const QString &filePath) const;

    QStringList folderPaths() const;

    // Walks the filesystem on every call; missing folders contribute nothing.
    // A directory that exists but cannot be read fails the whole walk: the
    // result is empty and errorString is set.
    QStringList listAllFiles(QString *errorString = nullptr) const;
    quint64 computeTotalSize(QString *errorString = nullptr) const;
    int fileCount(QString *errorString = nullptr) const;
    static quint64 sizeOfFiles(const QStringList &files);

    QString relativePath(const QString &absoluteFilePath) const;

    ErrorKind validate(QString *reason = nullptr) const;

private:
    static bool canListDirectory(const QFileInfo &dirInfo);
    static bool collectFiles(const QFileInfo &dirInfo, const BackupConfiguration &config,
                             QStringList &files, QString *errorString);
    static QString normalizeExtension(const QString &extension);

    QString m_sourceRoot;
    QList<Folder> m_folders;
    QString m_destination;
    bool m_compress = false;
    QStringList m_excludedExtensions;
};

#endif // BACKUPCONFIG_H
