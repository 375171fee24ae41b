#include "backupconfig.h"
#include <QDir>
#include <QFileInfo>
#include <QDebug>

BackupConfiguration::BackupConfiguration(const QString &sourceRoot, const QList<Folder> &folders,
                                         const QString &destination, bool compress,
                                         const QStringList &excludedExtensions)
    : m_sourceRoot(sourceRoot)
    , m_destination(destination)
    , m_compress(compress)
{
    setFolders(folders);
    setExcludedExtensions(excludedExtensions);
}

void BackupConfiguration::setFolders(const QList<Folder> &folders)
{
    m_folders.clear();
    for (Folder folder : folders) {
        addFolder(folder);
    }
}

void BackupConfiguration::addFolder(Folder folder)
{
    if (!m_folders.contains(folder)) {
        m_folders.append(folder);
    }
}

void BackupConfiguration::setExcludedExtensions(const QStringList &extensions)
{
    m_excludedExtensions.clear();
    for (const QString &ext : extensions) {
        addExcludedExtension(ext);
    }
}

void BackupConfiguration::addExcludedExtension(const QString &extension)
{
    QString ext = normalizeExtension(extension);
    if (!ext.isEmpty() && !m_excludedExtensions.contains(ext)) {
        m_excludedExtensions.append(ext);
    }
}

bool BackupConfiguration::isExcluded(const QString &filePath) const
{
    if (m_excludedExtensions.isEmpty()) {
        return false;
    }
    QString suffix = QFileInfo(filePath).suffix().toLower();
    return !suffix.isEmpty() && m_excludedExtensions.contains(suffix);
}

QStringList BackupConfiguration::folderPaths() const
{
    QStringList paths;
    QDir root(m_sourceRoot);
    for (Folder folder : m_folders) {
        paths << QDir::cleanPath(root.absoluteFilePath(folderPath(folder)));
    }
    return paths;
}

QStringList BackupConfiguration::listAllFiles(QString *errorString) const
{
    if (errorString) errorString->clear();

    QStringList files;
    for (const QString &path : folderPaths()) {
        QFileInfo info(path);
        if (!info.isDir()) {
            continue;
        }
        QString error;
        if (!collectFiles(info, *this, files, &error)) {
            qWarning() << "Enumeration failed:" << error;
            if (errorString) *errorString = error;
            return QStringList();
        }
    }
    return files;
}

quint64 BackupConfiguration::computeTotalSize(QString *errorString) const
{
    return sizeOfFiles(listAllFiles(errorString));
}

quint64 BackupConfiguration::sizeOfFiles(const QStringList &files)
{
    quint64 total = 0;
    for (const QString &file : files) {
        QFileInfo info(file);
        if (info.exists()) {
            total += static_cast<quint64>(info.size());
        }
    }
    return total;
}

int BackupConfiguration::fileCount(QString *errorString) const
{
    return static_cast<int>(listAllFiles(errorString).size());
}

QString BackupConfiguration::relativePath(const QString &absoluteFilePath) const
{
    return QDir(m_sourceRoot).relativeFilePath(absoluteFilePath);
}

ErrorKind BackupConfiguration::validate(QString *reason) const
{
    auto fail = [reason](const QString &message) {
        if (reason) *reason = message;
        return ErrorKind::InvalidConfiguration;
    };

    if (m_sourceRoot.isEmpty()) {
        return fail("No source directory configured");
    }
    if (m_destination.isEmpty()) {
        return fail("No destination configured");
    }
    if (m_folders.isEmpty()) {
        return fail("No folders selected for backup");
    }

    QString source = QDir::cleanPath(QFileInfo(m_sourceRoot).absoluteFilePath());
    QString destination = QDir::cleanPath(QFileInfo(m_destination).absoluteFilePath());
    if (source == destination) {
        return fail("Destination is the same as the source directory: " + source);
    }

    if (reason) reason->clear();
    return ErrorKind::None;
}

bool BackupConfiguration::canListDirectory(const QFileInfo &dirInfo)
{
#ifdef Q_OS_UNIX
    return dirInfo.isReadable() && dirInfo.isExecutable();
#else
    return dirInfo.isReadable();
#endif
}

bool BackupConfiguration::collectFiles(const QFileInfo &dirInfo, const BackupConfiguration &config,
                                       QStringList &files, QString *errorString)
{
    // entryInfoList() silently returns nothing for a directory it cannot open
    if (!canListDirectory(dirInfo)) {
        *errorString = "Cannot read directory: " + dirInfo.absoluteFilePath();
        return false;
    }

    QDir dir(dirInfo.absoluteFilePath());
    QFileInfoList entries = dir.entryInfoList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden,
                                              QDir::DirsFirst);

    for (const QFileInfo &fi : entries) {
        if (fi.isDir()) {
            if (fi.isSymLink()) {
                qDebug() << "Not following symlinked directory:" << fi.absoluteFilePath();
                continue;
            }
            if (!collectFiles(fi, config, files, errorString)) {
                return false;
            }
        } else if (fi.isFile()) {
            if (config.isExcluded(fi.fileName())) {
                continue;
            }
            files << fi.absoluteFilePath();
        }
    }
    return true;
}

QString BackupConfiguration::normalizeExtension(const QString &extension)
{
    QString ext = extension.trimmed().toLower();
    while (ext.startsWith('.')) {
        ext.remove(0, 1);
    }
    return ext;
}
