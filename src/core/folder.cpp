#include "folder.h"

QString folderPath(Folder folder)
{
    switch (folder) {
    case Folder::Saves:
        return QStringLiteral("saves");
    case Folder::Mods:
        return QStringLiteral("mods");
    case Folder::Config:
        return QStringLiteral("config");
    case Folder::Logs:
        return QStringLiteral("logs");
    case Folder::Screenshots:
        return QStringLiteral("screenshots");
    case Folder::Backups:
        return QStringLiteral("backups");
    }
    return QString();
}

Folder folderFromString(const QString &name, bool *ok)
{
    const QString key = name.trimmed().toLower();
    for (Folder folder : allFolders()) {
        if (folderPath(folder) == key) {
            if (ok) *ok = true;
            return folder;
        }
    }

    if (ok) *ok = false;
    return Folder::Saves;
}

QList<Folder> allFolders()
{
    return {Folder::Saves, Folder::Mods, Folder::Config,
            Folder::Logs, Folder::Screenshots, Folder::Backups};
}
