#ifndef FOLDER_H
#define FOLDER_H

#include <QString>
#include <QList>

// Subdirectories of a Minecraft installation that can be backed up.
enum class Folder {
    Saves,
    Mods,
    Config,
    Logs,
    Screenshots,
    Backups
};

// Relative path segment under the installation root, e.g. "saves".
QString folderPath(Folder folder);

// Accepts the path segment or the variant name, case-insensitively.
Folder folderFromString(const QString &name, bool *ok = nullptr);

QList<Folder> allFolders();

#endif // FOLDER_H
