#ifndef MINECRAFTUTILS_H
#define MINECRAFTUTILS_H

#include <QString>
#include <QStringList>
#include <QList>
#include "core/folder.h"

struct LauncherProfile {
    QString id;
    QString name;
    QString gameDir;
};

class MinecraftUtils {
public:
    static QString findMinecraftPath();
    static QStringList candidatePaths();

    // Profiles from launcher_profiles.json in a Minecraft directory.
    static QList<LauncherProfile> parseLauncherProfiles(const QString &minecraftPath);
    // Existing, distinct game directories of launcher profiles, excluding
    // the Minecraft directory itself.
    static QStringList launcherGameDirs(const QString &minecraftPath);

    static QList<Folder> presentFolders(const QString &root);
};

#endif // MINECRAFTUTILS_H
