#include "minecraftutils.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

QStringList MinecraftUtils::candidatePaths()
{
    QString home = QDir::homePath();
#if defined(Q_OS_WIN)
    QString appData = qEnvironmentVariable("APPDATA");
    if (appData.isEmpty()) {
        appData = home + "/AppData/Roaming";
    }
    return {QDir::fromNativeSeparators(appData) + "/.minecraft"};
#elif defined(Q_OS_MACOS)
    return {home + "/Library/Application Support/minecraft"};
#else
    return {
        home + "/.minecraft",
        home + "/.var/app/com.mojang.Minecraft/.minecraft"
    };
#endif
}

QString MinecraftUtils::findMinecraftPath()
{
    for (const QString &path : candidatePaths()) {
        if (QDir(path).exists()) {
            return path;
        }
    }
    return QString();
}

QList<LauncherProfile> MinecraftUtils::parseLauncherProfiles(const QString &minecraftPath)
{
    QList<LauncherProfile> profiles;

    QFile file(minecraftPath + "/launcher_profiles.json");
    if (!file.exists()) {
        return profiles;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Could not open launcher profiles:" << file.fileName();
        return profiles;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid launcher profiles:" << parseError.errorString();
        return profiles;
    }

    QJsonObject profileMap = doc.object().value("profiles").toObject();
    for (auto it = profileMap.constBegin(); it != profileMap.constEnd(); ++it) {
        QJsonObject obj = it.value().toObject();
        LauncherProfile profile;
        profile.id = it.key();
        profile.name = obj.value("name").toString();
        profile.gameDir = obj.value("gameDir").toString();
        profiles.append(profile);
    }

    return profiles;
}

QStringList MinecraftUtils::launcherGameDirs(const QString &minecraftPath)
{
    QStringList dirs;
    QSet<QString> canonicalPaths;
    canonicalPaths.insert(QFileInfo(minecraftPath).canonicalFilePath());

    for (const LauncherProfile &profile : parseLauncherProfiles(minecraftPath)) {
        if (profile.gameDir.isEmpty()) {
            continue;
        }
        // Relative game directories are resolved against the Minecraft directory
        QString path = QDir(minecraftPath).absoluteFilePath(profile.gameDir);
        QString canonical = QFileInfo(path).canonicalFilePath();
        if (!canonical.isEmpty() && !canonicalPaths.contains(canonical)) {
            canonicalPaths.insert(canonical);
            dirs << path;
        }
    }

    return dirs;
}

QList<Folder> MinecraftUtils::presentFolders(const QString &root)
{
    QList<Folder> present;
    QDir dir(root);
    for (Folder folder : allFolders()) {
        if (QFileInfo(dir.absoluteFilePath(folderPath(folder))).isDir()) {
            present.append(folder);
        }
    }
    return present;
}
