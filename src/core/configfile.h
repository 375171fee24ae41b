#ifndef CONFIGFILE_H
#define CONFIGFILE_H

#include <QString>
#include "backupconfig.h"

// YAML backup settings:
//
//   source: ~/.minecraft
//   destination: /backups/minecraft.zip
//   compress: true
//   folders: [saves, mods, config]
//   exclude: [log, tmp]
//   compression_level: 9
//
// Keys that are absent leave the corresponding value untouched.
class ConfigFile {
public:
    static bool load(const QString &path, BackupConfiguration &config,
                     int *compressionLevel = nullptr, QString *errorString = nullptr);
    static bool save(const QString &path, const BackupConfiguration &config,
                     int compressionLevel = 6, QString *errorString = nullptr);

    static QString expandHome(const QString &path);
};

#endif // CONFIGFILE_H
