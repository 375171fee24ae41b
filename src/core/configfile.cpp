#include "configfile.h"
#include <QDir>
#include <QSaveFile>
#include <QDebug>
#include <yaml-cpp/yaml.h>

bool ConfigFile::load(const QString &path, BackupConfiguration &config,
                      int *compressionLevel, QString *errorString)
{
    auto fail = [errorString](const QString &message) {
        if (errorString) *errorString = message;
        return false;
    };

    BackupConfiguration loaded = config;
    try {
        YAML::Node root = YAML::LoadFile(path.toStdString());
        if (!root.IsMap()) {
            return fail("Configuration file is not a YAML mapping: " + path);
        }

        if (root["source"]) {
            loaded.setSourceRoot(expandHome(QString::fromStdString(root["source"].as<std::string>())));
        }
        if (root["destination"]) {
            loaded.setDestination(expandHome(QString::fromStdString(root["destination"].as<std::string>())));
        }
        if (root["compress"]) {
            loaded.setCompress(root["compress"].as<bool>());
        }

        if (root["folders"]) {
            if (!root["folders"].IsSequence()) {
                return fail("'folders' must be a list");
            }
            QList<Folder> folders;
            for (const auto &node : root["folders"]) {
                QString name = QString::fromStdString(node.as<std::string>());
                bool ok = false;
                Folder folder = folderFromString(name, &ok);
                if (!ok) {
                    return fail("Unknown folder '" + name + "' in " + path);
                }
                folders.append(folder);
            }
            loaded.setFolders(folders);
        }

        if (root["exclude"]) {
            if (!root["exclude"].IsSequence()) {
                return fail("'exclude' must be a list");
            }
            QStringList extensions;
            for (const auto &node : root["exclude"]) {
                extensions << QString::fromStdString(node.as<std::string>());
            }
            loaded.setExcludedExtensions(extensions);
        }

        if (root["compression_level"] && compressionLevel) {
            int level = root["compression_level"].as<int>();
            if (level < 1 || level > 9) {
                return fail(QString("compression_level must be between 1 and 9, got %1").arg(level));
            }
            *compressionLevel = level;
        }
    } catch (const YAML::Exception &e) {
        return fail(QString("Failed to parse %1: %2").arg(path, QString::fromStdString(e.what())));
    }

    config = loaded;
    qDebug() << "Loaded backup configuration from" << path;
    return true;
}

bool ConfigFile::save(const QString &path, const BackupConfiguration &config,
                      int compressionLevel, QString *errorString)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "source" << YAML::Value << config.sourceRoot().toStdString();
    out << YAML::Key << "destination" << YAML::Value << config.destination().toStdString();
    out << YAML::Key << "compress" << YAML::Value << config.compress();

    out << YAML::Key << "folders" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (Folder folder : config.folders()) {
        out << folderPath(folder).toStdString();
    }
    out << YAML::EndSeq;

    out << YAML::Key << "exclude" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const QString &ext : config.excludedExtensions()) {
        out << ext.toStdString();
    }
    out << YAML::EndSeq;

    out << YAML::Key << "compression_level" << YAML::Value << compressionLevel;
    out << YAML::EndMap;

    if (!out.good()) {
        if (errorString) *errorString = QString::fromStdString(out.GetLastError());
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorString) *errorString = "Could not write configuration file " + path + ": " + file.errorString();
        return false;
    }
    file.write(out.c_str());
    file.write("\n");
    if (!file.commit()) {
        if (errorString) *errorString = "Could not write configuration file " + path + ": " + file.errorString();
        return false;
    }
    return true;
}

QString ConfigFile::expandHome(const QString &path)
{
    if (path == "~") {
        return QDir::homePath();
    }
    if (path.startsWith("~/")) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}
