#include "settings.hpp"

Settings::Settings()
{
    reset();
}

void Settings::reset()
{
    parent_directories = qsettings().value("parent_directories", QStringList()).toStringList();
    log_path = qsettings().value("log_path", "").toString();
    cache_hunks = qsettings().value("cache_hunks", 16).toInt();
    max_parent_depth = qsettings().value("max_parent_depth", 10).toInt();
    verify_hunks = qsettings().value("verify_hunks", false).toBool();
}

void Settings::save()
{
    parent_directories.sort(Qt::CaseInsensitive);
    parent_directories.removeDuplicates();

    qsettings().setValue("parent_directories", parent_directories);
    qsettings().setValue("log_path", log_path);
    qsettings().setValue("cache_hunks", cache_hunks);
    qsettings().setValue("max_parent_depth", max_parent_depth);
    qsettings().setValue("verify_hunks", verify_hunks);
    qsettings().sync();
    reset();
}

void Settings::add_parent_directory(const QString& directory)
{
    parent_directories.append(directory);
}

Settings& Settings::instance()
{
    static Settings settings;
    return settings;
}

QSettings& Settings::qsettings()
{
    static QSettings settings;
    return settings;
}
