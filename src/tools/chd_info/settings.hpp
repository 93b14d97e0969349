#ifndef SETTINGS_H
#define SETTINGS_H

#include <QSettings>
#include <QString>
#include <QStringList>

class Settings final
{
    public:
        static Settings& instance();
        static QSettings& qsettings();

        // you won't be needing these
        // use instance() instead
        Settings(const Settings&) = delete;
        Settings& operator=(const Settings&) = delete;
        Settings(Settings&&) = delete;
        Settings& operator=(Settings&&) = delete;

        QStringList parent_directories;
        QString log_path;

        int cache_hunks;
        int max_parent_depth;
        bool verify_hunks;

        void save();
        void reset();
        void add_parent_directory(const QString& directory);
    private:
        Settings();
};
#endif
