#pragma once

#include <QDir>
#include <QSettings>
#include <QString>

#include "routine/core/SlotSearch.hpp"
#include "routine/data/StoreConfig.hpp"

namespace routine {
namespace core {

struct EngineSettings
{
    data::StoreConfig store;
    QString tasksFile;
    SlotSearchOptions slotSearch;
    bool allowReschedule = true;
    int defaultDays = 7;

    // Reads an INI file. A missing file yields the defaults; invalid values throw
    // ConfigurationError. Relative paths resolve against the file's directory.
    static EngineSettings load(const QString &iniPath);
    static EngineSettings fromSettings(QSettings &settings, const QDir &baseDir);
};

} // namespace core
} // namespace routine
