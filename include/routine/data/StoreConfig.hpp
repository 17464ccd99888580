#pragma once

#include <QString>
#include <QTimeZone>

namespace routine {
namespace data {

struct StoreConfig
{
    QString calendarId = QStringLiteral("primary");
    QTimeZone timeZone = QTimeZone::systemTimeZone();
    QString directory;
};

} // namespace data
} // namespace routine
