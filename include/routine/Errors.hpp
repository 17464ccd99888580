#pragma once

#include <stdexcept>
#include <string>

#include <QString>

namespace routine {

class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

class StoreUnavailable : public std::runtime_error
{
public:
    explicit StoreUnavailable(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

} // namespace routine
