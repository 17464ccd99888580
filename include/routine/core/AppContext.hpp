#pragma once

#include <memory>

#include "routine/core/EngineSettings.hpp"
#include "routine/data/TaskRegistry.hpp"

namespace routine {
namespace data {
class EventStore;
}

namespace core {

class Clearer;
class DayScheduler;
class RangeScheduler;

class AppContext
{
public:
    AppContext(EngineSettings settings, data::TaskRegistry registry, std::unique_ptr<data::EventStore> store);
    ~AppContext();

    // Loads the task registry and opens the calendar file named by the settings.
    // With dryRun the calendar is read but never written.
    static std::unique_ptr<AppContext> create(const EngineSettings &settings, bool dryRun);

    const data::TaskRegistry &taskRegistry() const;
    DayScheduler &dayScheduler();
    RangeScheduler &rangeScheduler();
    Clearer &clearer();

private:
    EngineSettings m_settings;
    data::TaskRegistry m_registry;
    std::unique_ptr<data::EventStore> m_store;
    std::unique_ptr<DayScheduler> m_dayScheduler;
    std::unique_ptr<RangeScheduler> m_rangeScheduler;
    std::unique_ptr<Clearer> m_clearer;
};

} // namespace core
} // namespace routine
