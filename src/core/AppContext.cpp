#include "routine/core/AppContext.hpp"

#include "routine/Logging.hpp"
#include "routine/core/Clearer.hpp"
#include "routine/core/DayScheduler.hpp"
#include "routine/core/RangeScheduler.hpp"
#include "routine/data/FileEventStore.hpp"
#include "routine/data/DryRunEventStore.hpp"

namespace routine {
namespace core {

AppContext::AppContext(EngineSettings settings, data::TaskRegistry registry, std::unique_ptr<data::EventStore> store)
    : m_settings(std::move(settings))
    , m_registry(std::move(registry))
    , m_store(std::move(store))
    , m_dayScheduler(std::make_unique<DayScheduler>(*m_store, m_registry, m_settings.slotSearch))
    , m_rangeScheduler(std::make_unique<RangeScheduler>(*m_dayScheduler))
    , m_clearer(std::make_unique<Clearer>(*m_store, m_registry))
{
}

AppContext::~AppContext() = default;

std::unique_ptr<AppContext> AppContext::create(const EngineSettings &settings, bool dryRun)
{
    data::TaskRegistry registry = data::TaskRegistry::fromFile(settings.tasksFile);

    auto fileStore = std::make_unique<data::FileEventStore>(settings.store);
    if (!dryRun) {
        return std::make_unique<AppContext>(settings, std::move(registry), std::move(fileStore));
    }

    qCInfo(lcScheduler) << "Dry run, calendar" << fileStore->filePath() << "stays unchanged";
    auto dryRunStore = std::make_unique<data::DryRunEventStore>(std::move(fileStore));
    return std::make_unique<AppContext>(settings, std::move(registry), std::move(dryRunStore));
}

const data::TaskRegistry &AppContext::taskRegistry() const
{
    return m_registry;
}

DayScheduler &AppContext::dayScheduler()
{
    return *m_dayScheduler;
}

RangeScheduler &AppContext::rangeScheduler()
{
    return *m_rangeScheduler;
}

Clearer &AppContext::clearer()
{
    return *m_clearer;
}

} // namespace core
} // namespace routine
