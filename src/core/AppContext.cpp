#include "planner/core/AppContext.hpp"

#include <QNetworkAccessManager>

#include "planner/cache/EventCache.hpp"
#include "planner/core/CalendarOrchestrator.hpp"
#include "planner/core/Clock.hpp"
#include "planner/core/Preloader.hpp"
#include "planner/data/FilePersistentStore.hpp"
#include "planner/net/AccessTokenProvider.hpp"
#include "planner/net/GoogleCalendarClient.hpp"

namespace planner {
namespace core {

AppContext::AppContext(PlannerSettings settings, std::unique_ptr<net::AccessTokenProvider> tokens)
    : m_settings(std::move(settings))
    , m_tokens(std::move(tokens))
    , m_clock(std::make_unique<SystemClock>())
    , m_network(std::make_unique<QNetworkAccessManager>())
    , m_store(std::make_unique<data::FilePersistentStore>(m_settings.cacheDirectory))
{
    m_cache = std::make_unique<cache::EventCache>(*m_clock, *m_store, m_settings.cacheOptions());
    m_client = std::make_unique<net::GoogleCalendarClient>(*m_network,
                                                          *m_tokens,
                                                          m_settings.apiBaseUrl,
                                                          m_settings.requestTimeoutMs);
    m_preloader = std::make_unique<Preloader>(*m_client, *m_tokens, *m_cache);
    m_orchestrator = std::make_unique<CalendarOrchestrator>(*m_client, *m_tokens, *m_cache, m_preloader.get());
}

AppContext::~AppContext() = default;

const PlannerSettings &AppContext::settings() const
{
    return m_settings;
}

const net::AccessTokenProvider &AppContext::tokenProvider() const
{
    return *m_tokens;
}

Clock &AppContext::clock()
{
    return *m_clock;
}

data::PersistentStore &AppContext::persistentStore()
{
    return *m_store;
}

cache::EventCache &AppContext::eventCache()
{
    return *m_cache;
}

net::GoogleCalendarClient &AppContext::calendarClient()
{
    return *m_client;
}

Preloader &AppContext::preloader()
{
    return *m_preloader;
}

CalendarOrchestrator &AppContext::orchestrator()
{
    return *m_orchestrator;
}

} // namespace core
} // namespace planner
