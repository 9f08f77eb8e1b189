#pragma once

#include <memory>

#include "planner/core/PlannerSettings.hpp"

class QNetworkAccessManager;

namespace planner {
namespace cache {
class EventCache;
}
namespace data {
class PersistentStore;
}
namespace net {
class AccessTokenProvider;
class GoogleCalendarClient;
}

namespace core {

class CalendarOrchestrator;
class Clock;
class Preloader;

class AppContext
{
public:
    AppContext(PlannerSettings settings, std::unique_ptr<net::AccessTokenProvider> tokens);
    ~AppContext();

    const PlannerSettings &settings() const;
    const net::AccessTokenProvider &tokenProvider() const;
    Clock &clock();
    data::PersistentStore &persistentStore();
    cache::EventCache &eventCache();
    net::GoogleCalendarClient &calendarClient();
    Preloader &preloader();
    CalendarOrchestrator &orchestrator();

private:
    PlannerSettings m_settings;
    std::unique_ptr<net::AccessTokenProvider> m_tokens;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<QNetworkAccessManager> m_network;
    std::unique_ptr<data::PersistentStore> m_store;
    std::unique_ptr<cache::EventCache> m_cache;
    std::unique_ptr<net::GoogleCalendarClient> m_client;
    std::unique_ptr<Preloader> m_preloader;
    std::unique_ptr<CalendarOrchestrator> m_orchestrator;
};

} // namespace core
} // namespace planner
