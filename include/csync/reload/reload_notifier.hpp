#pragma once

#include "csync/core/result.hpp"
#include "csync/events/event_bus.hpp"
#include "csync/network/http_client.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace csync::reload {

/**
 * @brief A named reload service, e.g. {"automations", "automation/reload"}
 */
struct ReloadService {
    std::string name;
    std::string service;  ///< "domain/service", posted to /api/services/{service}
};

/// core configuration, automations, scripts, scenes (in that order).
std::vector<ReloadService> default_reload_services();

struct ReloadSettings {
    std::string base_url;
    std::string token;
    std::chrono::seconds timeout{30};
    std::vector<ReloadService> services = default_reload_services();
};

struct ServiceOutcome {
    ReloadService service;
    bool success = false;
    int status = 0;          ///< HTTP status, 0 when no response arrived
    std::string detail;      ///< response body or transport error
};

/**
 * @brief Per-service results of one notify() call
 *
 * Services after a timeout or connection failure are not attempted and do
 * not appear in outcomes; aborted is set instead.
 */
struct ReloadReport {
    std::vector<ServiceOutcome> outcomes;
    std::size_t requested = 0;
    bool aborted = false;

    [[nodiscard]] bool ok() const noexcept;
};

/**
 * @brief Asks the live instance to reload its configuration
 *
 * POSTs {base_url}/api/services/{service} with a bearer token for each
 * configured service, in order. Only status 200 counts as success. Failures
 * are reported, never retried and never raised.
 */
class ReloadNotifier {
public:
    /**
     * @brief Validate settings and bind a transport
     * @return Config error for a missing token or an unsupported URL
     */
    static Result<ReloadNotifier> create(ReloadSettings settings,
                                         network::HttpTransport& transport,
                                         events::EventBus* bus = nullptr);

    ReloadReport notify();

    const ReloadSettings& settings() const { return settings_; }

private:
    ReloadNotifier(ReloadSettings settings, network::Url endpoint,
                   network::HttpTransport& transport, events::EventBus* bus)
        : settings_(std::move(settings)), endpoint_(std::move(endpoint)),
          transport_(&transport), bus_(bus) {}

    ServiceOutcome call(const ReloadService& service, bool& unreachable);

    ReloadSettings settings_;
    network::Url endpoint_;
    network::HttpTransport* transport_;
    events::EventBus* bus_;
};

} // namespace csync::reload
