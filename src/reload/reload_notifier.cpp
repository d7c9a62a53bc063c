#include "csync/reload/reload_notifier.hpp"
#include "csync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace csync::reload {

std::vector<ReloadService> default_reload_services() {
    return {
        {"core configuration", "homeassistant/reload_core_config"},
        {"automations", "automation/reload"},
        {"scripts", "script/reload"},
        {"scenes", "scene/reload"},
    };
}

bool ReloadReport::ok() const noexcept {
    if (aborted || outcomes.size() != requested) {
        return false;
    }
    return std::all_of(outcomes.begin(), outcomes.end(),
                       [](const ServiceOutcome& outcome) { return outcome.success; });
}

Result<ReloadNotifier> ReloadNotifier::create(ReloadSettings settings,
                                              network::HttpTransport& transport,
                                              events::EventBus* bus) {
    if (settings.token.empty()) {
        return Err<ReloadNotifier>(config_error("HA_TOKEN is not set; add it to the environment or the .env file"));
    }
    auto endpoint = network::parse_url(settings.base_url);
    if (endpoint.is_error()) {
        return Err<ReloadNotifier>(endpoint.error());
    }
    for (const auto& service : settings.services) {
        if (service.service.empty() || service.service.front() == '/') {
            return Err<ReloadNotifier>(config_error("invalid reload service '" + service.service + "'"));
        }
    }
    return Ok(ReloadNotifier(std::move(settings), std::move(endpoint.value()), transport, bus));
}

ReloadReport ReloadNotifier::notify() {
    ReloadReport report;
    report.requested = settings_.services.size();

    for (const auto& service : settings_.services) {
        spdlog::info("Reloading {}...", service.name);
        bool unreachable = false;
        ServiceOutcome outcome = call(service, unreachable);

        if (bus_ != nullptr) {
            bus_->emit(events::ServiceReloadedEvent{
                service.name, service.service, outcome.success, outcome.status, outcome.detail});
        }

        report.outcomes.push_back(std::move(outcome));

        if (unreachable) {
            const std::size_t skipped = report.requested - report.outcomes.size();
            if (skipped > 0) {
                spdlog::warn("Endpoint {} unreachable, skipping {} remaining service(s)",
                             settings_.base_url, skipped);
            }
            report.aborted = skipped > 0;
            break;
        }
    }
    return report;
}

ServiceOutcome ReloadNotifier::call(const ReloadService& service, bool& unreachable) {
    ServiceOutcome outcome;
    outcome.service = service;

    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.target = endpoint_.base_path + "/api/services/" + service.service;
    request.set_header("Authorization", "Bearer " + settings_.token);
    request.set_header("Content-Type", "application/json");

    auto response = transport_->send(endpoint_, request, settings_.timeout);
    if (response.is_error()) {
        const auto& error = response.error();
        outcome.detail = error.describe();
        unreachable = error.code == ErrorCode::Timeout || error.code == ErrorCode::Connection;
        if (error.code == ErrorCode::Timeout) {
            spdlog::warn("Timeout: {} took too long to respond to {}", endpoint_.authority(), service.service);
        } else if (unreachable) {
            spdlog::warn("Cannot reach {} for {}: {}", endpoint_.authority(), service.service, error.message);
        } else {
            spdlog::warn("Failed to reload {}: {}", service.name, error.message);
        }
        return outcome;
    }

    outcome.status = response.value().status_code;
    outcome.success = outcome.status == 200;
    if (outcome.success) {
        spdlog::info("{} reloaded", service.name);
    } else {
        outcome.detail = response.value().body_as_string();
        spdlog::warn("Failed to reload {}: HTTP {}", service.name, outcome.status);
        if (!outcome.detail.empty()) {
            spdlog::warn("  Response: {}", outcome.detail);
        }
    }
    return outcome;
}

} // namespace csync::reload
