/**
 * @file evented.cpp
 * @brief Synchronous event dispatch implementation
 */

#include <slippy_map/core/evented.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace slippy_map {

namespace {
    std::vector<std::string> SplitTypes(const std::string& types) {
        std::vector<std::string> result;
        std::istringstream iss(types);
        std::string type;
        while (iss >> type) {
            result.push_back(type);
        }
        return result;
    }
}

ListenerId Evented::On(const std::string& types, EventListener listener, const void* context) {
    if (!listener) {
        throw std::invalid_argument("Cannot register an empty listener");
    }

    const ListenerId id = next_listener_id_++;
    for (const auto& type : SplitTypes(types)) {
        auto registration = std::make_shared<Registration>();
        registration->id = id;
        registration->callback = listener;
        registration->context = context;
        listeners_[type].push_back(std::move(registration));
    }
    return id;
}

void Evented::Off(const std::string& types, ListenerId id) {
    for (const auto& type : SplitTypes(types)) {
        auto it = listeners_.find(type);
        if (it == listeners_.end()) {
            continue;
        }

        auto& registrations = it->second;
        registrations.erase(
            std::remove_if(registrations.begin(), registrations.end(),
                           [id](const RegistrationPtr& registration) {
                               if (registration->id != id) {
                                   return false;
                               }
                               registration->active = false;
                               return true;
                           }),
            registrations.end());

        if (registrations.empty()) {
            listeners_.erase(it);
        }
    }
}

void Evented::Off(const std::string& types) {
    for (const auto& type : SplitTypes(types)) {
        auto it = listeners_.find(type);
        if (it == listeners_.end()) {
            continue;
        }
        for (const auto& registration : it->second) {
            registration->active = false;
        }
        listeners_.erase(it);
    }
}

void Evented::Off() {
    for (const auto& entry : listeners_) {
        for (const auto& registration : entry.second) {
            registration->active = false;
        }
    }
    listeners_.clear();
}

void Evented::OffContext(const void* context) {
    for (auto it = listeners_.begin(); it != listeners_.end();) {
        auto& registrations = it->second;
        registrations.erase(
            std::remove_if(registrations.begin(), registrations.end(),
                           [context](const RegistrationPtr& registration) {
                               if (registration->context != context) {
                                   return false;
                               }
                               registration->active = false;
                               return true;
                           }),
            registrations.end());

        if (registrations.empty()) {
            it = listeners_.erase(it);
        } else {
            ++it;
        }
    }
}

void Evented::Fire(const std::string& type, EventData data) {
    const auto it = listeners_.find(type);
    if (it == listeners_.end()) {
        return;
    }

    // Snapshot so listeners may register or unregister while we iterate
    const std::vector<RegistrationPtr> snapshot = it->second;
    spdlog::trace("Firing '{}' to {} listener(s)", type, snapshot.size());

    Event event;
    event.type = type;
    event.target = this;
    event.data = std::move(data);

    for (const auto& registration : snapshot) {
        if (!registration->active) {
            continue;
        }
        event.context = registration->context;
        registration->callback(event);
    }
}

bool Evented::Listens(const std::string& type) const {
    return GetListenerCount(type) > 0;
}

std::size_t Evented::GetListenerCount(const std::string& type) const {
    const auto it = listeners_.find(type);
    return it == listeners_.end() ? 0 : it->second.size();
}

} // namespace slippy_map
