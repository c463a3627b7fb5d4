#pragma once

/**
 * @file evented.h
 * @brief Synchronous publish/subscribe base class
 *
 * Evented decouples view changes from their dependents: the map fires
 * named events and layers subscribe to them without the map knowing which
 * layer types exist.
 */

#include <slippy_map/coordinates/lat_lng.h>
#include <slippy_map/math/point.h>
#include <slippy_map/math/tile_grid.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace slippy_map {

class Evented;

/**
 * @brief Value carried in an event payload
 */
using EventValue = std::variant<bool, std::int64_t, double, std::string, Point, LatLng, TileDescriptor>;

/**
 * @brief Event payload keyed by field name
 */
using EventData = std::unordered_map<std::string, EventValue>;

/**
 * @brief Event delivered to listeners
 *
 * type and target are filled in by Fire(); context is the context the
 * receiving listener was registered with.
 */
struct Event {
    std::string type;              ///< Event type name
    Evented* target = nullptr;     ///< Emitter
    const void* context = nullptr; ///< Registration context of the listener
    EventData data;                ///< Caller-supplied payload

    /**
     * @brief Typed access to a payload field
     *
     * @return const T* Field value, or nullptr if absent or of another type
     */
    template <typename T>
    const T* Get(const std::string& key) const {
        const auto it = data.find(key);
        if (it == data.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }
};

/**
 * @brief Stable listener identity returned by Evented::On
 */
using ListenerId = std::uint64_t;

/**
 * @brief Listener callback
 */
using EventListener = std::function<void(const Event&)>;

/**
 * @brief Base class for objects that emit named events
 *
 * Thread Safety: not thread-safe; all calls happen on the thread that owns
 * the map.
 */
class Evented {
public:
    Evented() = default;
    virtual ~Evented() = default;

    Evented(const Evented&) = delete;
    Evented& operator=(const Evented&) = delete;

    /**
     * @brief Register a listener
     *
     * @param types One or more space-separated event type names
     * @param listener Callback invoked on every matching Fire
     * @param context Optional invocation context, echoed in Event::context
     * @return ListenerId Identity for Off(); shared by all listed types
     */
    ListenerId On(const std::string& types, EventListener listener, const void* context = nullptr);

    /**
     * @brief Remove one listener from the given types
     *
     * @param types Space-separated event type names
     * @param id Identity returned by On()
     */
    void Off(const std::string& types, ListenerId id);

    /**
     * @brief Remove every listener of the given types
     *
     * @param types Space-separated event type names
     */
    void Off(const std::string& types);

    /**
     * @brief Remove every listener of every type
     */
    void Off();

    /**
     * @brief Remove every listener registered with a context
     */
    void OffContext(const void* context);

    /**
     * @brief Invoke all listeners of a type synchronously, in registration order
     *
     * The listener list is snapshotted first: listeners added during the
     * fire are not called, listeners removed during the fire are skipped.
     *
     * @param type Event type name
     * @param data Payload; type and target are added automatically
     */
    void Fire(const std::string& type, EventData data = {});

    /**
     * @brief Check whether any listener is registered for a type
     */
    bool Listens(const std::string& type) const;

    /**
     * @brief Number of listeners registered for a type
     */
    std::size_t GetListenerCount(const std::string& type) const;

private:
    struct Registration {
        ListenerId id = 0;
        EventListener callback;
        const void* context = nullptr;
        bool active = true;
    };

    using RegistrationPtr = std::shared_ptr<Registration>;

    std::unordered_map<std::string, std::vector<RegistrationPtr>> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace slippy_map
