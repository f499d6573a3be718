/**
 * @file signals.hpp
 * @brief Lightweight signal-slot system
 *
 * Used for playhead/state notifications, device-loss callbacks and clock
 * subscribers. A slot that throws is logged and skipped; the remaining slots
 * still run, so one faulty observer cannot stall the frame loop.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "logger.hpp"

namespace lumen {

template<typename... Args>
class Signal;

/**
 * @brief Handle to a connected slot
 *
 * Copyable; disconnecting through any copy removes the slot. Safe to use
 * after the signal is destroyed.
 */
class Connection {
public:
    Connection() = default;

    [[nodiscard]] bool connected() const {
        return m_connected && !m_disconnector.expired();
    }

    void disconnect() {
        if (auto disc = m_disconnector.lock()) {
            disc->disconnect(m_id);
        }
        m_connected = false;
    }

private:
    template<typename... Args>
    friend class Signal;

    struct Disconnector {
        virtual ~Disconnector() = default;
        virtual void disconnect(uint64_t id) = 0;
    };

    Connection(uint64_t id, std::shared_ptr<Disconnector> disc)
        : m_id(id), m_disconnector(disc), m_connected(true) {}

    uint64_t m_id = 0;
    std::weak_ptr<Disconnector> m_disconnector;
    bool m_connected = false;
};

/// Connection that disconnects on destruction
class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(Connection conn) : m_connection(std::move(conn)) {}

    ~ScopedConnection() { disconnect(); }

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_connection(std::move(other.m_connection)) {
        other.m_connection = Connection();
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_connection = std::move(other.m_connection);
            other.m_connection = Connection();
        }
        return *this;
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void disconnect() { m_connection.disconnect(); }

    [[nodiscard]] bool connected() const { return m_connection.connected(); }

private:
    Connection m_connection;
};

/**
 * @brief Type-safe signal
 *
 * @code
 *   Signal<Timestamp> positionChanged;
 *   auto conn = positionChanged.connectScoped([](Timestamp t) { ... });
 *   positionChanged.fire(42);
 * @endcode
 */
template<typename... Args>
class Signal {
public:
    using SlotType = std::function<void(Args...)>;

    Signal() : m_disconnector(std::make_shared<DisconnectorImpl>(this)) {}

    ~Signal() {
        std::lock_guard lock(m_disconnector->m_mutex);
        m_disconnector->m_signal = nullptr;
    }

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = delete;
    Signal& operator=(Signal&&) = delete;

    [[nodiscard]] Connection connect(SlotType slot) {
        std::lock_guard lock(m_mutex);
        uint64_t id = m_nextId++;
        m_slots.push_back({id, std::move(slot)});
        return Connection(id, m_disconnector);
    }

    [[nodiscard]] ScopedConnection connectScoped(SlotType slot) {
        return ScopedConnection(connect(std::move(slot)));
    }

    /**
     * @brief Invoke every connected slot
     *
     * Slots are copied under the lock and invoked outside it, so a slot may
     * connect or disconnect during emission. A slot that throws is logged
     * and the remaining slots still run.
     */
    void fire(Args... args) {
        std::vector<Slot> slotsCopy;
        {
            std::lock_guard lock(m_mutex);
            slotsCopy = m_slots;
        }

        for (auto& slot : slotsCopy) {
            if (!slot.func) {
                continue;
            }
            try {
                slot.func(args...);
            } catch (const std::exception& e) {
                LUMEN_LOG_ERROR("Signal slot {} threw: {}", slot.id, e.what());
            }
        }
    }

    void operator()(Args... args) { fire(args...); }

    void disconnectAll() {
        std::lock_guard lock(m_mutex);
        m_slots.clear();
    }

    [[nodiscard]] size_t slotCount() const {
        std::lock_guard lock(m_mutex);
        return m_slots.size();
    }

private:
    struct Slot {
        uint64_t id;
        SlotType func;
    };

    struct DisconnectorImpl : Connection::Disconnector {
        std::mutex m_mutex;
        Signal* m_signal;

        explicit DisconnectorImpl(Signal* sig) : m_signal(sig) {}

        void disconnect(uint64_t id) override {
            std::lock_guard lock(m_mutex);
            if (m_signal) {
                m_signal->disconnectById(id);
            }
        }
    };

    void disconnectById(uint64_t id) {
        std::lock_guard lock(m_mutex);
        m_slots.erase(std::remove_if(m_slots.begin(), m_slots.end(),
                                     [id](const Slot& s) { return s.id == id; }),
                      m_slots.end());
    }

    mutable std::mutex m_mutex;
    std::vector<Slot> m_slots;
    std::shared_ptr<DisconnectorImpl> m_disconnector;
    std::atomic<uint64_t> m_nextId{1};
};

using VoidSignal = Signal<>;

} // namespace lumen
