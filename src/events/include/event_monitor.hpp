#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <absl/container/flat_hash_map.h>

#include "events.hpp"

namespace wcc::events
{
    inline constexpr std::size_t DEFAULT_MAILBOX_CAPACITY = 100;

    using EventHandler = std::function<void(const Event &)>;

    /**
     * @brief Subscriber side of the monitor.
     *
     * Events are buffered in a bounded mailbox. A full mailbox drops the incoming
     * event and the producer never blocks. After stop() no event is accepted, events
     * already buffered can still be polled.
     */
    class EventSubscription
    {
        public:
            EventSubscription() = delete;
            EventSubscription(std::string id, EventFilter filter, std::size_t capacity = DEFAULT_MAILBOX_CAPACITY);

            EventSubscription(const EventSubscription&) = delete;
            EventSubscription& operator=(const EventSubscription&) = delete;

            ~EventSubscription() = default;

            const std::string & getId() const;
            const EventFilter & getFilter() const;
            std::chrono::system_clock::time_point getCreatedAt() const;

            bool isActive() const;

            /**
             * @brief Enqueues the event. Returns false when stopped or when the mailbox is full.
             */
            bool offer(const Event & event);

            std::optional<Event> poll();

            std::vector<Event> drain();

            void stop();

            std::size_t size() const;
            std::size_t getCapacity() const;
            std::size_t getDroppedCount() const;

        private:
            const std::string _id;
            const EventFilter _filter;
            const std::chrono::system_clock::time_point _created_at;
            const std::size_t _capacity;

            mutable std::mutex _mutex;
            bool _active;
            std::deque<Event> _mailbox;
            std::size_t _dropped;
    };

    /**
     * @brief Fans events out to matching subscriptions and to handlers keyed by event signature topic.
     *
     * Handlers are posted to the io_context and run wherever it is run.
     */
    class EventMonitor
    {
        public:
            EventMonitor() = delete;
            EventMonitor(asio::io_context & io_context, std::size_t mailbox_capacity = DEFAULT_MAILBOX_CAPACITY);

            EventMonitor(const EventMonitor&) = delete;
            EventMonitor& operator=(const EventMonitor&) = delete;

            ~EventMonitor();

            std::shared_ptr<EventSubscription> subscribe(EventFilter filter);

            /**
             * @brief Stops and forgets the subscription. Returns false for unknown ids.
             */
            bool unsubscribe(const std::string & subscription_id);

            void addEventHandler(const Topic & event_signature, EventHandler handler);

            /**
             * @brief Returns the number of subscriptions that accepted the event.
             */
            std::size_t processEvent(const Event & event);

            std::size_t getSubscriptionCount() const;

        private:
            asio::io_context & _io_context;
            const std::size_t _mailbox_capacity;

            mutable std::mutex _mutex;
            std::uint64_t _next_subscription_id;
            absl::flat_hash_map<std::string, std::shared_ptr<EventSubscription>> _subscriptions;
            absl::flat_hash_map<std::string, std::vector<EventHandler>> _handlers;
    };
}
