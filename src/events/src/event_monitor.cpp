#include "event_monitor.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace wcc::events
{
    EventSubscription::EventSubscription(std::string id, EventFilter filter, std::size_t capacity)
    :   _id(std::move(id)),
        _filter(std::move(filter)),
        _created_at(std::chrono::system_clock::now()),
        _capacity(capacity),
        _active(true),
        _dropped(0)
    {
    }

    const std::string & EventSubscription::getId() const
    {
        return _id;
    }

    const EventFilter & EventSubscription::getFilter() const
    {
        return _filter;
    }

    std::chrono::system_clock::time_point EventSubscription::getCreatedAt() const
    {
        return _created_at;
    }

    bool EventSubscription::isActive() const
    {
        std::lock_guard lock(_mutex);
        return _active;
    }

    bool EventSubscription::offer(const Event & event)
    {
        std::lock_guard lock(_mutex);
        if(!_active)
        {
            return false;
        }

        if(_mailbox.size() >= _capacity)
        {
            ++_dropped;
            spdlog::warn("Subscription {} mailbox full ({}), event dropped", _id, _capacity);
            return false;
        }

        _mailbox.push_back(event);
        return true;
    }

    std::optional<Event> EventSubscription::poll()
    {
        std::lock_guard lock(_mutex);
        if(_mailbox.empty())
        {
            return std::nullopt;
        }

        Event event = std::move(_mailbox.front());
        _mailbox.pop_front();
        return event;
    }

    std::vector<Event> EventSubscription::drain()
    {
        std::lock_guard lock(_mutex);
        std::vector<Event> events(std::make_move_iterator(_mailbox.begin()), std::make_move_iterator(_mailbox.end()));
        _mailbox.clear();
        return events;
    }

    void EventSubscription::stop()
    {
        std::lock_guard lock(_mutex);
        _active = false;
    }

    std::size_t EventSubscription::size() const
    {
        std::lock_guard lock(_mutex);
        return _mailbox.size();
    }

    std::size_t EventSubscription::getCapacity() const
    {
        return _capacity;
    }

    std::size_t EventSubscription::getDroppedCount() const
    {
        std::lock_guard lock(_mutex);
        return _dropped;
    }

    EventMonitor::EventMonitor(asio::io_context & io_context, std::size_t mailbox_capacity)
    :   _io_context(io_context),
        _mailbox_capacity(mailbox_capacity),
        _next_subscription_id(1)
    {
    }

    EventMonitor::~EventMonitor()
    {
        std::lock_guard lock(_mutex);
        for(auto & [id, subscription] : _subscriptions)
        {
            subscription->stop();
        }
    }

    std::shared_ptr<EventSubscription> EventMonitor::subscribe(EventFilter filter)
    {
        std::lock_guard lock(_mutex);

        std::string id = std::format("sub_{}", _next_subscription_id++);
        auto subscription = std::make_shared<EventSubscription>(id, std::move(filter), _mailbox_capacity);
        _subscriptions.emplace(std::move(id), subscription);

        spdlog::debug("Subscription {} created", subscription->getId());
        return subscription;
    }

    bool EventMonitor::unsubscribe(const std::string & subscription_id)
    {
        std::lock_guard lock(_mutex);

        const auto it = _subscriptions.find(subscription_id);
        if(it == _subscriptions.end())
        {
            return false;
        }

        it->second->stop();
        _subscriptions.erase(it);

        spdlog::debug("Subscription {} removed", subscription_id);
        return true;
    }

    void EventMonitor::addEventHandler(const Topic & event_signature, EventHandler handler)
    {
        std::lock_guard lock(_mutex);
        _handlers[topicToHex(event_signature)].push_back(std::move(handler));
    }

    std::size_t EventMonitor::processEvent(const Event & event)
    {
        std::vector<std::shared_ptr<EventSubscription>> subscriptions;
        std::vector<EventHandler> handlers;
        {
            std::lock_guard lock(_mutex);
            subscriptions.reserve(_subscriptions.size());
            for(const auto & [id, subscription] : _subscriptions)
            {
                subscriptions.push_back(subscription);
            }

            if(!event.topics.empty())
            {
                const auto it = _handlers.find(topicToHex(event.topics.front()));
                if(it != _handlers.end())
                {
                    handlers = it->second;
                }
            }
        }

        std::size_t delivered = 0;
        for(const auto & subscription : subscriptions)
        {
            if(subscription->isActive() && subscription->getFilter().matches(event) && subscription->offer(event))
            {
                ++delivered;
            }
        }

        for(auto & handler : handlers)
        {
            asio::post(_io_context, [handler = std::move(handler), event]()
            {
                try
                {
                    handler(event);
                }
                catch(const std::exception & e)
                {
                    spdlog::error("Event handler failed: {}", e.what());
                }
            });
        }

        return delivered;
    }

    std::size_t EventMonitor::getSubscriptionCount() const
    {
        std::lock_guard lock(_mutex);
        return _subscriptions.size();
    }
}
