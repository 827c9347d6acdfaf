#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rcs::daemon
{

class EventBus
{
  public:
    template <typename T> using Handler = std::function<void(T const &)>;
    using SubscriptionId = std::uint64_t;

    template <typename T> SubscriptionId subscribe(Handler<T> handler)
    {
        std::unique_lock lock(handlers_mutex_);
        auto const id = next_id_++;
        auto &handlers = handlers_[std::type_index(typeid(T))];
        handlers.push_back(
            {id, [handler = std::move(handler)](std::any const &event)
             { handler(std::any_cast<T const &>(event)); }});
        return id;
    }

    bool unsubscribe(SubscriptionId id)
    {
        std::unique_lock lock(handlers_mutex_);
        for (auto &[type, handlers] : handlers_)
        {
            for (auto it = handlers.begin(); it != handlers.end(); ++it)
            {
                if (it->id == id)
                {
                    handlers.erase(it);
                    return true;
                }
            }
        }
        return false;
    }

    template <typename T> void publish(T const &event) const
    {
        // Handlers run on a copy so they may subscribe or unsubscribe
        // without deadlocking.
        std::vector<Entry> handlers_copy;
        {
            std::shared_lock lock(handlers_mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end())
            {
                handlers_copy = it->second;
            }
        }

        std::any const wrapped = event;
        for (auto const &entry : handlers_copy)
        {
            entry.handler(wrapped);
        }
    }

  private:
    using TypeErasedHandler = std::function<void(std::any const &)>;
    struct Entry
    {
        SubscriptionId id;
        TypeErasedHandler handler;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    SubscriptionId next_id_ = 1;
    mutable std::shared_mutex handlers_mutex_;
};

} // namespace rcs::daemon
