#pragma once

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"

namespace signrelay::pipeline {
  namespace {
    using utils::types::Exception;
    using utils::types::Fn;
    using utils::types::LockGuard;
    using utils::types::Map;
    using utils::types::Mutex;
    using utils::types::SharedPointer;
    using utils::types::u64;
    using utils::types::Unit;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @class Channel
   * @brief Typed publish/subscribe channel.
   *
   * Values are delivered to subscribers in publish order, on the publishing
   * thread, outside the channel's lock. A subscriber removed before its turn
   * in a publish does not receive that value. Exceptions thrown by a
   * subscriber are logged and do not reach the publisher.
   *
   * @tparam T The published value type.
   */
  template <typename T>
  class Channel {
    struct Registry {
      Mutex                                   mutex;
      Map<u64, SharedPointer<Fn<void(const T&)>>> subscribers;
      u64                                     nextId = 1;
    };

   public:
    using Callback = Fn<void(const T&)>;

    /**
     * @brief Handle returned by subscribe(). Unsubscribes on destruction.
     *
     * unsubscribe() is idempotent, may be called from inside the callback,
     * and is safe after the channel itself is gone.
     */
    class Subscription {
     public:
      Subscription() = default;

      Subscription(std::weak_ptr<Registry> registry, const u64 subscriberId)
        : m_registry(std::move(registry)), m_id(subscriberId) {}

      Subscription(const Subscription&)                = delete;
      fn operator=(const Subscription&)->Subscription& = delete;

      Subscription(Subscription&& other) noexcept
        : m_registry(std::move(other.m_registry)), m_id(std::exchange(other.m_id, 0)) {}

      fn operator=(Subscription&& other) noexcept -> Subscription& {
        if (this != &other) {
          unsubscribe();
          m_registry = std::move(other.m_registry);
          m_id       = std::exchange(other.m_id, 0);
        }

        return *this;
      }

      ~Subscription() {
        unsubscribe();
      }

      fn unsubscribe() -> Unit {
        if (m_id == 0)
          return;

        if (const SharedPointer<Registry> registry = m_registry.lock()) {
          const LockGuard lock(registry->mutex);
          registry->subscribers.erase(m_id);
        }

        m_id = 0;
        m_registry.reset();
      }

      [[nodiscard]] fn active() const -> bool {
        return m_id != 0 && !m_registry.expired();
      }

     private:
      std::weak_ptr<Registry> m_registry;
      u64                     m_id = 0;
    };

    Channel() = default;

    [[nodiscard]] fn subscribe(Callback callback) -> Subscription {
      const LockGuard lock(m_registry->mutex);

      const u64 subscriberId = m_registry->nextId++;
      m_registry->subscribers.emplace(subscriberId, std::make_shared<Callback>(std::move(callback)));

      return { m_registry, subscriberId };
    }

    fn publish(const T& value) const -> Unit {
      Vec<u64> ids;

      {
        const LockGuard lock(m_registry->mutex);

        ids.reserve(m_registry->subscribers.size());

        for (const auto& [subscriberId, callback] : m_registry->subscribers)
          ids.push_back(subscriberId);
      }

      for (const u64 subscriberId : ids) {
        SharedPointer<Callback> callback;

        {
          const LockGuard lock(m_registry->mutex);

          if (const auto iter = m_registry->subscribers.find(subscriberId); iter != m_registry->subscribers.end())
            callback = iter->second;
        }

        if (!callback || !*callback)
          continue;

        try {
          (*callback)(value);
        } catch (const Exception& e) {
          warn_log("Channel subscriber {} threw: {}", subscriberId, e.what());
        }
      }
    }

    [[nodiscard]] fn subscriberCount() const -> usize {
      const LockGuard lock(m_registry->mutex);
      return m_registry->subscribers.size();
    }

   private:
    SharedPointer<Registry> m_registry = std::make_shared<Registry>();
  };
} // namespace signrelay::pipeline
