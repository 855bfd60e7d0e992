#pragma once

#include <atomic> // std::atomic

#include <SignRelay/Utils/Clock.hpp>
#include <SignRelay/Utils/Types.hpp>

namespace signrelay::test_support {
  /**
   * @brief Clock that only moves when a test advances it.
   */
  class ManualClock final : public utils::clock::IClock {
   public:
    explicit ManualClock(const utils::clock::Timestamp start = 1'700'000'000'000) : m_now(start) {}

    [[nodiscard]] fn now() const -> utils::clock::Timestamp override {
      return m_now.load();
    }

    fn advance(const utils::clock::Timestamp deltaMs) -> utils::types::Unit {
      m_now.fetch_add(deltaMs);
    }

    fn set(const utils::clock::Timestamp timestamp) -> utils::types::Unit {
      m_now.store(timestamp);
    }

   private:
    std::atomic<utils::clock::Timestamp> m_now;
  };
} // namespace signrelay::test_support
