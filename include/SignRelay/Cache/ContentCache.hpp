#pragma once

#include <algorithm>       // std::ranges::{min_element, sort}
#include <glaze/glaze.hpp> // glz::{read_beve, write_beve, error_ctx, format_error}
#include <variant>         // std::variant

#include "../Utils/Clock.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "KeyValueStore.hpp"

namespace signrelay::cache {
  namespace {
    using utils::clock::IClock;
    using utils::clock::MS_PER_HOUR;
    using utils::clock::Timestamp;
    using utils::error::RelayError;
    using utils::types::Err;
    using utils::types::f32;
    using utils::types::i32;
    using utils::types::LockGuard;
    using utils::types::Mutex;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u64;
    using utils::types::u8;
    using utils::types::Unit;
    using utils::types::UnorderedMap;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Entries older than this (measured from createdAt) are treated as absent.
   */
  inline constexpr Timestamp ENTRY_TTL_MS = 24 * MS_PER_HOUR;

  template <typename Payload>
  struct CacheEntry {
    String    key;
    Payload   payload;
    Timestamp createdAt      = 0;
    Timestamp lastAccessedAt = 0;
    u64       usageCount     = 1; ///< Incremented on every successful get.
  };

  /**
   * @brief Result of recognizing a gesture: the signs it maps to.
   */
  struct SignRecognition {
    Vec<String> recognizedSigns;
    f32         confidence = 0.0F; ///< In [0, 1].
  };

  struct VideoRendering {
    String videoPath;
  };

  struct ProceduralRendering {
    Vec<u8> animationPayload; ///< Opaque keyframe data for the avatar renderer.
  };

  /**
   * @brief A sign sequence and exactly one way of rendering it.
   */
  struct AvatarAnimation {
    Vec<String>                                       signSequence; ///< Ordered gloss tokens.
    std::variant<VideoRendering, ProceduralRendering> rendering;
  };

  struct ContentCacheStats {
    u64 totalRequests = 0;
    u64 totalHits     = 0;
    u64 totalMisses   = 0;
    u64 evictions     = 0;
  };

  inline fn EstimatePayloadBytes(const SignRecognition& payload) -> usize {
    usize bytes = sizeof(SignRecognition);

    for (const String& sign : payload.recognizedSigns)
      bytes += sign.size();

    return bytes;
  }

  inline fn EstimatePayloadBytes(const AvatarAnimation& payload) -> usize {
    usize bytes = sizeof(AvatarAnimation);

    for (const String& gloss : payload.signSequence)
      bytes += gloss.size();

    if (const auto* video = std::get_if<VideoRendering>(&payload.rendering))
      bytes += video->videoPath.size();
    else
      bytes += std::get<ProceduralRendering>(payload.rendering).animationPayload.size();

    return bytes;
  }

  /**
   * @class ContentCache
   * @brief Capacity-bounded LRU cache with a 24 hour TTL, persisted to one store namespace.
   *
   * Every `set` rewrites the whole namespace blob (glaze BEVE). Store and
   * decode failures are logged and the cache carries on in memory.
   *
   * @tparam Payload A glaze-serializable value type.
   */
  template <typename Payload>
  class ContentCache {
   public:
    using Entry = CacheEntry<Payload>;

    ContentCache(String nameSpace, const usize capacity, SharedPointer<IKeyValueStore> store, SharedPointer<IClock> clock)
      : m_nameSpace(std::move(nameSpace)), m_capacity(capacity), m_store(std::move(store)), m_clock(std::move(clock)) {
      load();
    }

    /**
     * @brief Returns a copy of the entry if present and not expired.
     *
     * A hit bumps usageCount and lastAccessedAt. An expired entry is dropped
     * from memory and counted as a miss.
     */
    fn get(const StringView key) -> Option<Entry> {
      const LockGuard lock(m_mutex);

      ++m_stats.totalRequests;

      const auto iter = m_entries.find(String(key));

      if (iter == m_entries.end()) {
        ++m_stats.totalMisses;
        return None;
      }

      const Timestamp now = m_clock->now();

      if (isExpired(iter->second, now)) {
        debug_log("{}: entry '{}' expired, dropping", m_nameSpace, key);
        m_entries.erase(iter);
        ++m_stats.totalMisses;
        return None;
      }

      ++m_stats.totalHits;
      ++iter->second.usageCount;
      iter->second.lastAccessedAt = now;

      return iter->second;
    }

    /**
     * @brief Inserts a fresh entry (overwriting any existing one), evicts the
     * least recently accessed entry on overflow, then persists the namespace.
     */
    fn set(const StringView key, Payload payload) -> Unit {
      const LockGuard lock(m_mutex);

      const Timestamp now = m_clock->now();

      m_entries.insert_or_assign(
        String(key),
        Entry {
          .key            = String(key),
          .payload        = std::move(payload),
          .createdAt      = now,
          .lastAccessedAt = now,
          .usageCount     = 1,
        }
      );

      if (m_entries.size() > m_capacity)
        evictOne();

      persist();
    }

    /**
     * @brief Drops every expired entry.
     * @return The number of entries removed.
     */
    fn purgeExpired() -> usize {
      const LockGuard lock(m_mutex);

      const Timestamp now     = m_clock->now();
      const usize     removed = std::erase_if(m_entries, [&](const auto& item) { return isExpired(item.second, now); });

      if (removed > 0) {
        debug_log("{}: purged {} expired entries", m_nameSpace, removed);
        persist();
      }

      return removed;
    }

    /**
     * @brief Empties the cache and removes its persisted namespace.
     */
    fn clear() -> Result<> {
      const LockGuard lock(m_mutex);

      m_entries.clear();
      m_stats = {};

      if (Result<> removed = m_store->remove(m_nameSpace); !removed)
        return Err(removed.error());

      return {};
    }

    /**
     * @brief Keys ordered by usage count, highest first.
     */
    [[nodiscard]] fn mostUsed(const usize limit) const -> Vec<Pair<String, u64>> {
      Vec<Pair<String, u64>> used;

      {
        const LockGuard lock(m_mutex);

        used.reserve(m_entries.size());

        for (const auto& [key, entry] : m_entries)
          used.emplace_back(key, entry.usageCount);
      }

      std::ranges::sort(used, [](const Pair<String, u64>& lhs, const Pair<String, u64>& rhs) {
        return lhs.second != rhs.second ? lhs.second > rhs.second : lhs.first < rhs.first;
      });

      if (used.size() > limit)
        used.resize(limit);

      return used;
    }

    [[nodiscard]] fn size() const -> usize {
      const LockGuard lock(m_mutex);
      return m_entries.size();
    }

    [[nodiscard]] fn capacity() const -> usize {
      return m_capacity;
    }

    [[nodiscard]] fn stats() const -> ContentCacheStats {
      const LockGuard lock(m_mutex);
      return m_stats;
    }

    /**
     * @brief Rough in-memory footprint of keys and payloads.
     */
    [[nodiscard]] fn estimatedBytes() const -> usize {
      const LockGuard lock(m_mutex);

      usize bytes = 0;

      for (const auto& [key, entry] : m_entries)
        bytes += sizeof(Entry) + (key.size() * 2) + EstimatePayloadBytes(entry.payload);

      return bytes;
    }

    [[nodiscard]] fn nameSpace() const -> const String& {
      return m_nameSpace;
    }

   private:
    [[nodiscard]] static fn isExpired(const Entry& entry, const Timestamp now) -> bool {
      return now - entry.createdAt >= ENTRY_TTL_MS;
    }

    // Caller holds m_mutex.
    fn evictOne() -> Unit {
      const auto victim = std::ranges::min_element(m_entries, [](const auto& lhs, const auto& rhs) {
        if (lhs.second.lastAccessedAt != rhs.second.lastAccessedAt)
          return lhs.second.lastAccessedAt < rhs.second.lastAccessedAt;

        if (lhs.second.createdAt != rhs.second.createdAt)
          return lhs.second.createdAt < rhs.second.createdAt;

        return lhs.first < rhs.first;
      });

      debug_log("{}: evicting '{}' (last accessed {})", m_nameSpace, victim->first, victim->second.lastAccessedAt);

      m_entries.erase(victim);
      ++m_stats.evictions;
    }

    // Caller holds m_mutex.
    fn persist() -> Unit {
      Vec<Entry> snapshot;
      snapshot.reserve(m_entries.size());

      for (const auto& [key, entry] : m_entries)
        snapshot.push_back(entry);

      String buffer;

      if (glz::error_ctx glazeErr = glz::write_beve(snapshot, buffer); glazeErr) {
        warn_at(RelayError(
          utils::error::RelayErrorCode::InternalError,
          std::format("{}: BEVE serialization failed (code {}): {}", m_nameSpace, static_cast<i32>(glazeErr.ec), glz::format_error(glazeErr, buffer))
        ));
        return;
      }

      if (Result<> written = m_store->set(m_nameSpace, buffer); !written)
        warn_at(written.error());
    }

    fn load() -> Unit {
      const Result<Option<String>> blob = m_store->get(m_nameSpace);

      if (!blob) {
        warn_at(blob.error());
        return;
      }

      if (!blob->has_value()) {
        debug_log("{}: no persisted state, starting empty", m_nameSpace);
        return;
      }

      const String& content = **blob;

      Vec<Entry> restored;

      if (glz::error_ctx glazeErr = glz::read_beve(restored, content); glazeErr.ec != glz::error_code::none) {
        warn_at(RelayError(
          utils::error::RelayErrorCode::DeserializationFailure,
          std::format("{}: discarding corrupt persisted state (code {}): {}", m_nameSpace, static_cast<i32>(glazeErr.ec), glz::format_error(glazeErr, content))
        ));
        return;
      }

      const Timestamp now = m_clock->now();

      for (Entry& entry : restored)
        if (!entry.key.empty() && !isExpired(entry, now))
          m_entries.insert_or_assign(entry.key, std::move(entry));

      while (m_entries.size() > m_capacity)
        evictOne();

      debug_log("{}: restored {} of {} persisted entries", m_nameSpace, m_entries.size(), restored.size());
    }

    String                        m_nameSpace;
    usize                         m_capacity;
    SharedPointer<IKeyValueStore> m_store;
    SharedPointer<IClock>         m_clock;

    mutable Mutex               m_mutex;
    UnorderedMap<String, Entry> m_entries;
    ContentCacheStats           m_stats;
  };
} // namespace signrelay::cache

namespace glz {
  template <typename Tp>
  struct meta<signrelay::cache::CacheEntry<Tp>> {
    using T = signrelay::cache::CacheEntry<Tp>;

    // clang-format off
    static constexpr auto value = object(
      "key",            &T::key,
      "payload",        &T::payload,
      "createdAt",      &T::createdAt,
      "lastAccessedAt", &T::lastAccessedAt,
      "usageCount",     &T::usageCount
    );
    // clang-format on
  };

  template <>
  struct meta<signrelay::cache::SignRecognition> {
    using T = signrelay::cache::SignRecognition;

    static constexpr auto value = object("recognizedSigns", &T::recognizedSigns, "confidence", &T::confidence);
  };

  template <>
  struct meta<signrelay::cache::VideoRendering> {
    using T = signrelay::cache::VideoRendering;

    static constexpr auto value = object("videoPath", &T::videoPath);
  };

  template <>
  struct meta<signrelay::cache::ProceduralRendering> {
    using T = signrelay::cache::ProceduralRendering;

    static constexpr auto value = object("animationPayload", &T::animationPayload);
  };

  template <>
  struct meta<signrelay::cache::AvatarAnimation> {
    using T = signrelay::cache::AvatarAnimation;

    static constexpr auto value = object("signSequence", &T::signSequence, "rendering", &T::rendering);
  };
} // namespace glz
