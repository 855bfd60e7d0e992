#include "SignRelay/Cache/PhraseCache.hpp"

#include <algorithm> // std::ranges::sort
#include <cctype>    // std::{isalnum, isspace, tolower}
#include <chrono>    // std::chrono::{steady_clock, duration_cast, nanoseconds}

#include "SignRelay/Utils/Logging.hpp"

using namespace signrelay::utils::types;
using signrelay::utils::error::RelayError;
using enum signrelay::utils::error::RelayErrorCode;

namespace signrelay::cache {
  fn NormalizePhrase(const StringView raw) -> String {
    String normalized;
    normalized.reserve(raw.size());

    bool pendingSpace = false;

    for (const char character : raw) {
      const auto byte = static_cast<unsigned char>(character);

      if (std::isspace(byte)) {
        pendingSpace = !normalized.empty();
        continue;
      }

      if (!std::isalnum(byte) && character != '_')
        continue;

      if (pendingSpace) {
        normalized.push_back(' ');
        pendingSpace = false;
      }

      normalized.push_back(static_cast<char>(std::tolower(byte)));
    }

    return normalized;
  }

  PhraseCache::PhraseCache(String name, const Vec<PhraseSeed>& seeds, const bool frozen)
    : m_name(std::move(name)), m_frozen(frozen) {
    m_table.reserve(seeds.size());

    for (const PhraseSeed& seed : seeds) {
      String key = NormalizePhrase(seed.phrase);

      PhraseEntry entry {
        .phrase       = key,
        .mediatedText = String(seed.mediatedText),
        .signIntent   = seed.signIntent.empty() ? None : Option<String>(String(seed.signIntent)),
        .confidence   = 1.0F,
      };

      m_table.insert_or_assign(std::move(key), Slot { .entry = std::move(entry), .hits = std::make_unique<std::atomic<u64>>(0) });
    }

    debug_log("Phrase table '{}' initialized with {} entries", m_name, m_table.size());
  }

  fn PhraseCache::lookup(const StringView raw) const -> PhraseLookup {
    using std::chrono::duration_cast;
    using std::chrono::nanoseconds;
    using std::chrono::steady_clock;

    const steady_clock::time_point start = steady_clock::now();

    const String key = NormalizePhrase(raw);

    Option<PhraseEntry> found;

    {
      const SharedLock<SharedMutex> lock(m_mutex);

      if (const auto iter = m_table.find(key); iter != m_table.end()) {
        iter->second.hits->fetch_add(1, std::memory_order_relaxed);
        found = iter->second.entry;
      }
    }

    const u64 elapsedNanos = static_cast<u64>(duration_cast<nanoseconds>(steady_clock::now() - start).count());

    m_totalLookups.fetch_add(1, std::memory_order_relaxed);
    m_totalLookupNanos.fetch_add(elapsedNanos, std::memory_order_relaxed);

    if (found)
      m_cacheHits.fetch_add(1, std::memory_order_relaxed);

    const f64 lookupTimeMicros = static_cast<f64>(elapsedNanos) / 1000.0;

    debug_log("{} lookup {} for '{}' ({:.1f}us)", m_name, found ? "HIT" : "MISS", key, lookupTimeMicros);

    return { .hit = found.has_value(), .entry = std::move(found), .lookupTimeMicros = lookupTimeMicros };
  }

  fn PhraseCache::isCached(const StringView raw) const -> bool {
    const String key = NormalizePhrase(raw);

    const SharedLock<SharedMutex> lock(m_mutex);
    return m_table.contains(key);
  }

  fn PhraseCache::addTerm(const StringView raw, String mediatedText, Option<String> signIntent, const f32 confidence) -> Result<> {
    if (m_frozen)
      ERR_FMT(NotSupported, "Phrase table '{}' is read-only", m_name);

    String key = NormalizePhrase(raw);

    if (key.empty())
      ERR_FMT(InvalidArgument, "Phrase '{}' is empty after normalization", raw);

    PhraseEntry entry {
      .phrase       = key,
      .mediatedText = std::move(mediatedText),
      .signIntent   = std::move(signIntent),
      .confidence   = std::clamp(confidence, 0.0F, 1.0F),
    };

    {
      const std::unique_lock<SharedMutex> lock(m_mutex);
      m_table.insert_or_assign(key, Slot { .entry = std::move(entry), .hits = std::make_unique<std::atomic<u64>>(0) });
    }

    debug_log("Added '{}' to phrase table '{}'", key, m_name);

    return {};
  }

  fn PhraseCache::getStats() const -> PhraseCacheStats {
    const u64 total = m_totalLookups.load(std::memory_order_relaxed);
    const u64 hits  = m_cacheHits.load(std::memory_order_relaxed);
    const u64 nanos = m_totalLookupNanos.load(std::memory_order_relaxed);

    return {
      .totalLookups        = total,
      .cacheHits           = hits,
      .cacheMisses         = total - hits,
      .hitRate             = total > 0 ? static_cast<f64>(hits) / static_cast<f64>(total) : 0.0,
      .averageLookupMicros = total > 0 ? static_cast<f64>(nanos) / 1000.0 / static_cast<f64>(total) : 0.0,
    };
  }

  fn PhraseCache::resetStats() -> Unit {
    m_totalLookups.store(0, std::memory_order_relaxed);
    m_cacheHits.store(0, std::memory_order_relaxed);
    m_totalLookupNanos.store(0, std::memory_order_relaxed);
  }

  fn PhraseCache::getMostUsed(const usize limit) const -> Vec<Pair<PhraseEntry, u64>> {
    Vec<Pair<PhraseEntry, u64>> used;

    {
      const SharedLock<SharedMutex> lock(m_mutex);

      for (const auto& [key, slot] : m_table)
        if (const u64 hits = slot.hits->load(std::memory_order_relaxed); hits > 0)
          used.emplace_back(slot.entry, hits);
    }

    std::ranges::sort(used, [](const Pair<PhraseEntry, u64>& lhs, const Pair<PhraseEntry, u64>& rhs) {
      return lhs.second != rhs.second ? lhs.second > rhs.second : lhs.first.phrase < rhs.first.phrase;
    });

    if (used.size() > limit)
      used.resize(limit);

    return used;
  }

  fn PhraseCache::size() const -> usize {
    const SharedLock<SharedMutex> lock(m_mutex);
    return m_table.size();
  }
} // namespace signrelay::cache
