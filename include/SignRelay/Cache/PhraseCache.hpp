#pragma once

#include <atomic> // std::atomic

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace signrelay::cache {
  namespace {
    using utils::types::f32;
    using utils::types::f64;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::SharedMutex;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u64;
    using utils::types::UniquePointer;
    using utils::types::Unit;
    using utils::types::UnorderedMap;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Canonical form used as the phrase key.
   *
   * Lowercases, drops every character that is not alphanumeric, `_` or
   * whitespace, collapses whitespace runs to a single space, and trims.
   * "  Can't   BREATHE! " becomes "cant breathe".
   */
  fn NormalizePhrase(StringView raw) -> String;

  struct PhraseEntry {
    String         phrase;       ///< Normalized key.
    String         mediatedText; ///< Text spoken or rendered for this phrase.
    Option<String> signIntent;   ///< Sign gloss the avatar layer should play, if known.
    f32            confidence;   ///< 1.0 for built-in entries.
  };

  struct PhraseLookup {
    bool                hit;
    Option<PhraseEntry> entry;
    f64                 lookupTimeMicros;
  };

  struct PhraseCacheStats {
    u64 totalLookups;
    u64 cacheHits;
    u64 cacheMisses;
    f64 hitRate;            ///< cacheHits / totalLookups, 0 with no lookups.
    f64 averageLookupMicros;
  };

  /**
   * @brief Row of a built-in phrase table.
   */
  struct PhraseSeed {
    StringView phrase;
    StringView mediatedText;
    StringView signIntent;
  };

  /**
   * @class PhraseCache
   * @brief Exact-match table from normalized phrase to mediated text.
   *
   * Lookups take a shared lock and may run concurrently; `addTerm` is exclusive.
   * A frozen table (the emergency table) rejects `addTerm`.
   */
  class PhraseCache {
   public:
    PhraseCache(String name, const Vec<PhraseSeed>& seeds, bool frozen);

    /**
     * @brief Looks up the normalized form of @p raw and records timing and hit statistics.
     */
    fn lookup(StringView raw) const -> PhraseLookup;

    /**
     * @brief Membership check that leaves statistics untouched.
     */
    [[nodiscard]] fn isCached(StringView raw) const -> bool;

    /**
     * @brief Inserts or overwrites the entry for the normalized form of @p raw.
     * @return InvalidArgument if @p raw normalizes to nothing, NotSupported on a frozen table.
     */
    fn addTerm(StringView raw, String mediatedText, Option<String> signIntent = {}, f32 confidence = DEFAULT_LEARNED_CONFIDENCE) -> Result<>;

    [[nodiscard]] fn getStats() const -> PhraseCacheStats;

    fn resetStats() -> Unit;

    /**
     * @brief Entries with at least one hit, most used first.
     */
    [[nodiscard]] fn getMostUsed(usize limit = 10) const -> Vec<Pair<PhraseEntry, u64>>;

    [[nodiscard]] fn size() const -> usize;

    [[nodiscard]] fn name() const -> const String& {
      return m_name;
    }

    [[nodiscard]] fn isFrozen() const -> bool {
      return m_frozen;
    }

    static constexpr f32 DEFAULT_LEARNED_CONFIDENCE = 0.8F;

   private:
    struct Slot {
      PhraseEntry                     entry;
      UniquePointer<std::atomic<u64>> hits;
    };

    String                     m_name;
    bool                       m_frozen;
    mutable SharedMutex        m_mutex;
    UnorderedMap<String, Slot> m_table;

    mutable std::atomic<u64> m_totalLookups { 0 };
    mutable std::atomic<u64> m_cacheHits { 0 };
    mutable std::atomic<u64> m_totalLookupNanos { 0 };
  };

  /**
   * @brief Phrases that always take the fast path when emergency mode is on.
   */
  fn DefaultEmergencyPhrases() -> const Vec<PhraseSeed>&;

  /**
   * @brief Built-in medical vocabulary: symptoms, anatomy, history, pain scale, time.
   */
  fn DefaultMedicalTerms() -> const Vec<PhraseSeed>&;
} // namespace signrelay::cache
