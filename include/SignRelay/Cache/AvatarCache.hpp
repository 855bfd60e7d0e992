#pragma once

#include "../Utils/Clock.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "ContentCache.hpp"
#include "KeyValueStore.hpp"

namespace signrelay::cache {
  namespace {
    using utils::clock::IClock;
    using utils::types::f32;
    using utils::types::f64;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u32;
    using utils::types::u64;
    using utils::types::Unit;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  inline constexpr StringView SIGN_NAMESPACE      = "signrelay_sign_cache";
  inline constexpr StringView ANIMATION_NAMESPACE = "signrelay_animation_cache";

  struct HandLandmark {
    f32 x;
    f32 y;
    f32 z;
  };

  /**
   * @brief Landmarks of one tracked hand, in tracker order.
   */
  using HandPose = Vec<HandLandmark>;

  struct AvatarCacheConfig {
    usize signCapacity      = 100;
    usize animationCapacity = 50;
  };

  /**
   * @brief Counters aggregated over the sign and animation namespaces.
   */
  struct CacheMetrics {
    f64   hitRate;
    u64   totalRequests;
    u64   totalHits;
    usize cacheSize;
    usize estimatedMemoryBytes;
  };

  struct MostUsedKeys {
    Vec<Pair<String, u64>> signs;
    Vec<Pair<String, u64>> animations;
  };

  /**
   * @brief 32-bit FNV-1a over @p input, rendered in base 36.
   */
  fn HashToKey(StringView input) -> String;

  /**
   * @brief Stable key for a set of hand poses.
   *
   * Coordinates are serialized at four decimal places so jitter below that
   * resolution maps to the same key.
   */
  fn GenerateGestureKey(Span<const HandPose> hands) -> String;

  /**
   * @brief Stable key for text rendered under a given context (scenario name).
   *
   * The text is normalized the same way as phrase keys, so case, spacing and
   * punctuation differences share a key.
   */
  fn GenerateTextKey(StringView text, StringView context = "default") -> String;

  /**
   * @class AvatarCache
   * @brief Sign-recognition and avatar-animation caches sharing one store.
   */
  class AvatarCache {
   public:
    AvatarCache(const SharedPointer<IKeyValueStore>& store, const SharedPointer<IClock>& clock, const AvatarCacheConfig& config = {});

    fn getSignRecognition(StringView key) -> Option<CacheEntry<SignRecognition>>;
    fn setSignRecognition(StringView key, SignRecognition recognition) -> Unit;

    fn getAvatarAnimation(StringView key) -> Option<CacheEntry<AvatarAnimation>>;
    fn setAvatarAnimation(StringView key, AvatarAnimation animation) -> Unit;

    [[nodiscard]] fn getMetrics() const -> CacheMetrics;

    [[nodiscard]] fn getMostUsed(usize limit = 10) const -> MostUsedKeys;

    /**
     * @brief Drops expired entries from both namespaces.
     */
    fn purgeExpired() -> usize;

    /**
     * @brief Empties both namespaces in memory and in the store.
     * @return The first store error encountered, after attempting both.
     */
    fn clearAll() -> Result<>;

    [[nodiscard]] fn signCache() -> ContentCache<SignRecognition>& {
      return m_signCache;
    }

    [[nodiscard]] fn animationCache() -> ContentCache<AvatarAnimation>& {
      return m_animationCache;
    }

   private:
    ContentCache<SignRecognition> m_signCache;
    ContentCache<AvatarAnimation> m_animationCache;
  };
} // namespace signrelay::cache
