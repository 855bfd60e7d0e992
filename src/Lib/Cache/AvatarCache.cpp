#include "SignRelay/Cache/AvatarCache.hpp"

#include <algorithm> // std::ranges::reverse
#include <format>    // std::format_to
#include <iterator>  // std::back_inserter

#include "SignRelay/Cache/PhraseCache.hpp"
#include "SignRelay/Utils/Logging.hpp"

using namespace signrelay::utils::types;
using signrelay::utils::clock::IClock;

namespace signrelay::cache {
  namespace {
    constexpr u32 FNV_OFFSET_BASIS = 2'166'136'261U;
    constexpr u32 FNV_PRIME        = 16'777'619U;

    constexpr StringView BASE36_DIGITS = "0123456789abcdefghijklmnopqrstuvwxyz";
  } // namespace

  fn HashToKey(const StringView input) -> String {
    u32 hash = FNV_OFFSET_BASIS;

    for (const char character : input) {
      hash ^= static_cast<u8>(character);
      hash *= FNV_PRIME;
    }

    if (hash == 0)
      return "0";

    String encoded;

    while (hash > 0) {
      encoded.push_back(BASE36_DIGITS[hash % 36]);
      hash /= 36;
    }

    std::ranges::reverse(encoded);

    return encoded;
  }

  fn GenerateGestureKey(const Span<const HandPose> hands) -> String {
    String canonical;

    for (usize handIdx = 0; handIdx < hands.size(); ++handIdx) {
      if (handIdx > 0)
        canonical.push_back('|');

      for (usize pointIdx = 0; pointIdx < hands[handIdx].size(); ++pointIdx) {
        const HandLandmark& point = hands[handIdx][pointIdx];

        if (pointIdx > 0)
          canonical.push_back(';');

        std::format_to(std::back_inserter(canonical), "{:.4f},{:.4f},{:.4f}", point.x, point.y, point.z);
      }
    }

    return "gesture_" + HashToKey(canonical);
  }

  fn GenerateTextKey(const StringView text, const StringView context) -> String {
    return "text_" + HashToKey(std::format("{}:{}", NormalizePhrase(text), context));
  }

  AvatarCache::AvatarCache(const SharedPointer<IKeyValueStore>& store, const SharedPointer<IClock>& clock, const AvatarCacheConfig& config)
    : m_signCache(String(SIGN_NAMESPACE), config.signCapacity, store, clock),
      m_animationCache(String(ANIMATION_NAMESPACE), config.animationCapacity, store, clock) {}

  fn AvatarCache::getSignRecognition(const StringView key) -> Option<CacheEntry<SignRecognition>> {
    return m_signCache.get(key);
  }

  fn AvatarCache::setSignRecognition(const StringView key, SignRecognition recognition) -> Unit {
    m_signCache.set(key, std::move(recognition));
  }

  fn AvatarCache::getAvatarAnimation(const StringView key) -> Option<CacheEntry<AvatarAnimation>> {
    return m_animationCache.get(key);
  }

  fn AvatarCache::setAvatarAnimation(const StringView key, AvatarAnimation animation) -> Unit {
    m_animationCache.set(key, std::move(animation));
  }

  fn AvatarCache::getMetrics() const -> CacheMetrics {
    const ContentCacheStats signStats      = m_signCache.stats();
    const ContentCacheStats animationStats = m_animationCache.stats();

    const u64 requests = signStats.totalRequests + animationStats.totalRequests;
    const u64 hits     = signStats.totalHits + animationStats.totalHits;

    return {
      .hitRate              = requests > 0 ? static_cast<f64>(hits) / static_cast<f64>(requests) : 0.0,
      .totalRequests        = requests,
      .totalHits            = hits,
      .cacheSize            = m_signCache.size() + m_animationCache.size(),
      .estimatedMemoryBytes = m_signCache.estimatedBytes() + m_animationCache.estimatedBytes(),
    };
  }

  fn AvatarCache::getMostUsed(const usize limit) const -> MostUsedKeys {
    return { .signs = m_signCache.mostUsed(limit), .animations = m_animationCache.mostUsed(limit) };
  }

  fn AvatarCache::purgeExpired() -> usize {
    return m_signCache.purgeExpired() + m_animationCache.purgeExpired();
  }

  fn AvatarCache::clearAll() -> Result<> {
    const Result<> signCleared      = m_signCache.clear();
    const Result<> animationCleared = m_animationCache.clear();

    if (!signCleared)
      return signCleared;

    if (!animationCleared)
      return animationCleared;

    info_log("Cleared sign and animation caches");

    return {};
  }
} // namespace signrelay::cache
