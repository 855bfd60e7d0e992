#include <algorithm> // std::ranges::{min_element, sort}
#include <random>    // std::{mt19937, uniform_int_distribution}

#include <SignRelay/Cache/AvatarCache.hpp>
#include <SignRelay/Cache/ContentCache.hpp>
#include <SignRelay/Cache/KeyValueStore.hpp>
#include <SignRelay/Utils/Error.hpp>
#include <SignRelay/Utils/Types.hpp>

#include "Support/ManualClock.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace signrelay::utils::types;
using namespace signrelay::cache;
using signrelay::test_support::ManualClock;
using signrelay::utils::clock::MS_PER_HOUR;
using signrelay::utils::error::RelayError;
using enum signrelay::utils::error::RelayErrorCode;

// NOLINTBEGIN(readability-identifier-naming)
class MockKeyValueStore : public IKeyValueStore {
 public:
  MOCK_METHOD(Result<Option<String>>, get, (StringView), (override));
  MOCK_METHOD(Result<>, set, (StringView, const String&), (override));
  MOCK_METHOD(Result<>, remove, (StringView), (override));
};
// NOLINTEND(readability-identifier-naming)

class ContentCacheTest : public Test {
 protected:
  SharedPointer<InMemoryStore> m_store = std::make_shared<InMemoryStore>();
  SharedPointer<ManualClock>   m_clock = std::make_shared<ManualClock>();

  fn makeSignCache(const usize capacity = 3) -> ContentCache<SignRecognition> {
    return ContentCache<SignRecognition>("test_signs", capacity, m_store, m_clock);
  }

  static fn recognition(const String& sign) -> SignRecognition {
    return { .recognizedSigns = { sign }, .confidence = 0.9F };
  }
};

TEST_F(ContentCacheTest, Get_MissOnEmptyCache) {
  ContentCache<SignRecognition> cache = makeSignCache();

  EXPECT_FALSE(cache.get("absent").has_value());

  const ContentCacheStats stats = cache.stats();
  EXPECT_EQ(stats.totalRequests, 1);
  EXPECT_EQ(stats.totalMisses, 1);
  EXPECT_EQ(stats.totalHits, 0);
}

TEST_F(ContentCacheTest, Get_HitBumpsUsageAndAccessTime) {
  ContentCache<SignRecognition> cache = makeSignCache();

  cache.set("a", recognition("HELLO"));
  const i64 createdAt = m_clock->now();

  m_clock->advance(1000);

  const Option<CacheEntry<SignRecognition>> first = cache.get("a");

  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->usageCount, 2);
  EXPECT_EQ(first->createdAt, createdAt);
  EXPECT_EQ(first->lastAccessedAt, createdAt + 1000);
  EXPECT_EQ(first->payload.recognizedSigns, Vec<String> { "HELLO" });

  EXPECT_EQ(cache.get("a")->usageCount, 3);
}

TEST_F(ContentCacheTest, Set_OverwriteResetsEntry) {
  ContentCache<SignRecognition> cache = makeSignCache();

  cache.set("a", recognition("ONE"));
  std::ignore = cache.get("a");

  m_clock->advance(50);
  cache.set("a", recognition("TWO"));

  const Option<CacheEntry<SignRecognition>> entry = cache.get("a");

  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->payload.recognizedSigns.front(), "TWO");
  EXPECT_EQ(entry->usageCount, 2);
  EXPECT_EQ(entry->createdAt, m_clock->now());
  EXPECT_EQ(cache.size(), 1);
}

TEST_F(ContentCacheTest, Set_EvictsLeastRecentlyAccessed) {
  ContentCache<SignRecognition> cache = makeSignCache(3);

  cache.set("a", recognition("A"));
  m_clock->advance(10);
  cache.set("b", recognition("B"));
  m_clock->advance(10);
  cache.set("c", recognition("C"));
  m_clock->advance(10);

  // "a" is the oldest insert but the most recent read.
  ASSERT_TRUE(cache.get("a").has_value());
  m_clock->advance(10);

  cache.set("d", recognition("D"));

  EXPECT_EQ(cache.size(), 3);
  EXPECT_TRUE(cache.get("a").has_value());
  EXPECT_FALSE(cache.get("b").has_value());
  EXPECT_TRUE(cache.get("c").has_value());
  EXPECT_TRUE(cache.get("d").has_value());
  EXPECT_EQ(cache.stats().evictions, 1);
}

TEST_F(ContentCacheTest, Set_EvictionIgnoresUsageCount) {
  ContentCache<SignRecognition> cache = makeSignCache(2);

  cache.set("popular", recognition("P"));

  for (i32 i = 0; i < 10; ++i)
    std::ignore = cache.get("popular");

  m_clock->advance(10);
  cache.set("recent", recognition("R"));
  m_clock->advance(10);
  cache.set("newest", recognition("N"));

  EXPECT_FALSE(cache.get("popular").has_value());
  EXPECT_TRUE(cache.get("recent").has_value());
}

TEST_F(ContentCacheTest, Set_TiesBreakByCreationThenKey) {
  ContentCache<SignRecognition> cache = makeSignCache(2);

  cache.set("b", recognition("B"));
  cache.set("a", recognition("A"));
  cache.set("c", recognition("C"));

  EXPECT_EQ(cache.size(), 2);
  EXPECT_FALSE(cache.get("a").has_value());
  EXPECT_TRUE(cache.get("b").has_value());
}

TEST_F(ContentCacheTest, Set_RandomSequenceMatchesLruModel) {
  constexpr usize CAPACITY = 4;

  struct Stamp {
    i64 createdAt;
    i64 lastAccessedAt;
  };

  ContentCache<SignRecognition> cache = makeSignCache(CAPACITY);
  Map<String, Stamp>            model;

  const Vec<String> keys { "a", "b", "c", "d", "e", "f", "g" };

  std::mt19937                       rng(20'240'611);
  std::uniform_int_distribution<i32> pickKey(0, static_cast<i32>(keys.size()) - 1);
  std::uniform_int_distribution<i32> pickOp(0, 2);
  std::uniform_int_distribution<i32> pickAdvance(0, 3);

  const auto cachedKeys = [&cache] {
    Vec<String> present;

    for (const auto& [key, usage] : cache.mostUsed(CAPACITY + 1))
      present.push_back(key);

    std::ranges::sort(present);
    return present;
  };

  for (i32 step = 0; step < 400; ++step) {
    m_clock->advance(pickAdvance(rng));

    const String& key = keys[static_cast<usize>(pickKey(rng))];
    const i64     now = m_clock->now();

    if (pickOp(rng) == 0) {
      const auto modelEntry = model.find(key);

      EXPECT_EQ(cache.get(key).has_value(), modelEntry != model.end()) << "step " << step << " get " << key;

      if (modelEntry != model.end())
        modelEntry->second.lastAccessedAt = now;

      continue;
    }

    cache.set(key, recognition(key));
    model.insert_or_assign(key, Stamp { .createdAt = now, .lastAccessedAt = now });

    if (model.size() > CAPACITY) {
      const auto victim = std::ranges::min_element(model, [](const auto& lhs, const auto& rhs) {
        if (lhs.second.lastAccessedAt != rhs.second.lastAccessedAt)
          return lhs.second.lastAccessedAt < rhs.second.lastAccessedAt;

        if (lhs.second.createdAt != rhs.second.createdAt)
          return lhs.second.createdAt < rhs.second.createdAt;

        return lhs.first < rhs.first;
      });

      model.erase(victim);
    }

    Vec<String> expected;

    for (const auto& [modelKey, stamp] : model)
      expected.push_back(modelKey);

    ASSERT_LE(cache.size(), CAPACITY) << "step " << step;
    ASSERT_EQ(cachedKeys(), expected) << "step " << step << " set " << key;
  }
}

TEST_F(ContentCacheTest, Get_ExpiresAfterOneDayRegardlessOfUse) {
  ContentCache<SignRecognition> cache = makeSignCache();

  cache.set("a", recognition("A"));

  m_clock->advance((24 * MS_PER_HOUR) - 1);
  ASSERT_TRUE(cache.get("a").has_value());

  m_clock->advance(1);
  EXPECT_FALSE(cache.get("a").has_value());
  EXPECT_EQ(cache.size(), 0);
}

TEST_F(ContentCacheTest, PurgeExpired_RemovesOnlyExpired) {
  ContentCache<SignRecognition> cache = makeSignCache();

  cache.set("old", recognition("O"));
  m_clock->advance(23 * MS_PER_HOUR);
  cache.set("fresh", recognition("F"));
  m_clock->advance(2 * MS_PER_HOUR);

  EXPECT_EQ(cache.purgeExpired(), 1);
  EXPECT_EQ(cache.size(), 1);
  EXPECT_TRUE(cache.get("fresh").has_value());
}

TEST_F(ContentCacheTest, Persistence_RestoresEntriesInANewInstance) {
  {
    ContentCache<SignRecognition> cache = makeSignCache();

    cache.set("a", recognition("A"));
    cache.set("b", recognition("B"));
  }

  ContentCache<SignRecognition> restored = makeSignCache();

  EXPECT_EQ(restored.size(), 2);

  const Option<CacheEntry<SignRecognition>> entry = restored.get("b");

  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->key, "b");
  EXPECT_EQ(entry->payload.recognizedSigns.front(), "B");
  EXPECT_FLOAT_EQ(entry->payload.confidence, 0.9F);
}

TEST_F(ContentCacheTest, Persistence_SkipsEntriesThatExpiredWhileStored) {
  {
    ContentCache<SignRecognition> cache = makeSignCache();
    cache.set("a", recognition("A"));
  }

  m_clock->advance(25 * MS_PER_HOUR);

  EXPECT_EQ(makeSignCache().size(), 0);
}

TEST_F(ContentCacheTest, Persistence_CorruptBlobStartsEmpty) {
  ASSERT_TRUE(m_store->set("test_signs", "definitely not beve"));

  ContentCache<SignRecognition> cache = makeSignCache();

  EXPECT_EQ(cache.size(), 0);

  cache.set("a", recognition("A"));
  EXPECT_TRUE(cache.get("a").has_value());
}

TEST_F(ContentCacheTest, Persistence_StoreFailuresKeepMemoryState) {
  auto store = std::make_shared<NiceMock<MockKeyValueStore>>();

  ON_CALL(*store, get(_)).WillByDefault(Return(Result<Option<String>>(Err(RelayError(PersistenceFailure, "disk gone")))));
  ON_CALL(*store, set(_, _)).WillByDefault(Return(Result<>(Err(RelayError(PersistenceFailure, "disk full")))));

  EXPECT_CALL(*store, set(StringView("test_signs"), _)).Times(2);

  ContentCache<SignRecognition> cache("test_signs", 3, store, m_clock);

  cache.set("a", recognition("A"));
  cache.set("b", recognition("B"));

  EXPECT_EQ(cache.size(), 2);
  EXPECT_TRUE(cache.get("a").has_value());
}

TEST_F(ContentCacheTest, Clear_RemovesMemoryAndStore) {
  ContentCache<SignRecognition> cache = makeSignCache();

  cache.set("a", recognition("A"));
  ASSERT_TRUE(cache.clear());

  EXPECT_EQ(cache.size(), 0);

  const Result<Option<String>> blob = m_store->get("test_signs");
  ASSERT_TRUE(blob);
  EXPECT_FALSE(blob->has_value());
}

TEST_F(ContentCacheTest, MostUsed_OrdersByUsageCount) {
  ContentCache<SignRecognition> cache = makeSignCache();

  cache.set("a", recognition("A"));
  cache.set("b", recognition("B"));
  std::ignore = cache.get("b");
  std::ignore = cache.get("b");
  std::ignore = cache.get("a");

  const Vec<Pair<String, u64>> used = cache.mostUsed(10);

  ASSERT_EQ(used.size(), 2);
  EXPECT_EQ(used[0], (Pair<String, u64>("b", 3)));
  EXPECT_EQ(used[1], (Pair<String, u64>("a", 2)));
}

class AvatarCacheTest : public Test {
 protected:
  SharedPointer<InMemoryStore> m_store = std::make_shared<InMemoryStore>();
  SharedPointer<ManualClock>   m_clock = std::make_shared<ManualClock>();
};

TEST_F(AvatarCacheTest, DefaultCapacities) {
  AvatarCache cache(m_store, m_clock);

  EXPECT_EQ(cache.signCache().capacity(), 100);
  EXPECT_EQ(cache.animationCache().capacity(), 50);
  EXPECT_EQ(cache.signCache().nameSpace(), SIGN_NAMESPACE);
  EXPECT_EQ(cache.animationCache().nameSpace(), ANIMATION_NAMESPACE);
}

TEST_F(AvatarCacheTest, AnimationCapacityIsEnforced) {
  AvatarCache cache(m_store, m_clock);

  for (i32 i = 0; i < 60; ++i) {
    cache.setAvatarAnimation(std::format("anim_{}", i), { .signSequence = { "HELLO" }, .rendering = VideoRendering { .videoPath = "hello.mp4" } });
    m_clock->advance(1);
  }

  EXPECT_EQ(cache.animationCache().size(), 50);
  EXPECT_FALSE(cache.getAvatarAnimation("anim_0").has_value());
  EXPECT_TRUE(cache.getAvatarAnimation("anim_59").has_value());
}

TEST_F(AvatarCacheTest, AnimationRenderingVariantSurvivesPersistence) {
  {
    AvatarCache cache(m_store, m_clock);

    cache.setAvatarAnimation("video", { .signSequence = { "PAIN", "CHEST" }, .rendering = VideoRendering { .videoPath = "/clips/pain.mp4" } });
    cache.setAvatarAnimation("procedural", { .signSequence = { "HELP" }, .rendering = ProceduralRendering { .animationPayload = { 1, 2, 3 } } });
  }

  AvatarCache restored(m_store, m_clock);

  const Option<CacheEntry<AvatarAnimation>> video      = restored.getAvatarAnimation("video");
  const Option<CacheEntry<AvatarAnimation>> procedural = restored.getAvatarAnimation("procedural");

  ASSERT_TRUE(video.has_value());
  ASSERT_TRUE(procedural.has_value());

  ASSERT_TRUE(std::holds_alternative<VideoRendering>(video->payload.rendering));
  EXPECT_EQ(std::get<VideoRendering>(video->payload.rendering).videoPath, "/clips/pain.mp4");
  EXPECT_EQ(video->payload.signSequence, (Vec<String> { "PAIN", "CHEST" }));

  ASSERT_TRUE(std::holds_alternative<ProceduralRendering>(procedural->payload.rendering));
  EXPECT_EQ(std::get<ProceduralRendering>(procedural->payload.rendering).animationPayload, (Vec<u8> { 1, 2, 3 }));
}

TEST_F(AvatarCacheTest, GetMetrics_AggregatesBothNamespaces) {
  AvatarCache cache(m_store, m_clock);

  cache.setSignRecognition("s", { .recognizedSigns = { "HELLO" }, .confidence = 0.8F });
  cache.setAvatarAnimation("a", { .signSequence = { "HELLO" }, .rendering = VideoRendering { .videoPath = "x.mp4" } });

  std::ignore = cache.getSignRecognition("s");
  std::ignore = cache.getSignRecognition("missing");
  std::ignore = cache.getAvatarAnimation("a");
  std::ignore = cache.getAvatarAnimation("missing");

  const CacheMetrics metrics = cache.getMetrics();

  EXPECT_EQ(metrics.totalRequests, 4);
  EXPECT_EQ(metrics.totalHits, 2);
  EXPECT_DOUBLE_EQ(metrics.hitRate, 0.5);
  EXPECT_EQ(metrics.cacheSize, 2);
  EXPECT_GT(metrics.estimatedMemoryBytes, 0);
}

TEST_F(AvatarCacheTest, ClearAll_EmptiesBothNamespaces) {
  AvatarCache cache(m_store, m_clock);

  cache.setSignRecognition("s", { .recognizedSigns = { "HELLO" }, .confidence = 0.8F });
  cache.setAvatarAnimation("a", { .signSequence = { "HELLO" }, .rendering = VideoRendering { .videoPath = "x.mp4" } });

  ASSERT_TRUE(cache.clearAll());

  EXPECT_EQ(cache.getMetrics().cacheSize, 0);
  EXPECT_FALSE(m_store->get(SIGN_NAMESPACE)->has_value());
  EXPECT_FALSE(m_store->get(ANIMATION_NAMESPACE)->has_value());

  AvatarCache reopened(m_store, m_clock);
  EXPECT_EQ(reopened.getMetrics().cacheSize, 0);
}

TEST_F(AvatarCacheTest, GenerateGestureKey_IsDeterministicAndPrecisionBound) {
  const Vec<HandPose> hands = {
    { { 0.1F, 0.2F, 0.3F }, { 0.4F, 0.5F, 0.6F } },
    { { 0.7F, 0.8F, 0.9F } },
  };

  const Vec<HandPose> jittered = {
    { { 0.10001F, 0.2F, 0.3F }, { 0.4F, 0.5F, 0.6F } },
    { { 0.7F, 0.8F, 0.9F } },
  };

  const Vec<HandPose> moved = {
    { { 0.2F, 0.2F, 0.3F }, { 0.4F, 0.5F, 0.6F } },
    { { 0.7F, 0.8F, 0.9F } },
  };

  const String key = GenerateGestureKey(hands);

  EXPECT_TRUE(key.starts_with("gesture_"));
  EXPECT_EQ(key, GenerateGestureKey(hands));
  EXPECT_EQ(key, GenerateGestureKey(jittered));
  EXPECT_NE(key, GenerateGestureKey(moved));
}

TEST_F(AvatarCacheTest, GenerateTextKey_NormalizesTextAndSeparatesScenarios) {
  EXPECT_EQ(GenerateTextKey("Chest pain!", "hospital"), GenerateTextKey("  chest   PAIN", "hospital"));
  EXPECT_NE(GenerateTextKey("chest pain", "hospital"), GenerateTextKey("chest pain", "emergency"));
  EXPECT_EQ(GenerateTextKey("hello"), GenerateTextKey("hello", "default"));
  EXPECT_TRUE(GenerateTextKey("hello").starts_with("text_"));
}

TEST_F(AvatarCacheTest, HashToKey_MatchesKnownFnv1aValues) {
  // FNV-1a 32: "" -> 0x811c9dc5, "a" -> 0xe40c292c
  EXPECT_EQ(HashToKey(""), "ztntfp");
  EXPECT_EQ(HashToKey("a"), "1r9wi7g");
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
