#include <thread> // std::thread

#include <SignRelay/Cache/PhraseCache.hpp>
#include <SignRelay/Utils/Error.hpp>
#include <SignRelay/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using namespace signrelay::utils::types;
using namespace signrelay::cache;
using enum signrelay::utils::error::RelayErrorCode;

class PhraseCacheTest : public Test {
 protected:
  PhraseCache m_emergency { "emergency", DefaultEmergencyPhrases(), true };
  PhraseCache m_medical { "medical", DefaultMedicalTerms(), false };
};

TEST_F(PhraseCacheTest, NormalizePhrase_FoldsCaseSpacingAndPunctuation) {
  EXPECT_EQ(NormalizePhrase("  Can't   BREATHE! "), "cant breathe");
  EXPECT_EQ(NormalizePhrase("Call\t911"), "call 911");
  EXPECT_EQ(NormalizePhrase("chest_pain"), "chest_pain");
  EXPECT_EQ(NormalizePhrase("?!."), "");
  EXPECT_EQ(NormalizePhrase(""), "");
}

TEST_F(PhraseCacheTest, Lookup_VariantsHitTheSameEntry) {
  for (const StringView variant : { "Help", "HELP!", "  help  ", "help." }) {
    const PhraseLookup lookup = m_emergency.lookup(variant);

    ASSERT_TRUE(lookup.hit) << variant;
    ASSERT_TRUE(lookup.entry.has_value());
    EXPECT_EQ(lookup.entry->mediatedText, "I need help");
    EXPECT_EQ(lookup.entry->signIntent, Some(String("HELP")));
    EXPECT_FLOAT_EQ(lookup.entry->confidence, 1.0F);
  }
}

TEST_F(PhraseCacheTest, Lookup_ApostropheVariantsMatch) {
  const PhraseLookup lookup = m_emergency.lookup("CANT breathe");

  ASSERT_TRUE(lookup.hit);
  EXPECT_EQ(lookup.entry->mediatedText, "I cannot breathe properly");
}

TEST_F(PhraseCacheTest, Lookup_MissReturnsNoEntry) {
  const PhraseLookup lookup = m_emergency.lookup("where is the cafeteria");

  EXPECT_FALSE(lookup.hit);
  EXPECT_FALSE(lookup.entry.has_value());
  EXPECT_GE(lookup.lookupTimeMicros, 0.0);
}

TEST_F(PhraseCacheTest, Stats_CountHitsAndMisses) {
  std::ignore = m_medical.lookup("chest pain");
  std::ignore = m_medical.lookup("Chest Pain!");
  std::ignore = m_medical.lookup("something else");

  const PhraseCacheStats stats = m_medical.getStats();

  EXPECT_EQ(stats.totalLookups, 3);
  EXPECT_EQ(stats.cacheHits, 2);
  EXPECT_EQ(stats.cacheMisses, 1);
  EXPECT_NEAR(stats.hitRate, 2.0 / 3.0, 1e-9);

  m_medical.resetStats();

  const PhraseCacheStats reset = m_medical.getStats();

  EXPECT_EQ(reset.totalLookups, 0);
  EXPECT_DOUBLE_EQ(reset.hitRate, 0.0);
}

TEST_F(PhraseCacheTest, IsCached_DoesNotTouchStats) {
  EXPECT_TRUE(m_medical.isCached("FEVER"));
  EXPECT_FALSE(m_medical.isCached("purple elephant"));
  EXPECT_EQ(m_medical.getStats().totalLookups, 0);
}

TEST_F(PhraseCacheTest, AddTerm_IsVisibleImmediately) {
  ASSERT_TRUE(m_medical.addTerm("Insulin Shot", "I need my insulin", Some(String("INSULIN")), 0.9F));

  const PhraseLookup lookup = m_medical.lookup("insulin   shot?");

  ASSERT_TRUE(lookup.hit);
  EXPECT_EQ(lookup.entry->phrase, "insulin shot");
  EXPECT_EQ(lookup.entry->mediatedText, "I need my insulin");
  EXPECT_FLOAT_EQ(lookup.entry->confidence, 0.9F);
}

TEST_F(PhraseCacheTest, Lookup_MedicalTermIgnoresCaseAndSpacing) {
  const PhraseLookup plain  = m_medical.lookup("chest pain");
  const PhraseLookup padded = m_medical.lookup("  CHEST   PAIN  ");

  ASSERT_TRUE(plain.hit);
  ASSERT_TRUE(padded.hit);
  EXPECT_EQ(plain.entry->phrase, padded.entry->phrase);
  EXPECT_EQ(padded.entry->mediatedText, "I am experiencing chest pain");
}

TEST_F(PhraseCacheTest, AddTerm_MissBeforeHitAfter) {
  EXPECT_FALSE(m_medical.lookup("super rare disease").hit);

  ASSERT_TRUE(m_medical.addTerm("super rare disease", "It is a rare condition"));

  const PhraseLookup lookup = m_medical.lookup("super rare disease");

  ASSERT_TRUE(lookup.hit);
  EXPECT_EQ(lookup.entry->mediatedText, "It is a rare condition");
}

TEST_F(PhraseCacheTest, AddTerm_OverwritesExistingEntry) {
  ASSERT_TRUE(m_medical.addTerm("fever", "My temperature is high"));

  EXPECT_EQ(m_medical.lookup("fever").entry->mediatedText, "My temperature is high");
  EXPECT_FLOAT_EQ(m_medical.lookup("fever").entry->confidence, PhraseCache::DEFAULT_LEARNED_CONFIDENCE);
}

TEST_F(PhraseCacheTest, AddTerm_RejectsFrozenTable) {
  const usize before = m_emergency.size();

  const Result<> result = m_emergency.addTerm("fire", "There is a fire");

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, NotSupported);
  EXPECT_EQ(m_emergency.size(), before);
  EXPECT_TRUE(m_emergency.isFrozen());
}

TEST_F(PhraseCacheTest, AddTerm_RejectsEmptyPhrase) {
  const Result<> result = m_medical.addTerm("  ?! ", "nothing");

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, InvalidArgument);
}

TEST_F(PhraseCacheTest, GetMostUsed_OrdersByHits) {
  for (i32 i = 0; i < 3; ++i)
    std::ignore = m_medical.lookup("fever");

  std::ignore = m_medical.lookup("headache");

  const Vec<Pair<PhraseEntry, u64>> used = m_medical.getMostUsed(5);

  ASSERT_EQ(used.size(), 2);
  EXPECT_EQ(used[0].first.phrase, "fever");
  EXPECT_EQ(used[0].second, 3);
  EXPECT_EQ(used[1].first.phrase, "headache");

  EXPECT_EQ(m_medical.getMostUsed(1).size(), 1);
}

TEST_F(PhraseCacheTest, DefaultTables_DoNotOverlap) {
  for (const PhraseSeed& seed : DefaultEmergencyPhrases())
    EXPECT_FALSE(m_medical.isCached(seed.phrase)) << seed.phrase;

  EXPECT_EQ(m_emergency.size(), DefaultEmergencyPhrases().size());
}

TEST_F(PhraseCacheTest, ConcurrentReadersAndWriter) {
  Vec<std::thread> readers;

  for (i32 i = 0; i < 4; ++i)
    readers.emplace_back([this] {
      for (i32 j = 0; j < 500; ++j)
        std::ignore = m_medical.lookup("fever");
    });

  for (i32 i = 0; i < 50; ++i)
    ASSERT_TRUE(m_medical.addTerm(std::format("term {}", i), "learned"));

  for (std::thread& reader : readers)
    reader.join();

  EXPECT_EQ(m_medical.getStats().cacheHits, 2000);
  EXPECT_TRUE(m_medical.isCached("term 49"));
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
