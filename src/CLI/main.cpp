#include <cstdlib>  // EXIT_SUCCESS, EXIT_FAILURE
#include <iostream> // std::{cin, getline}

#include <glaze/glaze.hpp>
#include <magic_enum/magic_enum.hpp>

#include <SignRelay/Avatar/IdleStateManager.hpp>
#include <SignRelay/Cache/AvatarCache.hpp>
#include <SignRelay/Cache/KeyValueStore.hpp>
#include <SignRelay/Cache/PhraseCache.hpp>
#include <SignRelay/Pipeline/Mediator.hpp>
#include <SignRelay/Pipeline/PipelineController.hpp>
#include <SignRelay/Utils/ArgumentParser.hpp>
#include <SignRelay/Utils/Clock.hpp>
#include <SignRelay/Utils/Error.hpp>
#include <SignRelay/Utils/Logging.hpp>
#include <SignRelay/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "Core/ConsoleSpeech.hpp"

using namespace signrelay::utils::types;
using namespace signrelay::utils::logging;
using namespace signrelay::pipeline;
using namespace signrelay::cache;

using signrelay::avatar::IdleStateManager;
using signrelay::config::Config;
using signrelay::utils::clock::IClock;
using signrelay::utils::clock::SystemClock;
using signrelay::utils::error::RelayError;

namespace signrelay::cli {
  /**
   * @brief Everything --stats prints.
   */
  struct StatsReport {
    PhraseCacheStats emergencyPhrases;
    PhraseCacheStats medicalTerms;
    CacheMetrics     contentCache;
    PipelineMetrics  pipeline;
  };
} // namespace signrelay::cli

namespace glz {
  template <>
  struct meta<signrelay::cache::PhraseCacheStats> {
    using T = signrelay::cache::PhraseCacheStats;

    // clang-format off
    static constexpr detail::Object value = object(
      "totalLookups",        &T::totalLookups,
      "cacheHits",           &T::cacheHits,
      "cacheMisses",         &T::cacheMisses,
      "hitRate",             &T::hitRate,
      "averageLookupMicros", &T::averageLookupMicros
    );
    // clang-format on
  };

  template <>
  struct meta<signrelay::cache::CacheMetrics> {
    using T = signrelay::cache::CacheMetrics;

    // clang-format off
    static constexpr detail::Object value = object(
      "hitRate",              &T::hitRate,
      "totalRequests",        &T::totalRequests,
      "totalHits",            &T::totalHits,
      "cacheSize",            &T::cacheSize,
      "estimatedMemoryBytes", &T::estimatedMemoryBytes
    );
    // clang-format on
  };

  template <>
  struct meta<signrelay::pipeline::PipelineMetrics> {
    using T = signrelay::pipeline::PipelineMetrics;

    // clang-format off
    static constexpr detail::Object value = object(
      "cycles",             &T::cycles,
      "fastPathHits",       &T::fastPathHits,
      "mediations",         &T::mediations,
      "mediationFailures",  &T::mediationFailures,
      "mediationTimeouts",  &T::mediationTimeouts,
      "superseded",         &T::superseded,
      "ignored",            &T::ignored,
      "lastElapsedMs",      &T::lastElapsedMs,
      "maxFastPathElapsed", &T::maxFastPathElapsed
    );
    // clang-format on
  };

  template <>
  struct meta<signrelay::cli::StatsReport> {
    using T = signrelay::cli::StatsReport;

    static constexpr detail::Object value =
      object("emergencyPhrases", &T::emergencyPhrases, "medicalTerms", &T::medicalTerms, "contentCache", &T::contentCache, "pipeline", &T::pipeline);
  };
} // namespace glz

namespace {
  fn OpenStore(const signrelay::config::Cache& settings, const SharedPointer<IClock>& clock) -> SharedPointer<IKeyValueStore> {
    using signrelay::config::CacheBackend;

    if (settings.backend == CacheBackend::Memory)
      return std::make_shared<InMemoryStore>();

    const std::filesystem::path dbPath = settings.path ? std::filesystem::path(*settings.path) : DefaultStorePath();

    if (Result<UniquePointer<SqliteStore>> store = SqliteStore::open(dbPath, clock))
      return std::move(*store);
    else
      warn_at(store.error());

    warn_log("Falling back to an in-memory content cache");

    return std::make_shared<InMemoryStore>();
  }

  fn PrintStats(const signrelay::cli::StatsReport& report, const bool prettyJson) -> Unit {
    String jsonStr;

    glz::error_ctx errorContext =
      prettyJson
      ? glz::write<glz::opts { .prettify = true }>(report, jsonStr)
      : glz::write_json(report, jsonStr);

    if (errorContext)
      error_log("Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));
    else
      Println(jsonStr);
  }

  fn JoinSigns(const Vec<String>& signs) -> String {
    String joined;

    for (const String& sign : signs) {
      if (!joined.empty())
        joined += ' ';

      joined += sign;
    }

    return joined;
  }
} // namespace

fn main(const i32 argc, char* argv[]) -> i32 try {
  using signrelay::utils::argparse::ArgumentParser;

  ArgumentParser parser(SIGNRELAY_VERSION, "signrelay");

  parser
    .addArguments("-V", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag();

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level.")
    .defaultValue(LogLevel::Info);

  parser
    .addArguments("-c", "--config")
    .help("Read configuration from this file instead of the user config directory.")
    .defaultValue(String(""));

  parser
    .addArguments("-m", "--mode")
    .help("Conversation direction. Overrides [pipeline].mode.")
    .choices({ "deaf-to-hearing", "hearing-to-deaf" })
    .defaultValue(String(""));

  parser
    .addArguments("-s", "--scenario")
    .help("Conversation setting. Overrides [pipeline].scenario.")
    .choices({ "hospital", "emergency", "default" })
    .defaultValue(String(""));

  parser
    .addArguments("--no-emergency")
    .help("Send every phrase to mediation, skipping the emergency and medical tables.")
    .flag();

  parser
    .addArguments("-i", "--input")
    .help("Process this one phrase instead of reading lines from standard input.")
    .defaultValue(String(""));

  parser
    .addArguments("--clear-cache")
    .help("Remove every cached sign recognition and avatar animation, in memory and on disk.")
    .flag();

  parser
    .addArguments("--stats")
    .help("Print phrase, content cache and pipeline statistics as JSON before exiting.")
    .flag();

  parser
    .addArguments("--pretty")
    .help("Pretty-print JSON output. Only valid when --stats is used.")
    .flag();

  const Vec<CStr> args(argv, argv + argc);

  if (Result<bool> parsed = parser.parseArgs(args); !parsed) {
    error_at(parsed.error());
    return EXIT_FAILURE;
  } else if (!*parsed)
    return EXIT_SUCCESS;

  SetRuntimeLogLevel(parser.get<bool>("-V") ? LogLevel::Debug : parser.getEnum<LogLevel>("--log-level"));

  const String configPath = parser.get<String>("--config");

  Config config = Config::getInstance(configPath.empty() ? None : Some(configPath));

  if (const String mode = parser.get<String>("--mode"); !mode.empty())
    config.pipeline.mode = ParseMode(mode).value_or(config.pipeline.mode);

  if (const String scenario = parser.get<String>("--scenario"); !scenario.empty())
    config.pipeline.scenario = ParseScenario(scenario).value_or(config.pipeline.scenario);

  if (parser.get<bool>("--no-emergency"))
    config.pipeline.emergencyMode = false;

  const SharedPointer<IClock> clock = std::make_shared<SystemClock>();

  const auto avatarCache = std::make_shared<AvatarCache>(OpenStore(config.cache, clock), clock, config.cache.capacities);

  if (parser.get<bool>("--clear-cache")) {
    if (Result<> cleared = avatarCache->clearAll(); !cleared) {
      error_at(cleared.error());
      return EXIT_FAILURE;
    }

    Println("Cleared the sign and animation caches.");
    return EXIT_SUCCESS;
  }

  if (const usize purged = avatarCache->purgeExpired(); purged > 0)
    debug_log("Purged {} expired content cache entries", purged);

  const auto emergencyPhrases = std::make_shared<PhraseCache>("emergency", DefaultEmergencyPhrases(), true);
  const auto medicalTerms     = std::make_shared<PhraseCache>("medical", DefaultMedicalTerms(), false);

  for (const signrelay::config::MedicalTerm& term : config.medicalTerms)
    if (Result<> added = medicalTerms->addTerm(term.phrase, term.mediated, term.intent, 1.0F); !added)
      warn_at(added.error());

  const auto idle = std::make_shared<IdleStateManager>(config.idle.timings, clock);

  idle->setCallbacks({
    .onIdleStart       = [] { debug_log("Avatar is idle"); },
    .onIdleEnd         = [] { debug_log("Avatar is leaving idle"); },
    .onTransitionStart = [] { debug_log("Avatar transition started"); },
    .onTransitionEnd   = [] { debug_log("Avatar transition finished"); },
  });

  PipelineController controller(
    {
      .emergencyPhrases = emergencyPhrases,
      .medicalTerms     = medicalTerms,
      .avatarCache      = avatarCache,
      .mediator         = std::make_shared<OfflineMediator>(),
      .speech           = std::make_shared<signrelay::cli::ConsoleSpeechOutput>(),
      .idle             = idle,
      .clock            = clock,
    },
    config.pipeline.toPipelineConfig()
  );

  const PipelineContext context { .mode = config.pipeline.mode, .scenario = config.pipeline.scenario };

  const auto statusSubscription = controller.statusChannel().subscribe([](const PipelineStatus& status) {
    debug_log("Status: {}", status);
  });

  const auto errorSubscription = controller.errorChannel().subscribe([](const RelayError& error) {
    warn_log("{} ({})", error.message, error.code);
  });

  const auto subtitleSubscription = controller.subtitleChannel().subscribe([&context](const String& text) {
    if (context.mode == Mode::HearingToDeaf)
      Println("{} {}", Colorize("[subtitle]", LogColor::Yellow), text);
  });

  debug_log("Pipeline ready ({}, {}, emergency mode {})", context.mode, context.scenario, config.pipeline.emergencyMode ? "on" : "off");

  const auto process = [&](const String& line) -> Unit {
    InputEvent event = context.mode == Mode::DeafToHearing
      ? InputEvent(GestureInput { .intent = "", .phrase = line })
      : InputEvent(SpeechInput { .transcript = line });

    const CycleOutcome outcome = controller.processInput(std::move(event), context, config.pipeline.emergencyMode).get();

    if (outcome.path == CyclePath::Ignored)
      return;

    debug_log("Cycle {} finished via {} in {} ms", outcome.cycleId, magic_enum::enum_name(outcome.path), outcome.elapsedMs);

    if (outcome.signIntent)
      Println("{} {}", Colorize("[sign]", LogColor::Magenta), *outcome.signIntent);

    if (outcome.animation)
      Println("{} {}", Colorize("[avatar]", LogColor::Magenta), JoinSigns(outcome.animation->payload.signSequence));
  };

  if (const String input = parser.get<String>("--input"); !input.empty())
    process(input);
  else
    for (String line; std::getline(std::cin, line);)
      process(line);

  if (parser.get<bool>("--stats"))
    PrintStats(
      {
        .emergencyPhrases = emergencyPhrases->getStats(),
        .medicalTerms     = medicalTerms->getStats(),
        .contentCache     = avatarCache->getMetrics(),
        .pipeline         = controller.getMetrics(),
      },
      parser.get<bool>("--pretty")
    );

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
