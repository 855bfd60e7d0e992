#pragma once

#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include <SignRelay/Avatar/IdleStateManager.hpp>
#include <SignRelay/Cache/AvatarCache.hpp>
#include <SignRelay/Pipeline/Context.hpp>
#include <SignRelay/Pipeline/PipelineController.hpp>
#include <SignRelay/Utils/Logging.hpp>
#include <SignRelay/Utils/Types.hpp>

namespace signrelay::config {
  namespace {
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::u8;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct Pipeline
   * @brief Holds the [pipeline] section.
   */
  struct Pipeline {
    pipeline::Mode     mode               = pipeline::Mode::DeafToHearing;
    pipeline::Scenario scenario           = pipeline::Scenario::Default;
    bool               emergencyMode      = true;  ///< Answer emergency and medical phrases from the built-in tables.
    i64                mediationTimeoutMs = 1500;  ///< Must stay below the 2 s fallback ceiling.
    Option<String>     fallbackPhrase;             ///< Spoken when mediation fails; the raw input otherwise.
    bool               learnFromMediation = false; ///< Add successful mediations to the medical table.
    usize              historySize        = 5;     ///< Delivered texts passed to the mediator as context.

    static constexpr i64 MAX_MEDIATION_TIMEOUT_MS = 1999;

    /**
     * @brief Parses a TOML table to create a Pipeline instance.
     * @param tbl The TOML table to parse, containing [pipeline].
     * @return A Pipeline instance with the parsed values, or defaults otherwise.
     */
    static fn fromToml(const toml::table& tbl) -> Pipeline;

    [[nodiscard]] fn toPipelineConfig() const -> pipeline::PipelineConfig {
      return {
        .mediationTimeoutMs = mediationTimeoutMs,
        .fallbackPhrase     = fallbackPhrase,
        .learnFromMediation = learnFromMediation,
        .historySize        = historySize,
      };
    }
  };

  /**
   * @struct Idle
   * @brief Holds the [idle] section.
   */
  struct Idle {
    avatar::IdleConfig timings;

    static fn fromToml(const toml::table& tbl) -> Idle;
  };

  enum class CacheBackend : u8 {
    Sqlite,
    Memory,
  };

  /**
   * @struct Cache
   * @brief Holds the [cache] section.
   */
  struct Cache {
    CacheBackend             backend = CacheBackend::Sqlite;
    Option<String>           path;   ///< SQLite file; the user cache directory when unset.
    cache::AvatarCacheConfig capacities;

    static fn fromToml(const toml::table& tbl) -> Cache;
  };

  /**
   * @struct MedicalTerm
   * @brief One [[medical_terms]] entry, added to the built-in medical table at startup.
   */
  struct MedicalTerm {
    String         phrase;
    String         mediated;
    Option<String> intent;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    Pipeline         pipeline;     ///< Conversation and mediation settings.
    Idle             idle;         ///< Avatar idle timings.
    Cache            cache;        ///< Content cache storage.
    Vec<MedicalTerm> medicalTerms; ///< Site-specific medical vocabulary.

    Config() = default;

    /**
     * @brief Constructs a Config instance from a TOML table.
     * @param tbl The TOML table to parse, containing [pipeline], [idle], [cache] and [[medical_terms]].
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief Loads the configuration file.
     * @param overridePath File given with --config. Otherwise the user config
     * directory is searched and a default file is written if none exists.
     * @return The parsed configuration, or defaults if loading fails.
     */
    static fn getInstance(const Option<String>& overridePath = None) -> Config;
  };
} // namespace signrelay::config
