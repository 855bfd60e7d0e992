#include "Config.hpp"

#include <filesystem>             // std::filesystem::{path, exists, create_directories}
#include <fstream>                // std::ofstream
#include <system_error>           // std::error_code
#include <toml++/impl/array.hpp>  // toml::array
#include <toml++/impl/parser.hpp> // toml::parse_file

#include <SignRelay/Utils/Env.hpp>

namespace fs = std::filesystem;

using namespace signrelay::utils::types;
using signrelay::utils::env::GetEnv;

namespace signrelay::config {
  namespace {
    constexpr CStr DEFAULT_CONFIG = R"toml(# SignRelay configuration

[pipeline]
mode = "deaf-to-hearing"     # or "hearing-to-deaf"
scenario = "default"         # "hospital", "emergency" or "default"
emergency_mode = true        # answer emergency and medical phrases without mediation
mediation_timeout_ms = 1500  # fall back after this long; must be below 2000
# fallback_phrase = "Please wait, I am trying to communicate."
learn_from_mediation = false
history_size = 5

[idle]
idle_timeout_ms = 3000
transition_duration_ms = 500

[cache]
backend = "sqlite"           # or "memory"
# path = "/var/lib/signrelay/cache.db"
sign_capacity = 100
animation_capacity = 50

# Extra vocabulary for the medical fast path:
# [[medical_terms]]
# phrase = "insulin"
# mediated = "I need my insulin"
# intent = "INSULIN"
)toml";

    fn GetConfigPath() -> fs::path {
      Vec<fs::path> possiblePaths;

      if (Result<PCStr> result = GetEnv("XDG_CONFIG_HOME"))
        possiblePaths.emplace_back(fs::path(*result) / "signrelay" / "config.toml");

      if (Result<PCStr> result = GetEnv("HOME")) {
        possiblePaths.emplace_back(fs::path(*result) / ".config" / "signrelay" / "config.toml");
        possiblePaths.emplace_back(fs::path(*result) / ".signrelay" / "config.toml");
      }

      possiblePaths.emplace_back(fs::path(".") / "config.toml");

      for (const fs::path& path : possiblePaths)
        if (std::error_code errc; fs::exists(path, errc) && !errc)
          return path;

      return possiblePaths.front();
    }

    fn CreateDefaultConfig(const fs::path& configPath) -> bool {
      std::error_code errc;

      fs::create_directories(configPath.parent_path(), errc);

      if (errc) {
        error_log("Failed to create config directory: {}", errc.message());
        return false;
      }

      std::ofstream file(configPath);

      if (!file) {
        error_log("Failed to open config file for writing: {}", configPath.string());
        return false;
      }

      file << DEFAULT_CONFIG;

      if (!file) {
        error_log("Failed to write to config file: {}", configPath.string());
        return false;
      }

      info_log("Created default config file at {}", configPath.string());

      return true;
    }

    fn PositiveOr(const toml::table& tbl, const StringView key, const i64 fallback) -> i64 {
      const Option<i64> value = tbl[key].value<i64>();

      if (!value)
        return fallback;

      if (*value <= 0) {
        error_log("Config value '{}' must be positive, got {}. Using {}.", key, *value, fallback);
        return fallback;
      }

      return *value;
    }
  } // namespace

  fn Pipeline::fromToml(const toml::table& tbl) -> Pipeline {
    Pipeline settings;

    if (const Option<String> mode = tbl["mode"].value<String>()) {
      if (const Option<pipeline::Mode> parsed = pipeline::ParseMode(*mode))
        settings.mode = *parsed;
      else
        error_log("Unknown mode '{}'. Accepted values are 'deaf-to-hearing' and 'hearing-to-deaf'.", *mode);
    }

    if (const Option<String> scenario = tbl["scenario"].value<String>()) {
      if (const Option<pipeline::Scenario> parsed = pipeline::ParseScenario(*scenario))
        settings.scenario = *parsed;
      else
        error_log("Unknown scenario '{}'. Accepted values are 'hospital', 'emergency' and 'default'.", *scenario);
    }

    settings.emergencyMode      = tbl["emergency_mode"].value_or(true);
    settings.learnFromMediation = tbl["learn_from_mediation"].value_or(false);
    settings.historySize        = static_cast<usize>(PositiveOr(tbl, "history_size", 5));
    settings.mediationTimeoutMs = PositiveOr(tbl, "mediation_timeout_ms", settings.mediationTimeoutMs);

    if (settings.mediationTimeoutMs > MAX_MEDIATION_TIMEOUT_MS) {
      error_log("mediation_timeout_ms must stay below 2000, got {}. Using 1500.", settings.mediationTimeoutMs);
      settings.mediationTimeoutMs = 1500;
    }

    if (const Option<String> fallback = tbl["fallback_phrase"].value<String>(); fallback && !fallback->empty())
      settings.fallbackPhrase = *fallback;

    return settings;
  }

  fn Idle::fromToml(const toml::table& tbl) -> Idle {
    Idle settings;

    settings.timings.idleTimeoutMs        = PositiveOr(tbl, "idle_timeout_ms", settings.timings.idleTimeoutMs);
    settings.timings.transitionDurationMs = PositiveOr(tbl, "transition_duration_ms", settings.timings.transitionDurationMs);

    return settings;
  }

  fn Cache::fromToml(const toml::table& tbl) -> Cache {
    using matchit::match, matchit::is, matchit::_;

    Cache settings;

    const String backend = tbl["backend"].value_or(String("sqlite"));

    // clang-format off
    settings.backend = match(backend)(
      is | "sqlite" = CacheBackend::Sqlite,
      is | "memory" = CacheBackend::Memory,
      is | _        = [&]() {
        error_log("Unknown cache backend '{}'. Accepted values are 'sqlite' and 'memory'.", backend);
        return CacheBackend::Sqlite;
      }
    );
    // clang-format on

    if (const Option<String> path = tbl["path"].value<String>(); path && !path->empty())
      settings.path = *path;

    settings.capacities.signCapacity      = static_cast<usize>(PositiveOr(tbl, "sign_capacity", 100));
    settings.capacities.animationCapacity = static_cast<usize>(PositiveOr(tbl, "animation_capacity", 50));

    return settings;
  }

  Config::Config(const toml::table& tbl) {
    const toml::node_view pipelineTbl = tbl["pipeline"];
    const toml::node_view idleTbl     = tbl["idle"];
    const toml::node_view cacheTbl    = tbl["cache"];

    this->pipeline = pipelineTbl.is_table() ? Pipeline::fromToml(*pipelineTbl.as_table()) : Pipeline {};
    this->idle     = idleTbl.is_table() ? Idle::fromToml(*idleTbl.as_table()) : Idle {};
    this->cache    = cacheTbl.is_table() ? Cache::fromToml(*cacheTbl.as_table()) : Cache {};

    if (const toml::array* terms = tbl["medical_terms"].as_array()) {
      for (const toml::node& node : *terms) {
        const toml::table* term = node.as_table();

        if (!term)
          continue;

        const Option<String> phrase   = (*term)["phrase"].value<String>();
        const Option<String> mediated = (*term)["mediated"].value<String>();

        if (!phrase || !mediated || phrase->empty() || mediated->empty()) {
          error_log("Skipping [[medical_terms]] entry without 'phrase' and 'mediated'");
          continue;
        }

        this->medicalTerms.push_back({ .phrase = *phrase, .mediated = *mediated, .intent = (*term)["intent"].value<String>() });
      }
    }
  }

  fn Config::getInstance(const Option<String>& overridePath) -> Config {
    try {
      fs::path configPath;

      if (overridePath)
        configPath = *overridePath;
      else {
        configPath = GetConfigPath();

        if (std::error_code errc; !fs::exists(configPath, errc)) {
          info_log("Config file not found at {}, creating defaults.", configPath.string());

          if (!CreateDefaultConfig(configPath))
            return {};
        }
      }

      const toml::table parsedConfig = toml::parse_file(configPath.string());

      debug_log("Config loaded from {}", configPath.string());

      return Config(parsedConfig);
    } catch (const Exception& e) {
      warn_log("Config loading failed: {}, using defaults", e.what());
      return {};
    }
  }
} // namespace signrelay::config
