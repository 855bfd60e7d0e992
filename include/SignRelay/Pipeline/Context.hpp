#pragma once

#include <format>      // std::formatter
#include <matchit.hpp> // matchit::{match, is, _}

#include "../Utils/Types.hpp"

namespace signrelay::pipeline {
  namespace {
    using utils::types::None;
    using utils::types::Option;
    using utils::types::StringView;
    using utils::types::u8;
  } // namespace

  /**
   * @brief Direction of the conversation.
   */
  enum class Mode : u8 {
    DeafToHearing, ///< Signs in, speech out.
    HearingToDeaf, ///< Speech in, avatar signing out.
  };

  /**
   * @brief Setting the conversation takes place in. Selects the voice profile.
   */
  enum class Scenario : u8 {
    Hospital,
    Emergency,
    Default,
  };

  /**
   * @brief Per-input context. Immutable for the lifetime of one cycle.
   */
  struct PipelineContext {
    Mode     mode     = Mode::DeafToHearing;
    Scenario scenario = Scenario::Default;
  };

  inline fn ModeName(const Mode mode) -> StringView {
    using matchit::match, matchit::is, matchit::_;

    return match(mode)(
      is | Mode::HearingToDeaf = "hearing-to-deaf",
      is | _                   = "deaf-to-hearing"
    );
  }

  inline fn ScenarioName(const Scenario scenario) -> StringView {
    using matchit::match, matchit::is, matchit::_;

    return match(scenario)(
      is | Scenario::Hospital  = "hospital",
      is | Scenario::Emergency = "emergency",
      is | _                   = "default"
    );
  }

  inline fn ParseMode(const StringView name) -> Option<Mode> {
    if (name == ModeName(Mode::DeafToHearing))
      return Mode::DeafToHearing;

    if (name == ModeName(Mode::HearingToDeaf))
      return Mode::HearingToDeaf;

    return None;
  }

  inline fn ParseScenario(const StringView name) -> Option<Scenario> {
    for (const Scenario scenario : { Scenario::Hospital, Scenario::Emergency, Scenario::Default })
      if (name == ScenarioName(scenario))
        return scenario;

    return None;
  }
} // namespace signrelay::pipeline

template <>
struct std::formatter<signrelay::pipeline::Mode> : std::formatter<std::string_view> {
  fn format(const signrelay::pipeline::Mode mode, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(signrelay::pipeline::ModeName(mode), ctx);
  }
};

template <>
struct std::formatter<signrelay::pipeline::Scenario> : std::formatter<std::string_view> {
  fn format(const signrelay::pipeline::Scenario scenario, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(signrelay::pipeline::ScenarioName(scenario), ctx);
  }
};
