#pragma once

#include "../Pipeline/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace signrelay::speech {
  namespace {
    using pipeline::Scenario;
    using utils::error::RelayError;
    using utils::types::f32;
    using utils::types::Fn;
    using utils::types::String;
    using utils::types::Unit;
  } // namespace

  struct VoiceProfile {
    f32 rate   = 1.0F;
    f32 pitch  = 1.0F;
    f32 volume = 1.0F;
  };

  /**
   * @brief Voice settings for a scenario: calmer in hospital, faster in an emergency.
   */
  fn VoiceProfileFor(Scenario scenario) -> VoiceProfile;

  struct SpeechRequest {
    String       text;
    Scenario     scenario = Scenario::Default;
    VoiceProfile profile;

    Fn<void()>                  onStart; ///< Audio started.
    Fn<void()>                  onEnd;   ///< Audio finished or was cancelled.
    Fn<void(const RelayError&)> onError; ///< Synthesis failed; onEnd is not called.
  };

  /**
   * @class ISpeechOutput
   * @brief Text-to-speech sink.
   *
   * Callbacks may run synchronously inside speak() or later on any thread.
   * Only one utterance plays at a time.
   */
  class ISpeechOutput {
   public:
    virtual ~ISpeechOutput() = default;

    ISpeechOutput(const ISpeechOutput&)                = delete;
    ISpeechOutput(ISpeechOutput&&)                     = delete;
    fn operator=(const ISpeechOutput&)->ISpeechOutput& = delete;
    fn operator=(ISpeechOutput&&)->ISpeechOutput&      = delete;

    virtual fn speak(SpeechRequest request) -> Unit = 0;

    /**
     * @brief Stops the current utterance, if any.
     */
    virtual fn cancel() -> Unit = 0;

   protected:
    ISpeechOutput() = default;
  };
} // namespace signrelay::speech
