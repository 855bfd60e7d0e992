#pragma once

#include <SignRelay/Speech/SpeechOutput.hpp>
#include <SignRelay/Utils/Types.hpp>

namespace signrelay::cli {
  /**
   * @class ConsoleSpeechOutput
   * @brief Speech sink for terminals without a synthesizer: prints each utterance.
   *
   * Start and end are reported synchronously from speak().
   */
  class ConsoleSpeechOutput final : public speech::ISpeechOutput {
   public:
    ConsoleSpeechOutput() = default;

    fn speak(speech::SpeechRequest request) -> utils::types::Unit override;
    fn cancel() -> utils::types::Unit override;
  };
} // namespace signrelay::cli
