#include "ConsoleSpeech.hpp"

#include <format> // std::format

#include <SignRelay/Utils/Logging.hpp>

using namespace signrelay::utils::types;
using namespace signrelay::utils::logging;

namespace signrelay::cli {
  fn ConsoleSpeechOutput::speak(speech::SpeechRequest request) -> Unit {
    if (request.onStart)
      request.onStart();

    Println(
      "{} {}",
      Colorize(std::format("[speak {:.1f}x, {}]", request.profile.rate, request.scenario), LogColor::Cyan),
      Bold(request.text)
    );

    if (request.onEnd)
      request.onEnd();
  }

  fn ConsoleSpeechOutput::cancel() -> Unit {
    // Utterances finish inside speak(), so there is never one to stop.
  }
} // namespace signrelay::cli
