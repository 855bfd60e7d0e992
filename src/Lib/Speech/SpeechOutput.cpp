#include "SignRelay/Speech/SpeechOutput.hpp"

#include <matchit.hpp> // matchit::{match, is, _}

using signrelay::pipeline::Scenario;

namespace signrelay::speech {
  fn VoiceProfileFor(const Scenario scenario) -> VoiceProfile {
    using matchit::match, matchit::is, matchit::_;

    return match(scenario)(
      is | Scenario::Hospital  = VoiceProfile { .rate = 0.9F, .pitch = 1.0F, .volume = 1.0F },
      is | Scenario::Emergency = VoiceProfile { .rate = 1.1F, .pitch = 1.0F, .volume = 1.0F },
      is | _                   = VoiceProfile { .rate = 1.0F, .pitch = 1.0F, .volume = 1.0F }
    );
  }
} // namespace signrelay::speech
