#include "SignRelay/Cache/PhraseCache.hpp"

using signrelay::utils::types::Vec;

namespace signrelay::cache {
  fn DefaultEmergencyPhrases() -> const Vec<PhraseSeed>& {
    // clang-format off
    static const Vec<PhraseSeed> EMERGENCY_PHRASES = {
      { "help",                 "I need help",                      "HELP"                 },
      { "emergency",            "This is an emergency",             "EMERGENCY"            },
      { "urgent",               "This is urgent",                   "URGENT"               },
      { "call doctor",          "Please call a doctor",             "CALL_DOCTOR"          },
      { "call 911",             "Please call 911",                  "CALL_911"             },
      { "ambulance",            "I need an ambulance",              "AMBULANCE"            },
      { "heart attack",         "I think I'm having a heart attack", "HEART_ATTACK"        },
      { "stroke",               "I think I'm having a stroke",      "STROKE"               },
      { "allergic reaction",    "I'm having an allergic reaction",  "ALLERGIC_REACTION"    },
      { "can't move",           "I cannot move",                    "CANT_MOVE"            },
      { "can't breathe",        "I cannot breathe properly",        "CANT_BREATHE"         },
      { "difficulty breathing", "I have difficulty breathing",      "DIFFICULTY_BREATHING" },
      { "unconscious",          "I was unconscious",                "UNCONSCIOUS"          },
      { "bleeding",             "I am bleeding",                    "BLEEDING"             },
      { "broken bone",          "I think I have a broken bone",     "BROKEN_BONE"          },
    };
    // clang-format on

    return EMERGENCY_PHRASES;
  }

  fn DefaultMedicalTerms() -> const Vec<PhraseSeed>& {
    // clang-format off
    static const Vec<PhraseSeed> MEDICAL_TERMS = {
      // Pain and symptoms
      { "chest pain",          "I am experiencing chest pain", "CHEST_PAIN"       },
      { "severe pain",         "I have severe pain",           "SEVERE_PAIN"      },
      { "sharp pain",          "I feel sharp pain",            "SHARP_PAIN"       },
      { "dull pain",           "I have dull pain",             "DULL_PAIN"        },
      { "burning pain",        "I feel burning pain",          "BURNING_PAIN"     },
      { "throbbing pain",      "I have throbbing pain",        "THROBBING_PAIN"   },
      { "headache",            "I have a headache",            "HEADACHE"         },
      { "migraine",            "I have a migraine",            "MIGRAINE"         },
      { "nausea",              "I feel nauseous",              "NAUSEA"           },
      { "dizzy",               "I feel dizzy",                 "DIZZY"            },
      { "shortness of breath", "I have shortness of breath",   "SHORTNESS_BREATH" },
      { "fever",               "I have a fever",               "FEVER"            },
      { "chills",              "I have chills",                "CHILLS"           },
      { "fatigue",             "I feel very tired",            "FATIGUE"          },
      { "weakness",            "I feel weak",                  "WEAKNESS"         },

      // Anatomy
      { "head",     "my head",     "HEAD"     },
      { "neck",     "my neck",     "NECK"     },
      { "chest",    "my chest",    "CHEST"    },
      { "back",     "my back",     "BACK"     },
      { "stomach",  "my stomach",  "STOMACH"  },
      { "abdomen",  "my abdomen",  "ABDOMEN"  },
      { "arm",      "my arm",      "ARM"      },
      { "leg",      "my leg",      "LEG"      },
      { "hand",     "my hand",     "HAND"     },
      { "foot",     "my foot",     "FOOT"     },
      { "heart",    "my heart",    "HEART"    },
      { "lungs",    "my lungs",    "LUNGS"    },
      { "throat",   "my throat",   "THROAT"   },
      { "shoulder", "my shoulder", "SHOULDER" },
      { "knee",     "my knee",     "KNEE"     },
      { "ankle",    "my ankle",    "ANKLE"    },
      { "wrist",    "my wrist",    "WRIST"    },

      // Conversation
      { "yes",          "Yes",                   "YES"         },
      { "no",           "No",                    "NO"          },
      { "maybe",        "Maybe",                 "MAYBE"       },
      { "i don't know", "I don't know",          "DONT_KNOW"   },
      { "thank you",    "Thank you",             "THANK_YOU"   },
      { "please",       "Please",                "PLEASE"      },
      { "sorry",        "I'm sorry",             "SORRY"       },
      { "excuse me",    "Excuse me",             "EXCUSE_ME"   },
      { "hello",        "Hello",                 "HELLO"       },
      { "goodbye",      "Goodbye",               "GOODBYE"     },
      { "my name is",   "My name is",            "MY_NAME_IS"  },
      { "how are you",  "How are you?",          "HOW_ARE_YOU" },
      { "i'm fine",     "I'm fine",              "IM_FINE"     },
      { "not good",     "I'm not feeling good",  "NOT_GOOD"    },

      // History
      { "allergies",           "I have allergies",           "ALLERGIES"           },
      { "medications",         "I take medications",         "MEDICATIONS"         },
      { "diabetes",            "I have diabetes",            "DIABETES"            },
      { "high blood pressure", "I have high blood pressure", "HIGH_BLOOD_PRESSURE" },
      { "heart condition",     "I have a heart condition",   "HEART_CONDITION"     },
      { "asthma",              "I have asthma",              "ASTHMA"              },
      { "pregnant",            "I am pregnant",              "PREGNANT"            },
      { "surgery",             "I had surgery",              "SURGERY"             },
      { "insurance",           "I have insurance",           "INSURANCE"           },
      { "appointment",         "I have an appointment",      "APPOINTMENT"         },

      // Pain scale
      { "pain scale",   "On the pain scale", "PAIN_SCALE" },
      { "1 out of 10",  "1 out of 10",       "PAIN_1"     },
      { "2 out of 10",  "2 out of 10",       "PAIN_2"     },
      { "3 out of 10",  "3 out of 10",       "PAIN_3"     },
      { "4 out of 10",  "4 out of 10",       "PAIN_4"     },
      { "5 out of 10",  "5 out of 10",       "PAIN_5"     },
      { "6 out of 10",  "6 out of 10",       "PAIN_6"     },
      { "7 out of 10",  "7 out of 10",       "PAIN_7"     },
      { "8 out of 10",  "8 out of 10",       "PAIN_8"     },
      { "9 out of 10",  "9 out of 10",       "PAIN_9"     },
      { "10 out of 10", "10 out of 10",      "PAIN_10"    },

      // Time
      { "now",          "right now",           "NOW"          },
      { "today",        "today",               "TODAY"        },
      { "yesterday",    "yesterday",           "YESTERDAY"    },
      { "this morning", "this morning",        "THIS_MORNING" },
      { "last night",   "last night",          "LAST_NIGHT"   },
      { "few minutes",  "a few minutes ago",   "FEW_MINUTES"  },
      { "few hours",    "a few hours ago",     "FEW_HOURS"    },
      { "few days",     "a few days ago",      "FEW_DAYS"     },
      { "one week",     "about one week ago",  "ONE_WEEK"     },
    };
    // clang-format on

    return MEDICAL_TERMS;
  }
} // namespace signrelay::cache
