#include <SignRelay/Utils/Error.hpp>
#include <SignRelay/Utils/Logging.hpp>
#include <SignRelay/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using signrelay::utils::error::RelayError;
using signrelay::utils::logging::Bold;
using signrelay::utils::logging::Colorize;
using signrelay::utils::logging::GetLevelColor;
using signrelay::utils::logging::GetLevelString;
using signrelay::utils::logging::GetRuntimeLogLevel;
using signrelay::utils::logging::Italic;
using signrelay::utils::logging::LogColor;
using signrelay::utils::logging::LogLevel;
using signrelay::utils::logging::LogLevelConst;
using signrelay::utils::logging::SetRuntimeLogLevel;
using signrelay::utils::types::i32;
using signrelay::utils::types::String;
using signrelay::utils::types::StringView;
using enum signrelay::utils::error::RelayErrorCode;

class LoggingUtilsTest : public Test {};

TEST_F(LoggingUtilsTest, Colorize_RedText) {
  constexpr StringView textToColorize = "Hello, Red World!";
  constexpr LogColor   color          = LogColor::Red;

  const String expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<size_t>(color)));
  const String expectedSuffix = String(LogLevelConst::RESET_CODE);

  const String colorizedText = Colorize(textToColorize, color);

  EXPECT_TRUE(colorizedText.starts_with(expectedPrefix));
  EXPECT_NE(colorizedText.find(textToColorize), String::npos);
  EXPECT_TRUE(colorizedText.ends_with(expectedSuffix));
}

TEST_F(LoggingUtilsTest, Colorize_EmptyText) {
  constexpr StringView textToColorize;
  constexpr LogColor   color = LogColor::Green;

  const String expectedText = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<size_t>(color))) + String(LogLevelConst::RESET_CODE);

  EXPECT_EQ(Colorize(textToColorize, color), expectedText);
}

TEST_F(LoggingUtilsTest, Colorize_EveryPaletteEntryHasACode) {
  EXPECT_EQ(LogLevelConst::COLOR_CODE_LITERALS.size(), static_cast<size_t>(LogColor::White) + 1);

  for (const StringView code : LogLevelConst::COLOR_CODE_LITERALS)
    EXPECT_TRUE(code.starts_with("\033[38;5;"));
}

TEST_F(LoggingUtilsTest, Bold_SimpleText) {
  constexpr StringView textToBold = "This is bold.";

  const String expectedText = String(LogLevelConst::BOLD_START) + String(textToBold) + String(LogLevelConst::BOLD_END);

  EXPECT_EQ(Bold(textToBold), expectedText);
}

TEST_F(LoggingUtilsTest, Italic_SimpleText) {
  constexpr StringView textToItalicize = "This is italic.";

  const String expectedText = String(LogLevelConst::ITALIC_START) + String(textToItalicize) + String(LogLevelConst::ITALIC_END);

  EXPECT_EQ(Italic(textToItalicize), expectedText);
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicMagentaText) {
  constexpr StringView textToStyle = "Styled Text";
  constexpr LogColor   color       = LogColor::Magenta;

  String expectedText = String(LogLevelConst::ITALIC_START) + String(textToStyle) + String(LogLevelConst::ITALIC_END);
  expectedText        = String(LogLevelConst::BOLD_START) + expectedText + String(LogLevelConst::BOLD_END);
  expectedText        = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<size_t>(color))) + expectedText + String(LogLevelConst::RESET_CODE);

  EXPECT_EQ(Colorize(Bold(Italic(textToStyle)), color), expectedText);
}

TEST_F(LoggingUtilsTest, LevelStrings_AreFixedWidth) {
  for (const LogLevel level : { LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error })
    EXPECT_EQ(GetLevelString(level).size(), 5);

  EXPECT_EQ(GetLevelColor(LogLevel::Error), LogColor::Red);
  EXPECT_EQ(GetLevelColor(LogLevel::Warn), LogColor::Yellow);
}

TEST_F(LoggingUtilsTest, RuntimeLogLevel_RoundTrips) {
  const LogLevel previous = GetRuntimeLogLevel().load();

  SetRuntimeLogLevel(LogLevel::Debug);
  EXPECT_EQ(GetRuntimeLogLevel().load(), LogLevel::Debug);

  SetRuntimeLogLevel(LogLevel::Error);
  EXPECT_EQ(GetRuntimeLogLevel().load(), LogLevel::Error);

  SetRuntimeLogLevel(previous);
}

TEST_F(LoggingUtilsTest, RelayErrorCode_FormatsByName) {
  EXPECT_EQ(std::format("{}", MediationTimeout), "MediationTimeout");
  EXPECT_EQ(std::format("{}", PersistenceFailure), "PersistenceFailure");

  const RelayError error(std::make_error_code(std::errc::timed_out));
  EXPECT_EQ(error.code, Timeout);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
