#include <Plm/Utils/Logging.hpp>
#include <Plm/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using plm::utils::logging::GetLevelTag;
using plm::utils::logging::GetLogLevelPtr;
using plm::utils::logging::GetRuntimeLogLevel;
using plm::utils::logging::LogColor;
using plm::utils::logging::LogLevel;
using plm::utils::logging::LogLevelConst;
using plm::utils::logging::SetLogLevelPtr;
using plm::utils::logging::SetRuntimeLogLevel;
using plm::utils::logging::ShouldUseStderr;
using plm::utils::logging::Stylize;
using plm::utils::types::i32;
using plm::utils::types::String;
using plm::utils::types::StringView;
using plm::utils::types::Unit;
using plm::utils::types::usize;

class LoggingTest : public Test {
 protected:
  LogLevel m_savedLevel = LogLevel::Info;

  fn SetUp() -> Unit override {
    m_savedLevel = GetRuntimeLogLevel();
  }

  fn TearDown() -> Unit override {
    SetLogLevelPtr(nullptr);
    SetRuntimeLogLevel(m_savedLevel);
  }
};

TEST_F(LoggingTest, PlainWhiteTextIsLeftAlone) {
  EXPECT_EQ(Stylize("registry ready", {}), "registry ready");
}

TEST_F(LoggingTest, ColoredTextIsWrappedInColorAndReset) {
  const String styled = Stylize("alpha", { .color = LogColor::Red });

  EXPECT_EQ(styled, String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(LogColor::Red))) + "alpha" + LogLevelConst::RESET_CODE);
}

TEST_F(LoggingTest, CombinedStyleOrderIsBoldItalicColor) {
  const String styled = Stylize("beta", { .color = LogColor::Cyan, .bold = true, .italic = true });

  const String expected = String(LogLevelConst::BOLD_START) + LogLevelConst::ITALIC_START +
    String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(LogColor::Cyan))) + "beta" + LogLevelConst::RESET_CODE;

  EXPECT_EQ(styled, expected);
}

TEST_F(LoggingTest, LevelTagsAreDistinct) {
  EXPECT_EQ(GetLevelTag(LogLevel::Debug), LogLevelConst::DEBUG_STYLED);
  EXPECT_EQ(GetLevelTag(LogLevel::Info), LogLevelConst::INFO_STYLED);
  EXPECT_EQ(GetLevelTag(LogLevel::Warn), LogLevelConst::WARN_STYLED);
  EXPECT_EQ(GetLevelTag(LogLevel::Error), LogLevelConst::ERROR_STYLED);
}

TEST_F(LoggingTest, OnlyWarningsAndErrorsGoToStderr) {
  EXPECT_FALSE(ShouldUseStderr(LogLevel::Debug));
  EXPECT_FALSE(ShouldUseStderr(LogLevel::Info));
  EXPECT_TRUE(ShouldUseStderr(LogLevel::Warn));
  EXPECT_TRUE(ShouldUseStderr(LogLevel::Error));
}

TEST_F(LoggingTest, RuntimeLevelCanBeChanged) {
  SetRuntimeLogLevel(LogLevel::Error);
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Error);

  SetRuntimeLogLevel(LogLevel::Debug);
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Debug);
}

TEST_F(LoggingTest, SharedLevelPointerFollowsTheHost) {
  LogLevel hostLevel = LogLevel::Warn;

  // What a dynamically loaded plugin does once the loader hands it the host's level.
  SetLogLevelPtr(&hostLevel);
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Warn);

  hostLevel = LogLevel::Debug;
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Debug);

  SetRuntimeLogLevel(LogLevel::Error);
  EXPECT_EQ(hostLevel, LogLevel::Error);
}

TEST_F(LoggingTest, LocalLevelPointerIsStable) {
  EXPECT_EQ(GetLogLevelPtr(), GetLogLevelPtr());
  EXPECT_NE(GetLogLevelPtr(), nullptr);
}

TEST_F(LoggingTest, SuppressedLevelsDoNotThrow) {
  SetRuntimeLogLevel(LogLevel::Error);

  EXPECT_NO_THROW(debug_log("hidden {}", 1));
  EXPECT_NO_THROW(info_log("hidden {}", StringView("too")));
  EXPECT_NO_THROW(warn_log("hidden"));
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
