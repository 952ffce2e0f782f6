// tests/test_config.cpp
// @brief Verify configuration loader parses theme, render and log settings.
// @invariant Invalid values keep their defaults while valid lines still apply.
// @ownership Test owns configuration data and the log capture stream.

#include "morlock/config/config.hpp"
#include "morlock/render/style.hpp"
#include "morlock/util/log.hpp"

#include "tests/TestHarness.hpp"

#include <sstream>
#include <string>

using morlock::config::applyLogging;
using morlock::config::Config;
using morlock::config::loadFromFile;
using morlock::config::parseColor;
using morlock::render::Color;
using morlock::util::LogLevel;

TEST(Config, LoadsSampleFile)
{
    Config cfg;
    ASSERT_TRUE(loadFromFile(CONFIG_INI, cfg));
    EXPECT_EQ(cfg.theme.fg, Color::rgb(200, 200, 200));
    EXPECT_EQ(cfg.theme.bg, morlock::render::kBlack);
    EXPECT_FALSE(cfg.render.truecolor);
    EXPECT_EQ(cfg.log.level, LogLevel::Debug);

    applyLogging(cfg);
    EXPECT_EQ(morlock::util::logLevel(), LogLevel::Debug);
    morlock::util::setLogLevel(LogLevel::Info);
}

TEST(Config, InvalidValuesKeepDefaults)
{
    std::ostringstream captured;
    morlock::util::setLogSink(&captured);
    Config cfg;
    const bool ok = loadFromFile(CONFIG_BAD_INI, cfg);
    morlock::util::setLogSink(nullptr);

    ASSERT_TRUE(ok);
    EXPECT_TRUE(cfg.theme.fg.isDefault());
    EXPECT_EQ(cfg.theme.bg, Color::indexed(17));
    EXPECT_TRUE(cfg.render.truecolor);
    EXPECT_EQ(cfg.log.level, LogLevel::Info);

    const std::string log = captured.str();
    EXPECT_TRUE(log.find("[WARN]") != std::string::npos);
    EXPECT_TRUE(log.find("bad.ini:2: invalid colour 'chartreuse'") != std::string::npos);
    EXPECT_TRUE(log.find("bad.ini:4: expected key = value") != std::string::npos);
    EXPECT_TRUE(log.find("invalid boolean 'maybe'") != std::string::npos);
    EXPECT_TRUE(log.find("invalid log level 'loud'") != std::string::npos);
}

TEST(Config, MissingFileFails)
{
    std::ostringstream captured;
    morlock::util::setLogSink(&captured);
    Config cfg;
    cfg.render.truecolor = false;
    const bool ok = loadFromFile("/nonexistent/morlock.ini", cfg);
    morlock::util::setLogSink(nullptr);

    EXPECT_FALSE(ok);
    EXPECT_FALSE(cfg.render.truecolor);
    EXPECT_TRUE(captured.str().find("cannot open") != std::string::npos);
}

TEST(Config, ParseColorForms)
{
    Color c;
    EXPECT_TRUE(parseColor("#FF8000", c));
    EXPECT_EQ(c, Color::rgb(255, 128, 0));
    EXPECT_TRUE(parseColor(" Yellow ", c));
    EXPECT_EQ(c, morlock::render::kYellow);
    EXPECT_TRUE(parseColor("255", c));
    EXPECT_EQ(c, Color::indexed(255));
    EXPECT_TRUE(parseColor("default", c));
    EXPECT_TRUE(c.isDefault());

    EXPECT_FALSE(parseColor("", c));
    EXPECT_FALSE(parseColor("#12345", c));
    EXPECT_FALSE(parseColor("#12345g", c));
    EXPECT_FALSE(parseColor("256", c));
    EXPECT_FALSE(parseColor("-1", c));
    EXPECT_FALSE(parseColor("purple", c));
}

int main(int argc, char **argv)
{
    morlock_test::init(&argc, argv);
    return morlock_test::run_all_tests();
}
