// include/morlock/config/config.hpp
// @brief INI-like configuration for themes, rendering and logging.
// @invariant Unknown sections and keys are ignored; invalid values keep defaults.
// @ownership Config is a plain value; the loader borrows the file path.
#pragma once

#include "morlock/render/style.hpp"
#include "morlock/util/log.hpp"

#include <string>

namespace morlock::config
{

/// @brief Colours used for cells painted with render::kDefault.
struct ThemeConfig
{
    render::Color fg{};
    render::Color bg{};
};

struct RenderConfig
{
    bool truecolor{true};
};

struct LogConfig
{
    util::LogLevel level{util::LogLevel::Info};
};

struct Config
{
    ThemeConfig theme{};
    RenderConfig render{};
    LogConfig log{};
};

/// @brief Load configuration from @p path into @p out.
/// @return False when the file cannot be opened; @p out is untouched then.
bool loadFromFile(const std::string &path, Config &out);

/// @brief Parse "#rrggbb", a palette name ("red"), a palette index, or "default".
bool parseColor(const std::string &s, render::Color &out);

/// @brief Install the configured log level.
void applyLogging(const Config &cfg);

} // namespace morlock::config
