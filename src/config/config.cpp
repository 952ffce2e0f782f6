// src/config/config.cpp
// @brief INI-like configuration loader implementation.
// @invariant Reads sections [theme], [render] and [log].
// @ownership Loader does not own external resources beyond file path.

#include "morlock/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>

namespace morlock::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool parse_bool(const std::string &s, bool &out)
{
    const std::string v = lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
    {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off")
    {
        out = false;
        return true;
    }
    return false;
}

bool parse_hex(const std::string &hex, render::Color &out)
{
    if (hex.size() != 6 ||
        !std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c); }))
    {
        return false;
    }
    unsigned v = 0;
    std::istringstream iss(hex);
    iss >> std::hex >> v;
    if (iss.fail())
    {
        return false;
    }
    out = render::Color::rgb(static_cast<uint8_t>((v >> 16) & 0xFF),
                             static_cast<uint8_t>((v >> 8) & 0xFF),
                             static_cast<uint8_t>(v & 0xFF));
    return true;
}

void warn(const std::string &path, int line, const std::string &what)
{
    util::logWarn(path + ":" + std::to_string(line) + ": " + what);
}

} // namespace

bool parseColor(const std::string &s, render::Color &out)
{
    const std::string v = lower(trim(s));
    if (v.empty())
    {
        return false;
    }
    if (v[0] == '#')
    {
        return parse_hex(v.substr(1), out);
    }
    if (v == "default")
    {
        out = render::kDefault;
        return true;
    }
    static const char *const kNames[] = {
        "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"};
    for (unsigned i = 0; i < 8; ++i)
    {
        if (v == kNames[i])
        {
            out = render::Color::indexed(static_cast<uint8_t>(i));
            return true;
        }
    }
    if (std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); }) &&
        v.size() <= 3)
    {
        const int idx = std::stoi(v);
        if (idx <= 255)
        {
            out = render::Color::indexed(static_cast<uint8_t>(idx));
            return true;
        }
    }
    return false;
}

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        util::logWarn("config: cannot open " + path);
        return false;
    }
    std::string line;
    std::string section;
    int lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            warn(path, lineno, "expected key = value");
            continue;
        }
        const std::string key = lower(trim(trimmed.substr(0, eq)));
        const std::string value = trim(trimmed.substr(eq + 1));

        if (section == "theme")
        {
            render::Color col;
            if (!parseColor(value, col))
            {
                warn(path, lineno, "invalid colour '" + value + "'");
                continue;
            }
            if (key == "fg")
                out.theme.fg = col;
            else if (key == "bg")
                out.theme.bg = col;
        }
        else if (section == "render")
        {
            if (key == "truecolor" && !parse_bool(value, out.render.truecolor))
            {
                warn(path, lineno, "invalid boolean '" + value + "'");
            }
        }
        else if (section == "log")
        {
            if (key == "level")
            {
                if (auto level = util::parseLogLevel(value))
                    out.log.level = *level;
                else
                    warn(path, lineno, "invalid log level '" + value + "'");
            }
        }
    }
    return true;
}

void applyLogging(const Config &cfg)
{
    util::setLogLevel(cfg.log.level);
}

} // namespace morlock::config
