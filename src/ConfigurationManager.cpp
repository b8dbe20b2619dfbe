#include <cstdlib>
#include <stdexcept>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager()
{
    port            = static_cast<unsigned short>(readInt("TRAINS_PORT", DEFAULT_PORT, 1, 65535));
    fontPath        = readString("TRAINS_FONT", DEFAULT_FONT);
    timeZone        = readString("TRAINS_TZ", DEFAULT_TZ);
    refreshInterval = std::chrono::seconds(readInt("TRAINS_REFRESH_SECONDS", DEFAULT_REFRESH_SECONDS, 10, 86400));
}

int ConfigurationManager::readInt(char const* name, int fallback, int min, int max)
{
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;

    std::size_t used = 0;
    int value = 0;
    try
    {
        value = std::stoi(env, &used);
    }
    catch (std::exception const&)
    {
        throw std::runtime_error(std::string(name) + " must be an integer.");
    }

    if (env[used] != '\0')
        throw std::runtime_error(std::string(name) + " must be an integer.");
    if (value < min || value > max)
        throw std::runtime_error(std::string(name) + " out of range.");

    return value;
}

std::string ConfigurationManager::readString(char const* name, std::string const& fallback)
{
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;
    return env;
}

unsigned short ConfigurationManager::getPort() const noexcept { return port; }
std::string const& ConfigurationManager::getFontPath() const noexcept { return fontPath; }
std::string const& ConfigurationManager::getTimeZone() const noexcept { return timeZone; }
std::chrono::seconds ConfigurationManager::getRefreshInterval() const noexcept { return refreshInterval; }
