#pragma once
#include <string>
#include <chrono>

class ConfigurationManager
{
private:
    unsigned short port;
    std::string fontPath;
    std::string timeZone;
    std::chrono::seconds refreshInterval;

    static int readInt(char const* name, int fallback, int min, int max);
    static std::string readString(char const* name, std::string const& fallback);

public:
    ConfigurationManager();
    static inline const std::string AMTRAK_HOST    = "api-v3.amtraker.com";
    static inline const std::string AMTRAK_PORT    = "443";
    static inline const std::string API_PREFIX     = "/v3";
    static inline const std::string DEFAULT_FONT   = "data/departure.json";
    static inline const std::string DEFAULT_TZ     = "America/New_York";
    static constexpr int DEFAULT_PORT              = 8080;
    static constexpr int DEFAULT_REFRESH_SECONDS   = 5 * 60;

    [[nodiscard]] unsigned short getPort() const noexcept;
    [[nodiscard]] std::string const& getFontPath() const noexcept;
    [[nodiscard]] std::string const& getTimeZone() const noexcept;
    [[nodiscard]] std::chrono::seconds getRefreshInterval() const noexcept;
};
