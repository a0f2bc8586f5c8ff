#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overridden by a JSON file.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tipguard/compat/expected.hpp"
#include "tipguard/config/constants.hpp"
#include "tipguard/health/health_monitor.hpp"

namespace tipguard::config {

    /** @struct EndpointConfig
     *  @brief One upstream node as written in the config file.
     */
    struct EndpointConfig {
        std::string url;     ///< HTTP JSON-RPC endpoint
        std::string ws_url;  ///< WebSocket endpoint (optional)
    };

    /** @struct MonitorConfig
     *  @brief Aggregate of everything the health core reads.
     */
    struct MonitorConfig {
        tipguard::health::HealthSettings health;             ///< Interval + per-query ttl
        bool health_check{constants::HEALTH_CHECK_ENABLED};  ///< Run the health loop
        bool is_ws{constants::WS_MODE_ENABLED};              ///< Every endpoint has a ws_url
        std::vector<EndpointConfig> rpc;                     ///< Upstream nodes
    };

    /** @enum ConfigError
     *  @brief Why a configuration could not be loaded.
     */
    enum class ConfigError : uint8_t {
        FileNotFound = 1, ///< Path missing or unreadable
        ParseError,       ///< Not valid JSON / not an object
        InvalidValue      ///< Known key with the wrong type or range
    };

    std::string_view to_string(ConfigError e) noexcept;

    /// Decimal unsigned integer from a command-line argument. Empty input,
    /// signs, trailing characters or overflow are ConfigError::InvalidValue.
    tipguard_detail::expected<uint64_t, ConfigError> parse_uint(std::string_view text) noexcept;

    /** @class Loader
     *  @brief Source of health configuration (defaults or parsed files).
     *
     *  Recognized keys (all optional):
     *  @code{.json}
     *  { "health_check": true, "health_check_interval_ms": 2000, "ttl_ms": 300,
     *    "rpc": [ { "url": "https://a.example", "ws_url": "wss://a.example" } ] }
     *  @endcode
     */
    class Loader {
    public:
        /// Named defaults from constants.hpp, no endpoints.
        static MonitorConfig defaults();

        /// Parse @p path; missing keys keep their defaults.
        static tipguard_detail::expected<MonitorConfig, ConfigError>
        load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static tipguard_detail::expected<MonitorConfig, ConfigError>
        load_from_string(std::string_view json);
    };

} // namespace tipguard::config
