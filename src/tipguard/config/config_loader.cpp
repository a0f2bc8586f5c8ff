/**
* @file config_loader.cpp
 * @brief jsoncpp-backed loader over the named defaults.
 */
#include "tipguard/config/config_loader.hpp"
#include "tipguard/config/constants.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <system_error>

#include <json/json.h>
#include <spdlog/spdlog.h>

namespace tipguard::config {
    using namespace tipguard::config::constants;

    namespace {

    bool read_millis(const Json::Value& root, const char* key, std::chrono::milliseconds& out) {
        if (!root.isMember(key)) return true;
        const Json::Value& v = root[key];
        if (!v.isUInt64() || v.asUInt64() == 0) return false;
        // Larger values would wrap to a negative duration.
        if (v.asUInt64() > static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
            return false;
        }
        out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v.asUInt64()));
        return true;
    }

    bool read_endpoints(const Json::Value& root, std::vector<EndpointConfig>& out) {
        if (!root.isMember("rpc")) return true;
        const Json::Value& list = root["rpc"];
        if (!list.isArray()) return false;
        for (const auto& item : list) {
            if (!item.isObject() || !item["url"].isString()) return false;
            EndpointConfig ep;
            ep.url = item["url"].asString();
            if (item.isMember("ws_url")) {
                if (!item["ws_url"].isString()) return false;
                ep.ws_url = item["ws_url"].asString();
            }
            out.push_back(std::move(ep));
        }
        return true;
    }

    } // namespace

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file_not_found";
            case ConfigError::ParseError:   return "parse_error";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    MonitorConfig Loader::defaults() {
        MonitorConfig mc;
        mc.health = tipguard::health::HealthSettings{}; // picks defaults from constants
        mc.health_check = HEALTH_CHECK_ENABLED;
        mc.is_ws = WS_MODE_ENABLED;
        return mc;
    }

    tipguard_detail::expected<MonitorConfig, ConfigError>
    Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            spdlog::error("config: cannot open {}", path);
            return tipguard_detail::unexpected(ConfigError::FileNotFound);
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return load_from_string(ss.str());
    }

    tipguard_detail::expected<MonitorConfig, ConfigError>
    Loader::load_from_string(std::string_view json) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errs;
        if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs) || !root.isObject()) {
            spdlog::error("config: parse error: {}", errs);
            return tipguard_detail::unexpected(ConfigError::ParseError);
        }

        MonitorConfig mc = defaults();
        if (root.isMember("health_check")) {
            if (!root["health_check"].isBool()) return tipguard_detail::unexpected(ConfigError::InvalidValue);
            mc.health_check = root["health_check"].asBool();
        }
        if (!read_millis(root, "health_check_interval_ms", mc.health.interval) ||
            !read_millis(root, "ttl_ms", mc.health.ttl) ||
            !read_endpoints(root, mc.rpc)) {
            spdlog::error("config: invalid value");
            return tipguard_detail::unexpected(ConfigError::InvalidValue);
        }

        // WS transports are only used when every node has one.
        mc.is_ws = !mc.rpc.empty() &&
                   std::all_of(mc.rpc.begin(), mc.rpc.end(),
                               [](const EndpointConfig& ep) { return !ep.ws_url.empty(); });
        return mc;
    }

    tipguard_detail::expected<uint64_t, ConfigError> parse_uint(std::string_view text) noexcept {
        uint64_t value = 0;
        const char* first = text.data();
        const char* last  = text.data() + text.size();
        const auto [end, ec] = std::from_chars(first, last, value);
        if (text.empty() || ec != std::errc{} || end != last) {
            return tipguard_detail::unexpected(ConfigError::InvalidValue);
        }
        return value;
    }

} // namespace tipguard::config
