/**
 * @file rpc_codec.cpp
 * @brief jsoncpp-backed decoding of `eth_blockNumber` responses.
 */
#include "tipguard/health/node_client.hpp"

#include <json/json.h>

#include <cstdint>
#include <memory>
#include <string>

namespace tipguard::health {

namespace {

// "0x" followed by 1..16 hex digits; Ethereum quantities have no leading zeros
// but nodes in the wild send them, so they are accepted.
bool parse_hex_quantity(const std::string& s, BlockNumber& out) noexcept {
    if (s.size() < 3 || s.size() > 18) return false;
    if (s[0] != '0' || (s[1] != 'x' && s[1] != 'X')) return false;
    BlockNumber v = 0;
    for (std::size_t i = 2; i < s.size(); ++i) {
        const char c = s[i];
        std::uint64_t d = 0;
        if (c >= '0' && c <= '9')      d = static_cast<std::uint64_t>(c - '0');
        else if (c >= 'a' && c <= 'f') d = static_cast<std::uint64_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') d = static_cast<std::uint64_t>(c - 'A' + 10);
        else return false;
        v = (v << 4) | d;
    }
    out = v;
    return true;
}

} // namespace

tipguard_detail::expected<BlockNumber, FetchError>
parse_block_number_response(std::string_view body) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    const char* begin = body.data();
    if (!reader->parse(begin, begin + body.size(), &root, &errs) || !root.isObject()) {
        return tipguard_detail::unexpected(FetchError::Malformed);
    }
    if (root.isMember("error")) {
        return tipguard_detail::unexpected(FetchError::Malformed);
    }
    const Json::Value& result = root["result"];
    if (!result.isString()) {
        return tipguard_detail::unexpected(FetchError::Malformed);
    }

    BlockNumber head = 0;
    if (!parse_hex_quantity(result.asString(), head)) {
        return tipguard_detail::unexpected(FetchError::Malformed);
    }
    return head;
}

} // namespace tipguard::health
