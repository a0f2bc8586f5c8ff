#pragma once
/**
 * @file node_client.hpp
 * @brief Pluggable capability to answer: which block is this node at?
 * @details Transport-backed clients live with the request-serving layer; the
 *          health core only needs this one call.
 */

#include <chrono>
#include <string_view>

#include "tipguard/compat/expected.hpp"
#include "tipguard/health/error.hpp"
#include "tipguard/health/node.hpp"

namespace tipguard::health {

    class NodeClient {
    public:
        virtual ~NodeClient() = default;

        /**
         * @brief Fetch the node's current block number (`eth_blockNumber`).
         * @param timeout Budget the caller will wait. Implementations should
         *        honor it, but the poller bounds the wait either way and
         *        never starts a second call while one is still running.
         */
        virtual tipguard_detail::expected<BlockNumber, FetchError>
        block_number(std::chrono::milliseconds timeout) = 0;
    };

    /**
     * @brief Decode an `eth_blockNumber` JSON-RPC response body.
     * @details Accepts `{"jsonrpc":"2.0","id":..,"result":"0x<hex>"}`.
     *          A JSON-RPC `error` member, a missing/non-string `result` or a
     *          non-hex quantity yield FetchError::Malformed.
     */
    tipguard_detail::expected<BlockNumber, FetchError>
    parse_block_number_response(std::string_view body);

} // namespace tipguard::health
