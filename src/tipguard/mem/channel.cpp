/**
 * @file channel.cpp
 * @brief Explicit template instantiations for Channel to reduce code bloat.
*/

#include "tipguard/mem/channel.hpp"
#include "tipguard/health/collaborators.hpp"
#include "tipguard/health/head_poller.hpp"
namespace tipguard::mem {

    /// Explicit instantiations of Channel for the element types used by the core.
    /// This ensures one compiled instance instead of every TU instantiating its own.

    template class Channel<int>;                                // For unit tests
    template class Channel<tipguard::health::HeadResult>;       // poller fan-in
    template class Channel<tipguard::health::TransportFailure>; // WS failures
    template class Channel<tipguard::health::WsCommand>;        // reconnect requests
} // namespace tipguard::mem
