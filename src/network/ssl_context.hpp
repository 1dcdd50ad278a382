#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace draftlink::network {

/// TLS client context for the game client's loopback API.
/// The client serves a self-signed certificate, so peer verification is off.
/// Use this context only for loopback connections to the client.
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_local_client_ssl_context();

}  // namespace draftlink::network
