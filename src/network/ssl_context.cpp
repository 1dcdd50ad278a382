#include "network/ssl_context.hpp"
#include <boost/asio/ssl/context.hpp>

namespace draftlink::network {

std::shared_ptr<boost::asio::ssl::context> create_local_client_ssl_context() {
    auto ctx = std::make_shared<boost::asio::ssl::context>(
        boost::asio::ssl::context::tls_client
    );

    ctx->set_verify_mode(boost::asio::ssl::verify_none);

    ctx->set_options(
        boost::asio::ssl::context::default_workarounds |
        boost::asio::ssl::context::no_sslv2 |
        boost::asio::ssl::context::no_sslv3 |
        boost::asio::ssl::context::single_dh_use
    );

    return ctx;
}

}  // namespace draftlink::network
