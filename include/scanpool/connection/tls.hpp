#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <stdexcept>
#include <string>

namespace scanpool {

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system CA store and select the verification mode.
    /// @throws std::runtime_error when the default verify paths can't be set.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        ssl_context.set_verify_mode(verify_peer
                                        ? boost::asio::ssl::verify_peer
                                        : boost::asio::ssl::verify_none);
    }

}  // namespace scanpool
