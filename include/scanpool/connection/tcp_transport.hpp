#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <variant>

#include "scanpool/config.hpp"
#include "scanpool/connection/transport.hpp"

namespace scanpool {

    /// @brief Non-blocking liveness check of a socket descriptor.
    /// @return False on POLLERR/POLLHUP/POLLNVAL/POLLRDHUP, or when the peer
    /// has already sent EOF.
    bool descriptor_is_healthy(int fd) noexcept;

    /**
     * @brief Blocking HTTP/HTTPS connection built on Boost.Beast streams.
     *
     * Every operation runs on a private io_context with its own deadline, so
     * connect, send and receive each get an independent ceiling.
     */
    class TcpTransport final : public Transport {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        TcpTransport(boost::asio::ssl::context& ssl_ctx,
                     TransportConfiguration cfg);

        TcpTransport(const TcpTransport&) = delete;
        TcpTransport& operator=(const TcpTransport&) = delete;
        TcpTransport(TcpTransport&&) = delete;
        TcpTransport& operator=(TcpTransport&&) = delete;

        ~TcpTransport() noexcept override;

        /// @brief Resolve, connect and (for secure keys) handshake.
        Status open(const EndpointKey& key);

        bool is_open() const noexcept override;
        bool probe() const override;
        void close() noexcept override;
        Result<Response> exchange(const PreparedRequest& preq) override;

        /// @brief The socket descriptor, or -1 when not connected.
        int native_handle() const noexcept;

        const EndpointKey& endpoint() const noexcept { return endpoint_; }

       private:
        boost::system::error_code resolve(tcp::resolver::results_type& out);
        Status connect_plain(const tcp::resolver::results_type& results);
        Status connect_secure(const tcp::resolver::results_type& results);

        template <typename S>
        Result<Response> exchange_on(S& stream, const PreparedRequest& preq);

        /// @brief Run the io_context until the started operation completes.
        void run_pending();

        boost::asio::io_context ioc_{1};
        boost::asio::ssl::context& ssl_ctx_;
        TransportConfiguration cfg_;

        EndpointKey endpoint_{};
        boost::beast::flat_buffer buffer_{};

        Stream stream_;
    };

    /**
     * @brief Connector producing TcpTransport instances.
     * @note Owns the TLS client context shared by every secure connection.
     */
    class TcpConnector final : public Connector {
       public:
        /// @throws std::runtime_error when the TLS context can't be set up.
        explicit TcpConnector(TransportConfiguration cfg = {});

        Result<TransportPtr> connect(const EndpointKey& key) override;

        const TransportConfiguration& config() const noexcept { return cfg_; }

       private:
        TransportConfiguration cfg_;
        boost::asio::ssl::context ssl_ctx_;
    };

}  // namespace scanpool
