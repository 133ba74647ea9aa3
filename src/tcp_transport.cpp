#include "scanpool/connection/tcp_transport.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <boost/asio/ssl/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <cerrno>

#include "scanpool/connection/tls.hpp"
#include "scanpool/log.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace scanpool {

    namespace {

        Status transport_err(Error::Code code, const char* what,
                             const boost::system::error_code& ec) {
            if (ec == beast::error::timeout) code = Error::Code::Timeout;
            return Status::err(code, std::string(what) + ": " + ec.message());
        }

    }  // namespace

    bool descriptor_is_healthy(int fd) noexcept {
        if (fd < 0) return false;

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN | POLLRDHUP;

        const int rc = ::poll(&pfd, 1, 0);
        if (rc < 0) return false;
        if (rc == 0) return true;

        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL | POLLRDHUP)) {
            return false;
        }

        if (pfd.revents & POLLIN) {
            // Readable while idle: either stray bytes or an EOF
            char b;
            const ssize_t n = ::recv(fd, &b, 1, MSG_PEEK | MSG_DONTWAIT);
            if (n == 0) return false;
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;
        }
        return true;
    }

    TcpTransport::TcpTransport(boost::asio::ssl::context& ssl_ctx,
                               TransportConfiguration cfg)
        : ssl_ctx_(ssl_ctx), cfg_(std::move(cfg)) {}

    TcpTransport::~TcpTransport() noexcept { close(); }

    void TcpTransport::run_pending() {
        ioc_.restart();
        ioc_.run();
    }

    boost::system::error_code TcpTransport::resolve(
        tcp::resolver::results_type& out) {
        boost::system::error_code ec = net::error::would_block;
        bool timed_out = false;

        tcp::resolver resolver(ioc_);
        net::steady_timer timer(ioc_);
        timer.expires_after(cfg_.timeouts.connect_timeout);
        timer.async_wait([&](boost::system::error_code tec) {
            if (tec) return;  // cancelled, resolve finished first
            timed_out = true;
            resolver.cancel();
        });

        resolver.async_resolve(
            endpoint_.host, endpoint_.port_string(),
            [&](boost::system::error_code rec,
                tcp::resolver::results_type results) {
                ec = rec;
                out = std::move(results);
                timer.cancel();
            });

        run_pending();
        if (timed_out) return beast::error::timeout;
        return ec;
    }

    Status TcpTransport::open(const EndpointKey& key) {
        close();
        endpoint_ = key;

        tcp::resolver::results_type results;
        if (auto ec = resolve(results)) {
            return transport_err(Error::Code::ConnectionFailed,
                                 "Resolve failed", ec);
        }

        return endpoint_.secure ? connect_secure(results)
                                : connect_plain(results);
    }

    Status TcpTransport::connect_plain(
        const tcp::resolver::results_type& results) {
        auto& s = stream_.emplace<HttpStream>(ioc_.get_executor());

        boost::system::error_code ec = net::error::would_block;
        s.expires_after(cfg_.timeouts.connect_timeout);
        s.async_connect(results, [&ec](boost::system::error_code e,
                                       auto&&...) { ec = e; });
        run_pending();
        s.expires_never();

        if (ec) {
            close();
            return transport_err(Error::Code::ConnectionFailed,
                                 "Connect failed", ec);
        }

        if (cfg_.tcp_nodelay) {
            boost::system::error_code opt_ec;
            s.socket().set_option(tcp::no_delay(true), opt_ec);
        }
        return Status::ok();
    }

    Status TcpTransport::connect_secure(
        const tcp::resolver::results_type& results) {
        auto& s = stream_.emplace<HttpsStream>(ioc_.get_executor(), ssl_ctx_);
        auto& lowest = beast::get_lowest_layer(s);

        boost::system::error_code ec = net::error::would_block;
        lowest.expires_after(cfg_.timeouts.connect_timeout);
        lowest.async_connect(results, [&ec](boost::system::error_code e,
                                            auto&&...) { ec = e; });
        run_pending();

        if (ec) {
            close();
            return transport_err(Error::Code::ConnectionFailed,
                                 "Connect failed", ec);
        }

        if (cfg_.tcp_nodelay) {
            boost::system::error_code opt_ec;
            lowest.socket().set_option(tcp::no_delay(true), opt_ec);
        }

        if (!set_sni(s, endpoint_.host, ec)) {
            close();
            return transport_err(Error::Code::TlsHandshakeFailed,
                                 "SNI setup failed", ec);
        }

        ec = net::error::would_block;
        lowest.expires_after(cfg_.timeouts.connect_timeout);
        s.async_handshake(net::ssl::stream_base::client,
                          [&ec](boost::system::error_code e) { ec = e; });
        run_pending();
        lowest.expires_never();

        if (ec) {
            close();
            return transport_err(Error::Code::TlsHandshakeFailed,
                                 "TLS handshake failed", ec);
        }
        return Status::ok();
    }

    bool TcpTransport::is_open() const noexcept {
        return std::visit(
            [](auto const& s) -> bool {
                using T = std::decay_t<decltype(s)>;

                if constexpr (std::is_same_v<T, std::monostate>) {
                    return false;
                } else if constexpr (std::is_same_v<T, HttpStream>) {
                    return s.socket().is_open();
                } else {
                    return beast::get_lowest_layer(s).socket().is_open();
                }
            },
            stream_);
    }

    int TcpTransport::native_handle() const noexcept {
        return std::visit(
            [](auto& s) -> int {
                using T = std::decay_t<decltype(s)>;

                if constexpr (std::is_same_v<T, std::monostate>) {
                    return -1;
                } else if constexpr (std::is_same_v<T, HttpStream>) {
                    return static_cast<int>(s.socket().native_handle());
                } else {
                    return static_cast<int>(
                        beast::get_lowest_layer(s).socket().native_handle());
                }
            },
            const_cast<Stream&>(stream_));
    }

    bool TcpTransport::probe() const {
        if (!is_open()) return false;
        return descriptor_is_healthy(native_handle());
    }

    /// @note No TLS shutdown is performed, the TCP socket is just closed.
    void TcpTransport::close() noexcept {
        boost::system::error_code ec;

        if (std::holds_alternative<HttpStream>(stream_)) {
            auto& s = std::get<HttpStream>(stream_);
            s.socket().shutdown(tcp::socket::shutdown_both, ec);
            s.socket().close(ec);
        } else if (std::holds_alternative<HttpsStream>(stream_)) {
            auto& lowest =
                beast::get_lowest_layer(std::get<HttpsStream>(stream_));
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            lowest.socket().close(ec);
        }

        // mark transport as "no stream"
        stream_.emplace<std::monostate>();
    }

    template <typename S>
    Result<Response> TcpTransport::exchange_on(S& stream,
                                               const PreparedRequest& preq) {
        auto& lowest = beast::get_lowest_layer(stream);
        boost::system::error_code ec = net::error::would_block;

        lowest.expires_after(cfg_.timeouts.send_timeout);
        http::async_write(stream, preq.beast_req,
                          [&ec](boost::system::error_code e, std::size_t) {
                              ec = e;
                          });
        run_pending();
        if (ec) {
            close();
            return Result<Response>::err(
                transport_err(Error::Code::SendFailed, "Write failed", ec)
                    .error());
        }

        buffer_.consume(buffer_.size());  // clear but keep capacity
        http::response_parser<http::string_body> parser;
        parser.body_limit(cfg_.max_body_bytes);
        if (preq.beast_req.method() == http::verb::head) parser.skip(true);

        ec = net::error::would_block;
        lowest.expires_after(cfg_.timeouts.receive_timeout);
        http::async_read(stream, buffer_, parser,
                         [&ec](boost::system::error_code e, std::size_t) {
                             ec = e;
                         });
        run_pending();
        if (ec) {
            close();
            return Result<Response>::err(
                transport_err(Error::Code::ReceiveFailed, "Read failed", ec)
                    .error());
        }
        lowest.expires_never();

        Response out = parse_beast_response(parser.release());
        if (!out.keep_alive) close();
        return Result<Response>::ok(std::move(out));
    }

    Result<Response> TcpTransport::exchange(const PreparedRequest& preq) {
        if (preq.endpoint != endpoint_) {
            return Result<Response>::err(
                Error::Code::InvalidUrl,
                "PreparedRequest endpoint does not match transport endpoint");
        }

        if (!is_open()) {
            return Result<Response>::err(Error::Code::NetworkError,
                                         "Transport is closed");
        }

        if (std::holds_alternative<HttpStream>(stream_)) {
            return exchange_on(std::get<HttpStream>(stream_), preq);
        }
        return exchange_on(std::get<HttpsStream>(stream_), preq);
    }

    TcpConnector::TcpConnector(TransportConfiguration cfg)
        : cfg_(std::move(cfg)),
          ssl_ctx_(boost::asio::ssl::context::tls_client) {
        init_tls_on_ssl_context(ssl_ctx_, cfg_.verify_tls);
    }

    Result<TransportPtr> TcpConnector::connect(const EndpointKey& key) {
        auto transport = std::make_unique<TcpTransport>(ssl_ctx_, cfg_);
        auto st = transport->open(key);
        if (st.has_error()) {
            log::get()->debug("error creating connection to {}:{} (SSL: {}): {}",
                              key.host, key.port, key.secure,
                              st.error().message);
            return Result<TransportPtr>::err(std::move(st).error());
        }
        return Result<TransportPtr>::ok(std::move(transport));
    }

}  // namespace scanpool
