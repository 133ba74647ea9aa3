#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace scanpool {

    /// @brief Default capacity of a per-endpoint pool.
    inline constexpr std::size_t kDefaultMaxConnectionsPerHost = 10;

    /**
     * @brief Fixed ceilings applied by the transport layer. Exceeding one
     * surfaces as a connection-creation or exchange failure.
     */
    struct TransportTimeouts {
        /** @brief Timeout for resolving, connecting and the TLS handshake. */
        std::chrono::milliseconds connect_timeout{10000};

        /** @brief Timeout for writing a request. */
        std::chrono::milliseconds send_timeout{15000};

        /** @brief Timeout for reading a response. */
        std::chrono::milliseconds receive_timeout{30000};
    };

    /**
     * @brief Transport configuration used by TcpConnector.
     */
    struct TransportConfiguration {
        TransportTimeouts timeouts{};

        /** @brief Whether to verify peer certificates on secure endpoints. */
        bool verify_tls{true};

        /** @brief Disable Nagle on every new socket. */
        bool tcp_nodelay{true};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U * 1024U};

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"scanpool/1.0"};
    };

    /**
     * @brief Bounds applied to the requested worker count of a batch.
     */
    struct WorkerPoolConfiguration {
        /** @brief Upper bound is this many workers per hardware thread. */
        std::size_t hardware_multiplier{4};

        /** @brief Absolute ceiling, whatever the hardware reports. */
        std::size_t max_threads{32};

        /** @brief Log "starting N threads" when a batch fans out. */
        bool announce_start{true};
    };

    /**
     * @brief Typed values behind the coordinator's configuration keys.
     */
    struct OptimizationSettings {
        std::int64_t max_connections_per_host{
            static_cast<std::int64_t>(kDefaultMaxConnectionsPerHost)};
        /** @brief Unset means "size batches automatically". */
        std::optional<std::int64_t> thread_pool_size;
        std::int64_t query_cache_size{100};
        bool enable_http2{true};
        bool enable_compression{true};
        bool enable_dns_cache{true};
    };

}  // namespace scanpool
