#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "scanpool/config.hpp"
#include "scanpool/connection/connection_provider.hpp"
#include "scanpool/request.hpp"
#include "scanpool/response.hpp"
#include "scanpool/result.hpp"

namespace scanpool {

    /**
     * @brief Fetches single pages over connections leased from a provider.
     *
     * Each request goes over the leased connection itself, so with a pooled
     * provider consecutive requests to one endpoint share a socket. No
     * redirects are followed and bodies are returned as received.
     *
     * Thread-safe as long as the provider is; the client holds no connection
     * between calls.
     */
    class PageClient {
       public:
        /**
         * @brief Constructs a PageClient.
         * @param provider Where connections come from. Must outlive the client.
         * @param user_agent Sent as the User-Agent header of every request.
         */
        PageClient(ConnectionProvider& provider, std::string user_agent);

        PageClient(const PageClient&) = delete;
        PageClient& operator=(const PageClient&) = delete;

        /**
         * @brief Sends one request.
         * @param request Absolute http:// or https:// URL plus method, headers
         * and body.
         * @return The response, or the first error hit on the way.
         */
        [[nodiscard]] Result<Response> fetch(const Request& request);

        [[nodiscard]] Result<Response> get(const std::string& url);

        [[nodiscard]] Result<Response> head(const std::string& url);

        [[nodiscard]] Result<Response> post(const std::string& url,
                                            std::string body);

        /// @brief Requests that went over a pooled connection.
        std::uint64_t pooled_requests() const noexcept {
            return pooled_requests_.load(std::memory_order_relaxed);
        }

        /// @brief Requests that needed a connection of their own.
        std::uint64_t unpooled_requests() const noexcept {
            return unpooled_requests_.load(std::memory_order_relaxed);
        }

       private:
        ConnectionProvider& provider_;
        std::string user_agent_;
        std::atomic<std::uint64_t> pooled_requests_{0};
        std::atomic<std::uint64_t> unpooled_requests_{0};
    };

}  // namespace scanpool
