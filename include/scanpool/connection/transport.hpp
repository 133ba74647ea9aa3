#pragma once

#include <memory>

#include "scanpool/endpoint.hpp"
#include "scanpool/request.hpp"
#include "scanpool/response.hpp"
#include "scanpool/result.hpp"

namespace scanpool {

    /**
     * @brief A live connection to one endpoint.
     *
     * A transport is used by one thread at a time: either the pool that holds
     * it idle, or the caller that checked it out.
     */
    class Transport {
       public:
        virtual ~Transport() = default;

        /// @brief False once the connection was closed by either side.
        virtual bool is_open() const noexcept = 0;

        /// @brief Non-blocking readiness check on the underlying descriptor.
        /// @return False when the descriptor reports an error or hang-up.
        /// @note May throw; callers treat a throwing probe as a failed one.
        virtual bool probe() const = 0;

        /// @brief Close the connection (best-effort, never throws).
        virtual void close() noexcept = 0;

        /// @brief Perform one request/response exchange on this connection.
        virtual Result<Response> exchange(const PreparedRequest& preq) = 0;
    };

    using TransportPtr = std::unique_ptr<Transport>;

    /**
     * @brief Creates transports for an endpoint. Pools call this on a miss.
     */
    class Connector {
       public:
        virtual ~Connector() = default;

        /// @brief Open a new connection, bounded by the transport ceilings.
        virtual Result<TransportPtr> connect(const EndpointKey& key) = 0;
    };

}  // namespace scanpool
