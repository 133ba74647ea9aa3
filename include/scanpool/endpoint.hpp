#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace scanpool {

    /// @brief Identity of one connection pool: (host, port, secure).
    /// @note Equality is structural. Build keys through make_endpoint() so the
    /// host is lower-cased and "Example.COM" and "example.com" share a pool.
    struct EndpointKey {
        std::string host;
        std::uint16_t port{0};
        bool secure{false};

        inline void normalize_host() {
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        inline void normalize_default_port() {
            if (port == 0) port = secure ? 443 : 80;
        }

        std::string port_string() const { return std::to_string(port); }

        /// @brief "http://host:port" or "https://host:port", used as the
        /// statistics label.
        std::string label() const {
            std::string out = secure ? "https://" : "http://";
            out.append(host);
            out.push_back(':');
            out.append(port_string());
            return out;
        }

        friend bool operator==(EndpointKey const& a,
                               EndpointKey const& b) noexcept {
            return a.secure == b.secure && a.port == b.port && a.host == b.host;
        }

        friend bool operator!=(EndpointKey const& a,
                               EndpointKey const& b) noexcept {
            return !(a == b);
        }
    };

    inline EndpointKey make_endpoint(std::string host, std::uint16_t port,
                                     bool secure) {
        EndpointKey key{std::move(host), port, secure};
        key.normalize_host();
        key.normalize_default_port();
        return key;
    }

    /// @brief Selects pools for clear(). Unset fields match anything; set
    /// fields must be exactly equal.
    struct EndpointFilter {
        std::optional<std::string> host;
        std::optional<std::uint16_t> port;
        std::optional<bool> secure;

        bool empty() const noexcept { return !host && !port && !secure; }

        bool matches(EndpointKey const& key) const {
            if (host && *host != key.host) return false;
            if (port && *port != key.port) return false;
            if (secure && *secure != key.secure) return false;
            return true;
        }
    };

}  // namespace scanpool

namespace std {
    template <>
    struct hash<scanpool::EndpointKey> {
        size_t operator()(scanpool::EndpointKey const& e) const noexcept {
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(e.secure);
            h *= 1099511628211ull;
            h ^= static_cast<size_t>(e.port);
            h *= 1099511628211ull;
            mix(e.host);
            return h;
        }
    };
}  // namespace std
