#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include "scanpool/endpoint.hpp"
#include "scanpool/result.hpp"

namespace scanpool {

    /// @brief An absolute URL split into the pool key and the request target.
    struct UrlComponents {
        EndpointKey endpoint;
        /// Path plus optional query, never empty.
        std::string target;
    };

    /// @brief Parse an absolute http:// or https:// URL.
    /// @return The endpoint key (host lower-cased, default port filled in)
    /// and the request target, or an InvalidUrl error.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s = url;

        bool secure = false;
        if (s.rfind("https://", 0) == 0) {
            secure = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split host[:port] from path
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto slash = s.find_first_of("/?"); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            path = s.substr(slash);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string_view host = hostport;
        std::uint16_t port = 0;

        // Port parsing (simple: last ':' splits host/port)
        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            std::string_view port_text = hostport.substr(colon + 1);
            if (port_text.empty()) {
                return make_err("URL has empty port");
            }
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(
                port_text.data(), port_text.data() + port_text.size(), value);
            if (ec != std::errc{} ||
                ptr != port_text.data() + port_text.size() || value == 0 ||
                value > 65535) {
                return make_err("URL has invalid port '" +
                                std::string(port_text) + "'");
            }
            port = static_cast<std::uint16_t>(value);
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        UrlComponents out;
        out.endpoint = make_endpoint(std::string(host), port, secure);
        if (path.front() == '?') {
            out.target = "/";
            out.target.append(path);
        } else {
            out.target = std::string(path);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace scanpool
