#include "scanpool/page_client.hpp"

#include <optional>
#include <utility>

#include "scanpool/log.hpp"
#include "scanpool/url.hpp"

namespace scanpool {

    PageClient::PageClient(ConnectionProvider& provider,
                           std::string user_agent)
        : provider_(provider), user_agent_(std::move(user_agent)) {}

    Result<Response> PageClient::fetch(const Request& request) {
        auto u_res = parse_url(request.url);
        if (u_res.has_error()) {
            return Result<Response>::err(u_res.error());
        }
        const UrlComponents& url = u_res.value();

        auto l_res = provider_.lease(url.endpoint);
        if (l_res.has_error()) {
            return Result<Response>::err(std::move(l_res).error());
        }
        Lease lease = std::move(l_res).value();

        if (lease.pooled()) {
            pooled_requests_.fetch_add(1, std::memory_order_relaxed);
        } else {
            unpooled_requests_.fetch_add(1, std::memory_order_relaxed);
        }

        // Only ask for keep-alive when the connection can be reused
        PreparedRequest preq =
            prepare_request(request, url, user_agent_, lease.pooled());

        auto res = lease->exchange(preq);
        if (res.has_error()) {
            log::get()->debug("{} {} failed on connection #{}: {}",
                              to_string(res.error().code), request.url,
                              lease.id(), res.error().message);
            lease.mark_failed();
            return res;
        }

        if (!res.value().keep_alive) lease.mark_failed();
        return res;
    }

    Result<Response> PageClient::get(const std::string& url) {
        Request r{HttpMethod::Get, url, {}, std::nullopt};
        return fetch(r);
    }

    Result<Response> PageClient::head(const std::string& url) {
        Request r{HttpMethod::Head, url, {}, std::nullopt};
        return fetch(r);
    }

    Result<Response> PageClient::post(const std::string& url,
                                      std::string body) {
        Request r{HttpMethod::Post, url, {}, std::move(body)};
        return fetch(r);
    }

}  // namespace scanpool
