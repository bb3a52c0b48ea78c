#pragma once

#include "cloudup/network/http_transport.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace cloudup::testing {

/**
 * Scripted HttpTransport: queued replies are returned in order, then the
 * fallback handler (if any) answers. Every request is recorded.
 */
class FakeHttpTransport : public network::HttpTransport {
public:
    using Handler = std::function<Result<network::HttpResponse>(const network::HttpRequest&)>;

    static network::HttpResponse reply(int status, const std::string& body = {}, network::HeaderMap headers = {}) {
        network::HttpResponse response;
        response.status_code = status;
        response.headers = std::move(headers);
        response.body.assign(body.begin(), body.end());
        return response;
    }

    void enqueue(network::HttpResponse response) {
        std::lock_guard lock(mutex_);
        script_.push_back(Ok(std::move(response)));
    }

    void enqueue(int status, const std::string& body = {}, network::HeaderMap headers = {}) {
        enqueue(reply(status, body, std::move(headers)));
    }

    void enqueue_error(Error error) {
        std::lock_guard lock(mutex_);
        script_.push_back(Err<network::HttpResponse>(std::move(error)));
    }

    void set_fallback(Handler handler) {
        std::lock_guard lock(mutex_);
        fallback_ = std::move(handler);
    }

    Result<network::HttpResponse> send(const network::HttpRequest& request) override {
        Handler fallback;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
            if (!script_.empty()) {
                auto next = std::move(script_.front());
                script_.pop_front();
                return next;
            }
            fallback = fallback_;
        }
        if (fallback) {
            return fallback(request);
        }
        return Err<network::HttpResponse>(Error::protocol("Unexpected request to " + request.url));
    }

    std::vector<network::HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    std::size_t pending() const {
        std::lock_guard lock(mutex_);
        return script_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Result<network::HttpResponse>> script_;
    std::vector<network::HttpRequest> requests_;
    Handler fallback_;
};

} // namespace cloudup::testing
