#pragma once
/// @file test_support.hpp
/// @brief Shared fakes for engine tests.

#include "http/http_client.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace loadcurve::testing {

/// @brief HttpClient answering from a callback and recording every request.
class FakeHttpClient final : public HttpClient {
public:
  using Handler = std::function<HttpResult(const HttpRequest &)>;

  explicit FakeHttpClient(Handler handler,
                          std::chrono::milliseconds latency = {})
      : handler_{std::move(handler)}, latency_{latency} {}

  auto send(HttpRequest request) -> net::awaitable<HttpResult> override {
    if (latency_.count() > 0) {
      net::steady_timer timer{co_await net::this_coro::executor};
      timer.expires_after(latency_);
      beast::error_code ec;
      co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    auto result = handler_(request);
    {
      std::lock_guard lock(mutex_);
      requests_.push_back(std::move(request));
    }
    co_return result;
  }

  [[nodiscard]] auto requests() const -> std::vector<HttpRequest> {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  [[nodiscard]] auto request_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return requests_.size();
  }

private:
  Handler handler_;
  std::chrono::milliseconds latency_;
  mutable std::mutex mutex_;
  std::vector<HttpRequest> requests_;
};

inline auto ok(std::string body = "{}", HeaderList headers = {})
    -> HttpResult {
  return HttpResponse{.status = 200,
                      .headers = std::move(headers),
                      .body = std::move(body)};
}

inline auto status(std::uint16_t code) -> HttpResult {
  return HttpResponse{.status = code, .headers = {}, .body = {}};
}

/// @brief Drive @p aw to completion on a private io_context.
template <typename T> auto run_sync(net::awaitable<T> aw) -> T {
  net::io_context ioc;
  std::optional<T> out;
  std::exception_ptr error;
  net::co_spawn(ioc, std::move(aw),
                [&](std::exception_ptr e, T value) {
                  error = e;
                  if (!e) {
                    out.emplace(std::move(value));
                  }
                });
  ioc.run();
  if (error) {
    std::rethrow_exception(error);
  }
  return std::move(*out);
}

} // namespace loadcurve::testing
