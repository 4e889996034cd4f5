/// @file beast_client.cpp
/// @brief Boost.Beast request/response exchange with error classification.

#include "http/beast_client.hpp"
#include "http/url.hpp"

#include <array>
#include <iterator>
#include <limits>
#include <memory>
#include <utility>

namespace loadcurve {

namespace {

using Clock = std::chrono::steady_clock;

auto fail(TransportErrorKind kind, std::string message) -> HttpResult {
  return std::unexpected(TransportError{kind, std::move(message)});
}

auto is_timeout(const beast::error_code &ec) -> bool {
  return ec == beast::error::timeout || ec == net::error::timed_out;
}

/// Classify a failure after the connection was established.
auto io_failure(const beast::error_code &ec, const char *stage)
    -> HttpResult {
  if (is_timeout(ec)) {
    return fail(TransportErrorKind::Timeout,
                std::string{stage} + " timed out");
  }
  return fail(TransportErrorKind::Protocol,
              std::string{stage} + ": " + ec.message());
}

/// The peer closed an idle keep-alive connection before answering.
auto is_stale(const beast::error_code &ec) -> bool {
  return ec == http::error::end_of_stream || ec == net::error::eof ||
         ec == net::error::connection_reset ||
         ec == net::error::broken_pipe;
}

// ─── Resolve with deadline ──────────────────────────────────────────────

/// Completes the awaiting coroutine with whichever of the resolver and the
/// deadline timer finishes first. Both completions run on the same executor.
template <typename Handler> struct ResolveRace {
  ResolveRace(Handler h, const net::any_io_executor &executor)
      : handler{std::move(h)}, timer{executor} {}

  void finish(beast::error_code ec, ResolveResults results) {
    if (std::exchange(done, true)) {
      return;
    }
    timer.cancel();
    std::move(handler)(ec, std::move(results));
  }

  Handler handler;
  net::steady_timer timer;
  bool done = false;
};

template <typename CompletionToken>
auto async_resolve_until(net::any_io_executor executor, Resolver resolve,
                         std::string host, std::string service,
                         Clock::time_point deadline, CompletionToken &&token) {
  return net::async_initiate<CompletionToken,
                             void(beast::error_code, ResolveResults)>(
      [executor, resolve = std::move(resolve), host = std::move(host),
       service = std::move(service), deadline](auto handler) {
        using Race = ResolveRace<decltype(handler)>;
        auto race = std::make_shared<Race>(std::move(handler), executor);

        race->timer.expires_at(deadline);
        race->timer.async_wait([race](const beast::error_code &ec) {
          if (ec != net::error::operation_aborted) {
            race->finish(net::error::timed_out, {});
          }
        });

        resolve(executor, host, service,
                [race, executor](beast::error_code ec, ResolveResults r) {
                  net::post(executor,
                            [race, ec, r = std::move(r)]() mutable {
                              race->finish(ec, std::move(r));
                            });
                });
      },
      token);
}

// ─── Exchange ───────────────────────────────────────────────────────────

struct Exchange {
  beast::error_code ec;
  const char *stage = "";
  bool keep_alive = false;
};

void copy_fields(const http::fields &fields, HeaderList &out) {
  out.reserve(
      static_cast<std::size_t>(std::distance(fields.begin(), fields.end())));
  for (const auto &field : fields) {
    const auto name = field.name_string();
    const auto value = field.value();
    out.emplace_back(std::string(name.data(), name.size()),
                     std::string(value.data(), value.size()));
  }
}

/// Read a response keeping the body as a string.
auto read_full(beast::tcp_stream &stream, beast::flat_buffer &buffer,
               HttpResponse &out) -> net::awaitable<Exchange> {
  beast::error_code ec;
  http::response_parser<http::string_body> parser;
  parser.body_limit(BeastHttpClient::kMaxBodyBytes);
  co_await http::async_read(stream, buffer, parser,
                            net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    co_return Exchange{ec, "read"};
  }

  auto res = parser.release();
  out.status = static_cast<std::uint16_t>(res.result_int());
  copy_fields(res, out.headers);
  out.body = std::move(res.body());
  out.body_bytes = out.body.size();
  co_return Exchange{{}, "read", res.keep_alive()};
}

/// Read a response in fixed chunks, counting and dropping the body.
auto read_discard(beast::tcp_stream &stream, beast::flat_buffer &buffer,
                  HttpResponse &out) -> net::awaitable<Exchange> {
  beast::error_code ec;
  auto token = net::redirect_error(net::use_awaitable, ec);
  http::response_parser<http::buffer_body> parser;
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());

  co_await http::async_read_header(stream, buffer, parser, token);
  if (ec) {
    co_return Exchange{ec, "read"};
  }

  std::array<char, BeastHttpClient::kDiscardChunkBytes> chunk{};
  while (!parser.is_done()) {
    parser.get().body().data = chunk.data();
    parser.get().body().size = chunk.size();
    co_await http::async_read(stream, buffer, parser, token);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      co_return Exchange{ec, "read"};
    }
    out.body_bytes += chunk.size() - parser.get().body().size;
  }

  const auto &res = parser.get();
  out.status = static_cast<std::uint16_t>(res.result_int());
  copy_fields(res, out.headers);
  co_return Exchange{{}, "read", res.keep_alive()};
}

auto exchange(beast::tcp_stream &stream,
              const http::request<http::string_body> &req, bool discard,
              HttpResponse &out) -> net::awaitable<Exchange> {
  beast::error_code ec;
  co_await http::async_write(stream, req,
                             net::redirect_error(net::use_awaitable, ec));
  if (ec) {
    co_return Exchange{ec, "write"};
  }

  beast::flat_buffer buffer;
  if (discard) {
    co_return co_await read_discard(stream, buffer, out);
  }
  co_return co_await read_full(stream, buffer, out);
}

} // namespace

void system_resolve(const net::any_io_executor &executor,
                    const std::string &host, const std::string &service,
                    ResolveHandler done) {
  auto resolver = std::make_shared<tcp::resolver>(executor);
  resolver->async_resolve(
      host, service,
      [resolver, done = std::move(done)](const beast::error_code &ec,
                                         ResolveResults results) {
        done(ec, std::move(results));
      });
}

BeastHttpClient::BeastHttpClient(std::chrono::milliseconds default_timeout)
    : BeastHttpClient(BeastClientOptions{.default_timeout = default_timeout}) {}

BeastHttpClient::BeastHttpClient(BeastClientOptions options)
    : default_timeout_{options.default_timeout.count() > 0
                           ? options.default_timeout
                           : kDefaultRequestTimeout},
      resolver_{options.resolver ? std::move(options.resolver)
                                 : Resolver{system_resolve}},
      pool_{options.pool} {}

BeastHttpClient::~BeastHttpClient() = default;

auto BeastHttpClient::send(HttpRequest request)
    -> net::awaitable<HttpResult> {
  auto url = parse_url(request.url);
  if (!url.has_value()) {
    co_return HttpResult{std::unexpected(std::move(url.error()))};
  }
  if (url->scheme == "https") {
    co_return fail(TransportErrorKind::Tls,
                   "https is not available on the plain-TCP client (" +
                       url->host + ")");
  }

  const auto verb = http::string_to_verb(request.method);
  if (verb == http::verb::unknown) {
    co_return fail(TransportErrorKind::InvalidRequest,
                   "unknown method '" + request.method + "'");
  }

  const auto timeout =
      request.timeout.count() > 0 ? request.timeout : default_timeout_;
  const auto deadline = Clock::now() + timeout;

  auto executor = co_await net::this_coro::executor;
  const auto host_key = url->host + ":" + std::to_string(url->port);

  http::request<http::string_body> req{verb, url->target, 11};
  req.set(http::field::host, url->host_header());
  req.set(http::field::user_agent, "loadcurve/0.1");
  for (const auto &[name, value] : request.headers) {
    req.set(name, value);
  }
  if (request.body.has_value()) {
    req.body() = std::move(*request.body);
  }
  req.keep_alive(true);
  req.prepare_payload();

  HttpResponse response;
  Exchange result;

  // ─── Pooled connection ────────────────────────────────────────────
  auto stream = pool_.acquire(host_key, executor);
  if (stream) {
    stream->expires_at(deadline);
    result = co_await exchange(*stream, req, request.discard_body, response);
    if (result.ec && is_stale(result.ec)) {
      stream.reset();
      response = HttpResponse{};
    } else if (result.ec) {
      co_return io_failure(result.ec, result.stage);
    }
  }

  if (!stream) {
    // ─── Resolve ──────────────────────────────────────────────────────
    beast::error_code ec;
    auto endpoints = co_await async_resolve_until(
        executor, resolver_, url->host, std::to_string(url->port), deadline,
        net::redirect_error(net::use_awaitable, ec));
    if (is_timeout(ec)) {
      co_return fail(TransportErrorKind::Timeout,
                     "resolve " + url->host + " timed out");
    }
    if (ec) {
      co_return fail(TransportErrorKind::Dns, url->host + ": " + ec.message());
    }

    // ─── Connect ──────────────────────────────────────────────────────
    stream = std::make_unique<beast::tcp_stream>(executor);
    stream->expires_at(deadline);
    co_await stream->async_connect(endpoints,
                                   net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      if (is_timeout(ec)) {
        co_return fail(TransportErrorKind::Timeout, "connect timed out");
      }
      co_return fail(TransportErrorKind::Connect,
                     url->host_header() + ": " + ec.message());
    }
    beast::error_code opt_ec;
    stream->socket().set_option(net::socket_base::keep_alive(true), opt_ec);

    // ─── Write / read ─────────────────────────────────────────────────
    result = co_await exchange(*stream, req, request.discard_body, response);
    if (result.ec) {
      co_return io_failure(result.ec, result.stage);
    }
  }

  if (result.keep_alive) {
    stream->expires_never();
    pool_.release(host_key, executor, std::move(stream));
  } else {
    // The peer may already have closed; the response is complete either way.
    beast::error_code shutdown_ec;
    stream->socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
  }

  co_return HttpResult{std::move(response)};
}

} // namespace loadcurve
