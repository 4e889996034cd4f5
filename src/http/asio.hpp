#pragma once
/// @file asio.hpp
/// @brief Boost.Asio / Beast namespace aliases used across the engine.

#include <utility> // std::exchange, used by Boost.Asio awaitable

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace loadcurve {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

} // namespace loadcurve
