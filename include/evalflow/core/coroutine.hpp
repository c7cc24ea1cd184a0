#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <optional>
#include <utility>

namespace evalflow {

template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::use_awaitable;

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);
namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

/// Drive `coro` to completion on `io` from the calling thread. Exceptions
/// thrown inside the coroutine are rethrown here.
template <typename T>
[[nodiscard]] auto run_blocking(boost::asio::io_context &io, task<T> coro)
    -> T {
  std::exception_ptr eptr;
  std::optional<T> result;
  co_spawn(
      io,
      [&]() -> task<void> { result.emplace(co_await std::move(coro)); },
      [&](std::exception_ptr e) { eptr = e; });
  io.run();
  if (eptr) {
    std::rethrow_exception(eptr);
  }
  return std::move(*result);
}

} // namespace evalflow
