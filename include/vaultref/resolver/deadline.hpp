#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "vaultref/core/error.hpp"

namespace vaultref::resolver {

/// Runs `op(stop)` on the current executor and waits at most `timeout` for it.
///
/// `op` returns the operation's awaitable and is kept alive until the
/// operation finishes, so it should own (by capture) everything the
/// operation touches. It is moved after the call and so must not be a
/// coroutine lambda itself. When the deadline passes or
/// `caller_stop` fires first, the operation is told to stop and left to
/// finish on its own; the caller gets ErrorCode::Cancelled if it asked to
/// stop and ErrorCode::Timeout otherwise.
template <typename T, typename Operation>
auto run_with_deadline(Operation op, std::chrono::milliseconds timeout,
                       std::stop_token caller_stop) -> boost::asio::awaitable<Result<T>> {
    struct State {
        std::optional<Result<T>> result;
    };

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<State>();
    auto timer = std::make_shared<boost::asio::steady_timer>(executor, timeout);

    // Stop requests flow from the caller down to the operation, never back up.
    std::stop_source linked;
    std::stop_callback on_caller_stop(caller_stop, [linked, timer]() mutable {
        linked.request_stop();
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    });

    auto operation = op(linked.get_token());
    boost::asio::co_spawn(
        executor,
        std::move(operation),
        [state, timer, op = std::move(op)](std::exception_ptr ep, Result<T> result) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    state->result = Result<T>(std::unexpected(make_error(
                        ErrorCode::InternalError, "Secret operation raised an exception", e.what())));
                }
            } else {
                state->result = std::move(result);
            }
            timer->cancel();
        });

    if (!state->result) {
        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (state->result) {
        co_return std::move(*state->result);
    }

    // The operation is abandoned; tell it so.
    linked.request_stop();

    if (caller_stop.stop_requested()) {
        co_return make_fail(make_error(
            ErrorCode::Cancelled, "Secret read cancelled by caller"));
    }
    co_return make_fail(make_error(
        ErrorCode::Timeout,
        "Secret read exceeded deadline",
        std::to_string(timeout.count()) + "ms"));
}

} // namespace vaultref::resolver
