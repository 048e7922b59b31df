/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_ANYHANDLER_HPP
#define CPPECHO_ANYHANDLER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains facilities for type-erasing log handlers and delivering
           entries to them. */
//------------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <utility>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/post.hpp>
#include "asiodefs.hpp"
#include "traits.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Type-erases a copyable callback that may be invoked any number of times.
    The executor associated with the wrapped callable is captured at
    construction. An empty executor means that the handler is invoked via the
    executor of whoever delivers to it. */
//------------------------------------------------------------------------------
template <typename TSignature>
class AnyReusableHandler
{
private:
    using Function = std::function<TSignature>;

    template <typename F>
    static constexpr bool fnConstructible() noexcept
    {
        return !isSameType<Decay<F>, AnyReusableHandler>() &&
               !isSameType<Decay<F>, std::nullptr_t>() &&
               std::is_constructible<Function, F>::value;
    }

public:
    using Executor = AnyIoExecutor;

    /** Default constructor. */
    AnyReusableHandler() = default;

    // NOLINTBEGIN(google-explicit-constructor)

    /** Constructor taking a callable entity. */
    template <typename F, CPPECHO_NEEDS(fnConstructible<F>()) = 0>
    AnyReusableHandler(F&& handler)
        : executor_(boost::asio::get_associated_executor(handler, Executor{})),
          handler_(std::forward<F>(handler))
    {}

    /** Constructs an empty AnyReusableHandler. */
    AnyReusableHandler(std::nullptr_t) noexcept {};

    // NOLINTEND(google-explicit-constructor)

    /** Returns false iff the AnyReusableHandler is empty. */
    explicit operator bool() const noexcept
    {
        return static_cast<bool>(handler_);
    }

    /** Obtains the executor bound to the wrapped callable, which may
        be empty. */
    const Executor& get_executor() const {return executor_;}

    /** Invokes the handler with the given arguments. */
    template <typename... Ts>
    void operator()(Ts&&... args) const
    {
        handler_(std::forward<Ts>(args)...);
    }

private:
    Executor executor_;
    Function handler_;
};

namespace internal
{

//------------------------------------------------------------------------------
// Invokes a reusable handler with a single bound argument, via the handler's
// own executor if it has one.
//------------------------------------------------------------------------------
template <typename TSignature, typename TArg>
class Delivery
{
public:
    using executor_type = AnyIoExecutor;

    Delivery(AnyReusableHandler<TSignature> handler, TArg arg,
             const AnyIoExecutor& fallback)
        : executor_(handler.get_executor() ? handler.get_executor()
                                           : fallback),
          handler_(std::move(handler)),
          arg_(std::move(arg))
    {}

    const executor_type& get_executor() const {return executor_;}

    void operator()() {handler_(std::move(arg_));}

private:
    AnyIoExecutor executor_;
    AnyReusableHandler<TSignature> handler_;
    TArg arg_;
};

} // namespace internal

//------------------------------------------------------------------------------
/** Posts the given argument to the given handler. The handler runs on its
    associated executor if it has one, otherwise on `exec`. */
//------------------------------------------------------------------------------
template <typename TSignature, typename TArg>
void postAny(const AnyIoExecutor& exec,
             const AnyReusableHandler<TSignature>& handler, TArg arg)
{
    using D = internal::Delivery<TSignature, TArg>;
    boost::asio::post(exec, D{handler, std::move(arg), exec});
}

} // namespace echo

#endif // CPPECHO_ANYHANDLER_HPP
