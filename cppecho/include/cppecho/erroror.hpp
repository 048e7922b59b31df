/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_ERROROR_HPP
#define CPPECHO_ERROROR_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ErrorOr template class. */
//------------------------------------------------------------------------------

#include <cassert>
#include <memory>
#include <system_error>
#include <utility>
#include "api.hpp"
#include "exceptions.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Wraps the error used to initialize an ErrorOr, so that it cannot be
    mistaken for a value.
    @see ErrorOr */
//------------------------------------------------------------------------------
class UnexpectedError
{
public:
    /** Constructor taking an error code. */
    explicit UnexpectedError(std::error_code ec) noexcept : ec_(ec) {}

    /** Accesses the error code. */
    const std::error_code& value() const noexcept {return ec_;}

private:
    std::error_code ec_;
};

//------------------------------------------------------------------------------
/** Creates an UnexpectedError from an error code enum. */
//------------------------------------------------------------------------------
template <typename TErrorEnum>
UnexpectedError makeUnexpectedError(TErrorEnum errc)
{
    return UnexpectedError(make_error_code(errc));
}


//------------------------------------------------------------------------------
/** Holds either a result value or the std::error_code explaining why
    there is none.

    @tparam T The contained value type when there is no error. */
//------------------------------------------------------------------------------
template <typename T>
class ErrorOr
{
public:
    using value_type = T;

    /** Default constructor. */
    ErrorOr() = default;

    // NOLINTBEGIN(google-explicit-constructor)

    /** Converting constructor taking a value. */
    ErrorOr(value_type value) : value_(std::move(value)) {}

    /** Converting constructor taking an error. */
    ErrorOr(UnexpectedError unex) : value_(), error_(unex.value()),
                                    hasError_(true) {}

    // NOLINTEND(google-explicit-constructor)

    /** Indicates if a value is being contained. */
    bool has_value() const noexcept {return !hasError_;}

    /** Indicates if a value is being contained. */
    explicit operator bool() const noexcept {return has_value();}

    /** Unchecked access of the stored value.
        @pre `this->has_value() == true` */
    value_type& operator*()
    {
        assert(has_value());
        return value_;
    }

    /** @copydoc operator*() */
    const value_type& operator*() const
    {
        assert(has_value());
        return value_;
    }

    /** Unchecked access of a member of the stored value. */
    const value_type* operator->() const {return std::addressof(**this);}

    /** Checked access of the stored value.
        @throws error::Failure if there is no value. */
    const value_type& value() const
    {
        if (hasError_)
            throw error::Failure{error_};
        return value_;
    }

    /** Unchecked access of the stored error.
        @pre `this->has_value() == false` */
    const std::error_code& error() const
    {
        assert(!has_value());
        return error_;
    }

private:
    value_type value_;
    std::error_code error_;
    bool hasError_ = false;
};

/** Compares the stored value, if any, with the given value.
    @relates ErrorOr */
template <typename T, typename U>
bool operator==(const ErrorOr<T>& x, const U& v)
{
    return x.has_value() && *x == v;
}

/** @relates ErrorOr */
template <typename T, typename U>
bool operator!=(const ErrorOr<T>& x, const U& v) {return !(x == v);}

/** Compares the stored error, if any, with the given error.
    @relates ErrorOr */
template <typename T>
bool operator==(const ErrorOr<T>& x, const UnexpectedError& e)
{
    return !x.has_value() && x.error() == e.value();
}

} // namespace echo

#endif // CPPECHO_ERROROR_HPP
