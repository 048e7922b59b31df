/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_TRAITS_HPP
#define CPPECHO_TRAITS_HPP

#include <type_traits>

//------------------------------------------------------------------------------
/** @file
    @brief Contains the type traits used to constrain templates. */
//------------------------------------------------------------------------------

#define CPPECHO_NEEDS(cond) Needs<(cond)>

namespace echo
{

//------------------------------------------------------------------------------
/** Metafunction used to enable overloads based on a boolean condition. */
//------------------------------------------------------------------------------
template<bool B, typename T = int>
using Needs = typename std::enable_if<B,T>::type;

//------------------------------------------------------------------------------
/** Pre C++14 substitute for std::decay_t. */
//------------------------------------------------------------------------------
template <typename T>
using Decay = typename std::decay<T>::type;

//------------------------------------------------------------------------------
/** Determines if a type is the same as another. */
//------------------------------------------------------------------------------
template<typename T, typename U>
constexpr bool isSameType() {return std::is_same<T, U>::value;}

} // namespace echo

#endif // CPPECHO_TRAITS_HPP
