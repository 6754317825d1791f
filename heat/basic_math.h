// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BASIC_MATH_H_0918273645019283
#define BASIC_MATH_H_0918273645019283

#include <cassert>
#include <cmath>
#include <limits>
#include <type_traits>


namespace numeric
{
template <class T> bool isNull(T value); //...definitively fishy...

double nonNegative(double value); //clamp to [0, inf): negative and NaN yield 0; +inf passes

template <class N, class D> auto intDivRound(N numerator, D denominator);

//----------------------------------------------------------------------------------








//################# inline implementation #########################
template <class T> inline
bool isNull(T value)
{
    return std::abs(value) <= std::numeric_limits<T>::epsilon(); //epsilon is 0 for integral types => less-equal
}


inline
double nonNegative(double value)
{
    return value > 0 ? value : 0; //NaN compares false
}


template <class N, class D> inline
auto intDivRound(N num, D den)
{
    static_assert(std::is_integral_v<N> && std::is_integral_v<D>);
    static_assert(std::is_signed_v<N> == std::is_signed_v<D>); //until further
    assert(den != 0);
    if constexpr (std::is_signed_v<N>)
    {
        if ((num < 0) != (den < 0))
            return (num - den / 2) / den;
    }
    return (num + den / 2) / den;
}
}

#endif //BASIC_MATH_H_0918273645019283
