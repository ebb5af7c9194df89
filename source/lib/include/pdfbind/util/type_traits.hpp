#pragma once

// NOLINTBEGIN

/*
        Same type as passed in, used to keep a parameter out of template deduction
*/
template<typename T>
struct identity
{
    using type = T;
};
template<typename T>
using identity_t = typename identity<T>::type;

// NOLINTEND
