#pragma once

#include <type_traits>

// NOLINTBEGIN

namespace detail
{
template<typename BitFieldTy>
struct BitFieldOperatorsEnabled
{
    static constexpr bool value = false;
};
} // namespace detail

// Call this on the enum class type that shall have the operators enabled
#define ENABLE_BITFIELD_OPERATORS(bitfield)           \
    template<>                                        \
    struct detail::BitFieldOperatorsEnabled<bitfield> \
    {                                                 \
        static constexpr bool value = true;           \
    }

template<typename BitFieldTy>
using EnableIfBitField = std::enable_if_t<detail::BitFieldOperatorsEnabled<BitFieldTy>::value, BitFieldTy>;

template<typename BitFieldTy>
inline constexpr EnableIfBitField<BitFieldTy> operator|(BitFieldTy lhs, BitFieldTy rhs)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BitFieldTy>(static_cast<BaseTy>(lhs) | static_cast<BaseTy>(rhs));
}

template<typename BitFieldTy>
inline constexpr EnableIfBitField<BitFieldTy> operator&(BitFieldTy lhs, BitFieldTy rhs)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BitFieldTy>(static_cast<BaseTy>(lhs) & static_cast<BaseTy>(rhs));
}

template<typename BitFieldTy>
inline constexpr EnableIfBitField<BitFieldTy>& operator|=(BitFieldTy& lhs, BitFieldTy rhs)
{
    lhs = lhs | rhs;
    return lhs;
}

/*
        True if any of the bits in rhs are set in lhs
*/
template<typename BitFieldTy>
inline constexpr std::enable_if_t<detail::BitFieldOperatorsEnabled<BitFieldTy>::value, bool>
IsAnySet(BitFieldTy lhs, BitFieldTy rhs)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BaseTy>(lhs & rhs) != BaseTy{};
}

template<class T>
consteval T Bit(T ith)
{
    return static_cast<T>(T{ 1 } << ith);
}

// NOLINTEND
