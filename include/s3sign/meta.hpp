#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::meta {

template <typename Test, template <typename...> class Ref>
struct is_specialization : public std::false_type {};
template <template <typename...> class Ref, typename... Args>
struct is_specialization<Ref<Args...>, Ref> : public std::true_type {};
template <typename Test, template <typename...> class Ref>
constexpr inline bool is_specialization_v = is_specialization<Test, Ref>::value;

template <typename T>
concept is_aliasing_type =
    std::is_same_v<T, unsigned char> || std::is_same_v<T, char> || std::is_same_v<T, std::byte>;

template <typename T, typename U>
T safe_reinterpret_cast(U &&rhs)
    requires std::is_pointer_v<T> && std::is_pointer_v<U> &&
             is_aliasing_type<std::remove_cvref_t<std::remove_pointer_t<T>>> &&
             is_aliasing_type<std::remove_cvref_t<std::remove_pointer_t<U>>>
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<T>(std::forward<U>(rhs));
}

[[nodiscard]] inline std::span<const std::byte> as_bytes(std::string_view str S3SIGN_LIFETIMEBOUND) noexcept {
    return std::as_bytes(std::span<const char>{str.data(), str.size()});
}

} // namespace s3sign::meta

//
#include "s3sign/internal/macro-end.hpp"
