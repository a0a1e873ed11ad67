#pragma once

#include <array>
#include <cstring>
#include <string_view>
#include <type_traits>
#include <vector>

#include "types.hpp"

namespace esmp {

// Helper function to go to/from char pointers to unsigned char pointers:
inline const unsigned char* to_unsigned(const char* x) {
    return reinterpret_cast<const unsigned char*>(x);
}
inline unsigned char* to_unsigned(char* x) {
    return reinterpret_cast<unsigned char*>(x);
}
// Does nothing, but having it makes template metaprogramming easier:
inline const unsigned char* to_unsigned(const unsigned char* x) {
    return x;
}
inline const char* from_unsigned(const unsigned char* x) {
    return reinterpret_cast<const char*>(x);
}
// Helper function to switch between basic_string_view<C> and ustring_view
inline ustring_view to_unsigned_sv(std::string_view v) {
    return {to_unsigned(v.data()), v.size()};
}
inline ustring_view to_unsigned_sv(ustring_view v) {
    return v;  // no-op, but helps with template metaprogamming
}
inline std::string_view from_unsigned_sv(ustring_view v) {
    return {from_unsigned(v.data()), v.size()};
}
template <size_t N>
inline std::string_view from_unsigned_sv(const std::array<unsigned char, N>& v) {
    return {from_unsigned(v.data()), v.size()};
}
template <size_t N>
inline ustring_view to_unsigned_sv(const std::array<unsigned char, N>& v) {
    return {v.data(), N};
}

// C++20 starts_/ends_with backport
inline constexpr bool starts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

inline constexpr bool ends_with(std::string_view str, std::string_view suffix) {
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

/// Splits `str` on every occurrence of `delim`.  Empty pieces are kept, so splitting "a//b" on
/// "/" gives {"a", "", "b"}.
std::vector<std::string_view> split(std::string_view str, std::string_view delim);

/// Decodes one UTF-8 sequence from the front of `s`, advancing it.  Returns the code point, or
/// -1 (without advancing) if `s` does not begin with a valid, shortest-form UTF-8 sequence.
int32_t utf8_next(std::string_view& s);

/// Returns the number of code points in `s`, or std::string_view::npos if `s` is not valid
/// UTF-8.
size_t utf8_length(std::string_view s);

// Calls sodium_memzero to zero a buffer
void sodium_zero_buffer(void* ptr, size_t size);

// Wrapper around a type that uses `sodium_memzero` to zero the container on destruction; may only
// be used with trivially destructible types.
template <typename T, typename = std::enable_if_t<std::is_trivially_destructible_v<T>>>
struct sodium_cleared : T {
    using T::T;

    ~sodium_cleared() { sodium_zero_buffer(this, sizeof(*this)); }
};

template <size_t N>
using cleared_array = sodium_cleared<std::array<unsigned char, N>>;

}  // namespace esmp
