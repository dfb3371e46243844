#pragma once

#include <array>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Compile-time classification of the built-in value kinds the encoder context
// understands. Everything that matches none of these goes through the registries.
namespace Encoders::Traits {

template <typename T>
struct is_character : std::bool_constant<
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>> {};

// Arithmetic values written as JSON numbers. bool and the character types are not numbers.
template <typename T>
struct is_number : std::bool_constant<
    std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !is_character<T>::value> {};

template <typename T>
struct is_byte_element : std::bool_constant<
    std::is_same_v<T, unsigned char> || std::is_same_v<T, signed char> || std::is_same_v<T, std::byte>> {};

#pragma region Strings
template <typename T> struct is_string_like : std::false_type {};
template <typename Tr, typename A> struct is_string_like<std::basic_string<char, Tr, A>> : std::true_type {};
template <typename Tr> struct is_string_like<std::basic_string_view<char, Tr>> : std::true_type {};
template <> struct is_string_like<const char*> : std::true_type {};
template <> struct is_string_like<char*> : std::true_type {};
template <std::size_t N> struct is_string_like<char[N]> : std::true_type {};
#pragma endregion

#pragma region Byte sequences
template <typename T> struct is_byte_sequence : std::false_type {};
template <typename E, typename A> struct is_byte_sequence<std::vector<E, A>> : is_byte_element<E> {};
template <typename E, std::size_t N> struct is_byte_sequence<std::array<E, N>> : is_byte_element<E> {};
template <typename E, std::size_t N> struct is_byte_sequence<E[N]> : is_byte_element<E> {};
#pragma endregion

#pragma region Fixed-size arrays
template <typename T> struct is_fixed_array : std::false_type {};
template <typename E, std::size_t N> struct is_fixed_array<std::array<E, N>> : std::bool_constant<!is_byte_element<E>::value> {};
template <typename E, std::size_t N> struct is_fixed_array<E[N]> : std::bool_constant<!is_byte_element<E>::value && !std::is_same_v<E, char>> {};
#pragma endregion

#pragma region Containers and mappings
template <typename T, typename = void>
struct is_iterable : std::false_type {};
template <typename T>
struct is_iterable<T, std::void_t<
    typename T::value_type,
    decltype(std::begin(std::declval<const T&>())),
    decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T, typename = void>
struct has_mapped_type : std::false_type {};
template <typename T>
struct has_mapped_type<T, std::void_t<typename T::key_type, typename T::mapped_type>> : std::true_type {};

template <typename T>
struct is_mapping : std::bool_constant<is_iterable<T>::value && has_mapped_type<T>::value> {};

// Ordered or unordered collections that are not strings, byte sequences, arrays or mappings
template <typename T>
struct is_container : std::bool_constant<
    is_iterable<T>::value && !has_mapped_type<T>::value && !is_string_like<T>::value &&
    !is_byte_sequence<T>::value && !is_fixed_array<T>::value> {};
#pragma endregion

#pragma region Nullable wrappers
// Raw and smart pointers are transparent: null writes JSON null, otherwise the pointee is encoded.
template <typename T> struct is_pointer_like : std::bool_constant<
    std::is_pointer_v<T> && !is_string_like<T>::value && !std::is_function_v<std::remove_pointer_t<T>>> {};
template <typename T> struct is_pointer_like<std::shared_ptr<T>> : std::true_type {};
template <typename T, typename D> struct is_pointer_like<std::unique_ptr<T, D>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template <typename T>
struct is_null_type : std::bool_constant<
    std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, std::monostate> || std::is_same_v<T, std::nullopt_t>> {};
#pragma endregion

template <typename T, typename = void>
struct is_streamable : std::false_type {};
template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>> : std::true_type {};

// true when the value would be written as JSON null
template <typename T>
bool IsNull(const T& value)
{
    if constexpr (is_null_type<T>::value)
        return true;
    else if constexpr (is_pointer_like<T>::value)
        return !value;
    else if constexpr (std::is_same_v<T, const char*> || std::is_same_v<T, char*>)
        return value == nullptr;
    else if constexpr (is_optional<T>::value)
        return !value.has_value();
    else if constexpr (is_variant<T>::value)
        return value.valueless_by_exception() || std::visit([](const auto& alternative) { return IsNull(alternative); }, value);
    else
        return false;
}

}
