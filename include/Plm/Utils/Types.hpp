#pragma once

#include <array>         // std::array
#include <cstddef>       // std::size_t
#include <cstdint>       // std::{int*_t, uint*_t}
#include <exception>     // std::exception
#include <expected>      // std::{expected, unexpected}
#include <functional>    // std::function
#include <map>           // std::map
#include <memory>        // std::{shared_ptr, unique_ptr}
#include <mutex>         // std::{mutex, lock_guard, unique_lock}
#include <optional>      // std::optional
#include <shared_mutex>  // std::{shared_mutex, shared_lock}
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <tuple>         // std::tuple
#include <type_traits>   // std::decay_t
#include <unordered_map> // std::unordered_map
#include <utility>       // std::pair
#include <vector>        // std::vector

#ifndef fn
  #define fn auto
#endif

namespace plm::utils::error {
  struct PlmError;
} // namespace plm::utils::error

namespace plm::utils::types {
  using u8  = std::uint8_t;
  using u16 = std::uint16_t;
  using u32 = std::uint32_t;
  using u64 = std::uint64_t;

  using i8  = std::int8_t;
  using i16 = std::int16_t;
  using i32 = std::int32_t;
  using i64 = std::int64_t;

  using f32 = float;
  using f64 = double;

  using usize = std::size_t;
  using isize = std::ptrdiff_t;

  using PCStr = const char*;
  using CStr  = char;

  using String     = std::string;
  using StringView = std::string_view;

  using Unit = void;

  using Exception = std::exception;

  template <typename T>
  using Vec = std::vector<T>;

  template <typename T, usize N>
  using Array = std::array<T, N>;

  template <typename K, typename V>
  using Map = std::map<K, V>;

  template <typename K, typename V>
  using UnorderedMap = std::unordered_map<K, V>;

  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  template <typename... Ts>
  using Tuple = std::tuple<Ts...>;

  template <typename T>
  using Option = std::optional<T>;

  inline constexpr std::nullopt_t None = std::nullopt;

  template <typename T>
  using SharedPointer = std::shared_ptr<T>;

  template <typename T, typename D = std::default_delete<T>>
  using UniquePointer = std::unique_ptr<T, D>;

  template <typename T>
  using RawPointer = T*;

  template <typename Sig>
  using Fn = std::function<Sig>;

  using Mutex       = std::mutex;
  using SharedMutex = std::shared_mutex;

  using LockGuard  = std::lock_guard<Mutex>;
  using UniqueLock = std::unique_lock<Mutex>;
  using SharedLock = std::shared_lock<SharedMutex>;
  using WriteLock  = std::unique_lock<SharedMutex>;

  /**
   * @brief Result type used throughout the library.
   * @details Either a value of type T or a PlmError describing what went wrong.
   */
  template <typename T = Unit, typename E = error::PlmError>
  using Result = std::expected<T, E>;

  /**
   * @brief Wraps an error value so it converts into any Result.
   */
  template <typename E>
  constexpr fn Err(E&& error) -> std::unexpected<std::decay_t<E>> {
    return std::unexpected<std::decay_t<E>>(std::forward<E>(error));
  }
} // namespace plm::utils::types
