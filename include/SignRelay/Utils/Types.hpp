/**
 * @file Types.hpp
 * @brief Shorthand aliases for the standard types used throughout SignRelay.
 *
 * Every module pulls the aliases it needs into an anonymous namespace so the
 * rest of the file reads the same regardless of which standard type backs it.
 */

#pragma once

#include <array>         // std::array (Array)
#include <chrono>        // std::chrono::milliseconds (Millis)
#include <cstdint>       // std::{u,}int*_t
#include <functional>    // std::function (Fn)
#include <future>        // std::{future, promise} (Future, Promise)
#include <map>           // std::map (Map)
#include <memory>        // std::{shared_ptr, unique_ptr} (SharedPointer, UniquePointer)
#include <mutex>         // std::{mutex, lock_guard, unique_lock} (Mutex, LockGuard, UniqueLock)
#include <optional>      // std::optional (Option)
#include <shared_mutex>  // std::{shared_mutex, shared_lock} (SharedMutex, SharedLock)
#include <span>          // std::span (Span)
#include <string>        // std::string (String)
#include <string_view>   // std::string_view (StringView)
#include <tuple>         // std::tuple (Tuple)
#include <unordered_map> // std::unordered_map (UnorderedMap)
#include <utility>       // std::pair (Pair)
#include <vector>        // std::vector (Vec)

#include "Definitions.hpp"

namespace signrelay::utils::types {
  /// @name Fixed-width integers and floats
  /// @{
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
  /// @}

  /**
   * @brief Alias for std::string.
   *
   * Owning, mutable string.
   */
  using String = std::string;

  /**
   * @brief Alias for std::string_view.
   *
   * Non-owning view of a string.
   */
  using StringView = std::string_view;

  /**
   * @brief Pointer to a null-terminated C-style string.
   */
  using CStr  = const char*;
  using PCStr = const char*;

  using Exception = std::exception;

  /**
   * @brief Empty return type for functions that only signal completion.
   */
  using Unit = void;

  /// @name Synchronization
  /// @{
  using Mutex       = std::mutex;
  using SharedMutex = std::shared_mutex;
  using LockGuard   = std::lock_guard<Mutex>;
  using UniqueLock  = std::unique_lock<Mutex>;

  template <typename Mtx>
  using SharedLock = std::shared_lock<Mtx>;
  /// @}

  /**
   * @brief Wall-clock or monotonic duration in milliseconds.
   */
  using Millis = std::chrono::milliseconds;

  inline constexpr std::nullopt_t None = std::nullopt;

  /**
   * @brief Alias for std::optional<Tp>.
   * @tparam Tp The type of the potential value.
   */
  template <typename Tp>
  using Option = std::optional<Tp>;

  /**
   * @brief Wraps a value in an engaged Option.
   */
  template <typename Tp>
  constexpr fn Some(Tp&& value) -> Option<std::decay_t<Tp>> {
    return std::make_optional(std::forward<Tp>(value));
  }

  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  template <typename Tp>
  using Vec = std::vector<Tp>;

  template <typename Tp, usize sz = std::dynamic_extent>
  using Span = std::span<Tp, sz>;

  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  template <typename... Ts>
  using Tuple = std::tuple<Ts...>;

  /**
   * @brief Alias for std::map<Key, Val>, with a transparent comparator so
   * lookups can be made with a StringView.
   */
  template <typename Key, typename Val>
  using Map = std::map<Key, Val, std::less<>>;

  template <typename Key, typename Val>
  using UnorderedMap = std::unordered_map<Key, Val>;

  template <typename Tp>
  using SharedPointer = std::shared_ptr<Tp>;

  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  template <typename Tp>
  using Future = std::future<Tp>;

  template <typename Tp>
  using Promise = std::promise<Tp>;

  /**
   * @brief Alias for std::function.
   * @tparam Sig The call signature, e.g. `Fn<void(int)>`.
   */
  template <typename Sig>
  using Fn = std::function<Sig>;
} // namespace signrelay::utils::types
