/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected<V, E>, optional<T>, ScopeGuard.
 *
 * expected<V, E> carries either a value or an enum error code and is the
 * error-reporting type used by every fallible operation in pinflash. It never
 * throws; calling value() on an error (or get_error() on a value) is a
 * programming error caught by PINFLASH_ASSERT in debug builds.
 */

#ifndef PINFLASH_VOCABULARY_HPP_
#define PINFLASH_VOCABULARY_HPP_

#include "pinflash/platform.hpp"

#include <functional>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace pinflash {

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * @tparam V Value type (may be void, see specialization below).
 * @tparam E Error type, normally an enum class.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(static_cast<V&&>(v)); }
  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_),
                                    err_(other.err_) {
    if (has_value_) new (&storage_) V(other.ref());
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_), err_(other.err_) {
    if (has_value_) new (&storage_) V(static_cast<V&&>(other.ref()));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) new (&storage_) V(other.ref());
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) new (&storage_) V(static_cast<V&&>(other.ref()));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    PINFLASH_ASSERT(has_value_);
    return ref();
  }
  const V& value() const& {
    PINFLASH_ASSERT(has_value_);
    return ref();
  }
  V&& value() && {
    PINFLASH_ASSERT(has_value_);
    return static_cast<V&&>(ref());
  }

  E get_error() const noexcept {
    PINFLASH_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? ref() : fallback;
  }

 private:
  expected() noexcept : has_value_(false), err_{} {}
  explicit expected(const V& v) : has_value_(true), err_{} {
    new (&storage_) V(v);
  }
  explicit expected(V&& v) : has_value_(true), err_{} {
    new (&storage_) V(static_cast<V&&>(v));
  }

  V& ref() noexcept { return *std::launder(reinterpret_cast<V*>(&storage_)); }
  const V& ref() const noexcept {
    return *std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      ref().~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E err_;
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    PINFLASH_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), err_(e) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/// @brief Runs a cleanup action when leaving scope unless released.
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> fn) : fn_(std::move(fn)),
                                                  active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_ && fn_) fn_();
  }

  void release() noexcept { active_ = false; }

 private:
  std::function<void()> fn_;
  bool active_;
};

#define PINFLASH_SCOPE_EXIT(...)                                  \
  ::pinflash::ScopeGuard PINFLASH_CONCAT(scope_exit_, __LINE__)( \
      [&]() { __VA_ARGS__; })

}  // namespace pinflash

#endif  // PINFLASH_VOCABULARY_HPP_
