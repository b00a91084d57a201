/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all sbench modules.
 *
 * - expected<V, E>  : value-or-error return type (no exceptions)
 * - optional<T>     : nullable value
 * - FixedString<N>  : stack-allocated, bounded string
 * - ScopeGuard      : RAII cleanup (SBENCH_SCOPE_EXIT)
 * - Common error enums and strong ID types
 */

#ifndef SBENCH_VOCABULARY_HPP_
#define SBENCH_VOCABULARY_HPP_

#include "sbench/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace sbench {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kInvalidValue,
};

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kAlreadyRunning,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed through the named factories success() / error().
 * Accessing the wrong alternative is a programming error (asserts).
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v, kValueTag); }
  static expected success(V&& v) {
    return expected(static_cast<V&&>(v), kValueTag);
  }
  static expected error(E e) { return expected(e, kErrorTag); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      ::new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(static_cast<V&&>(other.storage_.value));
    } else {
      ::new (&storage_.err) E(static_cast<E&&>(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        ::new (&storage_.err) E(other.storage_.err);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(static_cast<V&&>(other.storage_.value));
      } else {
        ::new (&storage_.err) E(static_cast<E&&>(other.storage_.err));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    SBENCH_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    SBENCH_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    SBENCH_ASSERT(has_value_);
    return static_cast<V&&>(storage_.value);
  }

  const E& get_error() const {
    SBENCH_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  expected(const V& v, ValueTag) : has_value_(true) {
    ::new (&storage_.value) V(v);
  }
  expected(V&& v, ValueTag) : has_value_(true) {
    ::new (&storage_.value) V(static_cast<V&&>(v));
  }
  expected(E e, ErrorTag) : has_value_(false) {
    ::new (&storage_.err) E(static_cast<E&&>(e));
  }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/**
 * @brief expected<void, E> specialization: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() { return expected(true, E{}); }
  static expected error(E e) { return expected(false, static_cast<E&&>(e)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const {
    SBENCH_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) : err_(static_cast<E&&>(e)), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_.value) T(v);
  }
  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_.value) T(static_cast<T&&>(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) T(static_cast<T&&>(other.storage_.value));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_.value) T(other.storage_.value);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_.value) T(static_cast<T&&>(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() {
    SBENCH_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const {
    SBENCH_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting the truncating constructor / assign overload.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of Capacity chars.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&literal)[N]) noexcept  // NOLINT(runtime/explicit)
      : size_(0) {
    static_assert(N - 1 <= Capacity, "literal exceeds FixedString capacity");
    assign(TruncateToCapacity, literal);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str,
           (str != nullptr) ? static_cast<uint32_t>(std::strlen(str)) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      len = 0;
    }
    size_ = (len < Capacity) ? len : Capacity;
    if (size_ > 0) {
      std::memcpy(buf_, str, size_);
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* other) const noexcept {
    return (other != nullptr) && std::strcmp(buf_, other) == 0;
  }
  bool operator!=(const char* other) const noexcept {
    return !(*this == other);
  }

  template <uint32_t N>
  bool operator==(const FixedString<N>& other) const noexcept {
    return size_ == other.size() && std::strcmp(buf_, other.c_str()) == 0;
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F&& fn) noexcept
      : fn_(static_cast<F&&>(fn)), active_(true) {}
  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(static_cast<F&&>(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }
  ~ScopeGuard() {
    if (active_) fn_();
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

 private:
  F fn_;
  bool active_;
};

namespace detail {
struct ScopeGuardOnExit {};
template <typename F>
ScopeGuard<F> operator+(ScopeGuardOnExit, F&& fn) {
  return ScopeGuard<F>(static_cast<F&&>(fn));
}
}  // namespace detail

#define SBENCH_SCOPE_EXIT(...)                                  \
  auto SBENCH_CONCAT(sbench_scope_exit_, __LINE__) =            \
      ::sbench::detail::ScopeGuardOnExit{} + [&]() { __VA_ARGS__; }

// ============================================================================
// Strong ID Types
// ============================================================================

class TimerTaskId final {
 public:
  constexpr TimerTaskId() noexcept : value_(0) {}
  constexpr explicit TimerTaskId(uint64_t v) noexcept : value_(v) {}
  constexpr uint64_t value() const noexcept { return value_; }
  bool operator==(const TimerTaskId& o) const noexcept {
    return value_ == o.value_;
  }
  bool operator!=(const TimerTaskId& o) const noexcept {
    return value_ != o.value_;
  }

 private:
  uint64_t value_;
};

}  // namespace sbench

#endif  // SBENCH_VOCABULARY_HPP_
