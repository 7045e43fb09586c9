/**
 * @file vocabulary.hpp
 * @brief Shared vocabulary types: expected, optional, FixedString, NewType
 *        and the cross-module error enumerations.
 *
 * All types are header-only and usable without exceptions or RTTI. Storage
 * is in-place (no heap allocation by the vocabulary types themselves).
 */

#ifndef AWP_VOCABULARY_HPP_
#define AWP_VOCABULARY_HPP_

#include "awp/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace awp {

// ============================================================================
// Error Enumerations
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotFound,
  kAlreadyRunning,
  kSpawnFailed,
};

// ============================================================================
// NewType - Strong typedef
// ============================================================================

template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : val_{} {}
  constexpr explicit NewType(T v) noexcept : val_(v) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& rhs) const noexcept { return val_ == rhs.val_; }
  constexpr bool operator!=(const NewType& rhs) const noexcept { return val_ != rhs.val_; }

 private:
  T val_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error return type.
 *
 * Constructed only through the named factories success() / error(), so the
 * active alternative is always explicit at the call site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(ValueTag{}, v); }
  static expected success(V&& v) { return expected(ValueTag{}, std::move(v)); }
  static expected error(E e) { return expected(ErrorTag{}, std::move(e)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(storage_)) V(*other.ValuePtr());
    } else {
      ::new (static_cast<void*>(storage_)) E(*other.ErrorPtr());
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value &&
                                      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(storage_)) V(std::move(*other.ValuePtr()));
    } else {
      ::new (static_cast<void*>(storage_)) E(std::move(*other.ErrorPtr()));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(storage_)) V(*other.ValuePtr());
      } else {
        ::new (static_cast<void*>(storage_)) E(*other.ErrorPtr());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value &&
                                                 std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(storage_)) V(std::move(*other.ValuePtr()));
      } else {
        ::new (static_cast<void*>(storage_)) E(std::move(*other.ErrorPtr()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    AWP_ASSERT(has_value_);
    return *ValuePtr();
  }
  const V& value() const& {
    AWP_ASSERT(has_value_);
    return *ValuePtr();
  }
  V&& value() && {
    AWP_ASSERT(has_value_);
    return std::move(*ValuePtr());
  }

  V value_or(const V& default_val) const& { return has_value_ ? *ValuePtr() : default_val; }

  const E& get_error() const& {
    AWP_ASSERT(!has_value_);
    return *ErrorPtr();
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename... Args>
  explicit expected(ValueTag, Args&&... args) : has_value_(true) {
    ::new (static_cast<void*>(storage_)) V(std::forward<Args>(args)...);
  }

  explicit expected(ErrorTag, E&& e) : has_value_(false) {
    ::new (static_cast<void*>(storage_)) E(std::move(e));
  }

  V* ValuePtr() noexcept { return std::launder(reinterpret_cast<V*>(storage_)); }
  const V* ValuePtr() const noexcept { return std::launder(reinterpret_cast<const V*>(storage_)); }
  E* ErrorPtr() noexcept { return std::launder(reinterpret_cast<E*>(storage_)); }
  const E* ErrorPtr() const noexcept { return std::launder(reinterpret_cast<const E*>(storage_)); }

  void Destroy() noexcept {
    if (has_value_) {
      ValuePtr()->~V();
    } else {
      ErrorPtr()->~E();
    }
  }

  static constexpr size_t kStorageSize = (sizeof(V) > sizeof(E)) ? sizeof(V) : sizeof(E);

  alignas(V) alignas(E) unsigned char storage_[kStorageSize];
  bool has_value_;
};

/** @brief expected<void, E>: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(E e) noexcept {
    expected r;
    r.has_value_ = false;
    r.err_ = e;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    AWP_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(true) {}

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

  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(storage_)) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(storage_)) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(storage_)) T(*other.Ptr());
    }
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(storage_)) T(std::move(*other.Ptr()));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) T(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) T(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (static_cast<void*>(storage_)) T(std::forward<Args>(args)...);
    has_value_ = true;
    return *Ptr();
  }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & {
    AWP_ASSERT(has_value_);
    return *Ptr();
  }
  const T& value() const& {
    AWP_ASSERT(has_value_);
    return *Ptr();
  }
  T&& value() && {
    AWP_ASSERT(has_value_);
    return std::move(*Ptr());
  }

  T value_or(const T& default_val) const& { return has_value_ ? *Ptr() : default_val; }

 private:
  T* Ptr() noexcept { return std::launder(reinterpret_cast<T*>(storage_)); }
  const T* Ptr() const noexcept { return std::launder(reinterpret_cast<const T*>(storage_)); }

  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Bounded, null-terminated string stored inline.
 *
 * Literal construction is checked at compile time; runtime strings must go
 * through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0U, "FixedString capacity must be > 0");

 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept : size_(0U) {  // NOLINT(google-explicit-constructor)
    static_assert(N - 1U <= Capacity, "String literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N - 1U);
    size_ = N - 1U;
    buf_[size_] = '\0';
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t count) noexcept : size_(0U) {
    assign(TruncateToCapacity, str, count);
  }

  FixedString& assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return *this;
    }
    return assign(TruncateToCapacity, str, static_cast<uint32_t>(std::strlen(str)));
  }

  FixedString& assign(TruncateToCapacity_t, const char* str, uint32_t count) noexcept {
    if (str == nullptr) {
      clear();
      return *this;
    }
    const uint32_t n = (count > Capacity) ? Capacity : count;
    std::memcpy(buf_, str, n);
    size_ = n;
    buf_[size_] = '\0';
    return *this;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  bool operator==(const char* rhs) const noexcept {
    return (rhs != nullptr) && (std::strcmp(buf_, rhs) == 0);
  }
  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return (size_ == rhs.size()) && (std::memcmp(buf_, rhs.c_str(), size_) == 0);
  }
  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

}  // namespace awp

#endif  // AWP_VOCABULARY_HPP_
