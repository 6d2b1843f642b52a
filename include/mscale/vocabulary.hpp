/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every mscale component.
 *
 * - expected<V, E> / expected<void, E>: value-or-error return type
 * - optional<T>: value-or-absence (absence is never an error here)
 * - FixedString<N>: fixed-capacity, NUL-terminated string
 * - FixedVector<T, N>: fixed-capacity vector with inline storage
 * - Library error enums and their string names
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_VOCABULARY_HPP_
#define MSCALE_VOCABULARY_HPP_

#include "mscale/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace mscale {

// ============================================================================
// Error Codes
// ============================================================================

/** Malformed "namespace/name" lookup key. */
enum class KeyError : uint8_t {
  kEmpty,
  kMissingSeparator,
  kEmptyNamespace,
  kEmptyName,
  kInvalidCharacter,
  kTooLong,
};

/** Scaling-bounds annotation misconfiguration. */
enum class BoundsError : uint8_t {
  kInvalidMinValue,
  kInvalidMaxValue,
  kNegativeMin,
  kNegativeMax,
  kMaxBelowMin,
};

/** In-memory store mutation failure. */
enum class StoreError : uint8_t {
  kFull,
  kNotFound,
  kAlreadyExists,
  kInvalidKey,
};

/** Node group discovery and resize failure. */
enum class NodeGroupError : uint8_t {
  kMalformedKey,
  kMisconfiguredBounds,
  kInvalidDelta,
  kAboveMaxSize,
  kBelowMinSize,
  kBelowCurrentSize,
  kNoReplicaWriter,
  kWriteFailed,
};

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kBufferFull,
  kFormatNotSupported,
  kInvalidValue,
};

inline constexpr const char* KeyErrorToString(KeyError e) noexcept {
  switch (e) {
    case KeyError::kEmpty: return "empty key";
    case KeyError::kMissingSeparator: return "missing '/' separator";
    case KeyError::kEmptyNamespace: return "empty namespace";
    case KeyError::kEmptyName: return "empty name";
    case KeyError::kInvalidCharacter: return "unexpected '/' in key part";
    case KeyError::kTooLong: return "key too long";
  }
  return "unknown";
}

inline constexpr const char* BoundsErrorToString(BoundsError e) noexcept {
  switch (e) {
    case BoundsError::kInvalidMinValue: return "min size is not an integer";
    case BoundsError::kInvalidMaxValue: return "max size is not an integer";
    case BoundsError::kNegativeMin: return "min size is negative";
    case BoundsError::kNegativeMax: return "max size is negative";
    case BoundsError::kMaxBelowMin: return "max size is below min size";
  }
  return "unknown";
}

inline constexpr const char* StoreErrorToString(StoreError e) noexcept {
  switch (e) {
    case StoreError::kFull: return "store full";
    case StoreError::kNotFound: return "object not found";
    case StoreError::kAlreadyExists: return "object already exists";
    case StoreError::kInvalidKey: return "invalid object key";
  }
  return "unknown";
}

inline constexpr const char* NodeGroupErrorToString(NodeGroupError e) noexcept {
  switch (e) {
    case NodeGroupError::kMalformedKey: return "malformed lookup key";
    case NodeGroupError::kMisconfiguredBounds: return "misconfigured bounds";
    case NodeGroupError::kInvalidDelta: return "invalid size delta";
    case NodeGroupError::kAboveMaxSize: return "size above max";
    case NodeGroupError::kBelowMinSize: return "size below min";
    case NodeGroupError::kBelowCurrentSize: return "size below member count";
    case NodeGroupError::kNoReplicaWriter: return "no replica writer";
    case NodeGroupError::kWriteFailed: return "replica write failed";
  }
  return "unknown";
}

inline constexpr const char* ConfigErrorToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "file not found";
    case ConfigError::kParseError: return "parse error";
    case ConfigError::kBufferFull: return "buffer full";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kInvalidValue: return "invalid value";
  }
  return "unknown";
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) { ::new (Ptr()) T(v); }

  optional(T&& v) : has_value_(true) { ::new (Ptr()) T(std::move(v)); }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (Ptr()) T(*other.Ptr());
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) ::new (Ptr()) T(std::move(*other.Ptr()));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (Ptr()) T(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (Ptr()) T(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & noexcept {
    MSCALE_ASSERT(has_value_);
    return *Ptr();
  }
  const T& value() const& noexcept {
    MSCALE_ASSERT(has_value_);
    return *Ptr();
  }

  T value_or(const T& default_val) const {
    return has_value_ ? *Ptr() : default_val;
  }

  T* operator->() noexcept { return Ptr(); }
  const T* operator->() const noexcept { return Ptr(); }
  T& operator*() noexcept { return *Ptr(); }
  const T& operator*() const noexcept { return *Ptr(); }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  T* Ptr() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* Ptr() const noexcept {
    return reinterpret_cast<const T*>(storage_);
  }

  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_;
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error return type.
 *
 * E must be default constructible and copyable (an enum or a small POD).
 */
template <typename V, typename E>
class expected {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (r.Ptr()) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (r.Ptr()) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(const E& e) {
    expected r;
    r.error_ = e;
    return r;
  }

  expected(const expected& other)
      : error_(other.error_), has_value_(other.has_value_) {
    if (has_value_) ::new (Ptr()) V(*other.Ptr());
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : error_(other.error_), has_value_(other.has_value_) {
    if (has_value_) ::new (Ptr()) V(std::move(*other.Ptr()));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) {
        ::new (Ptr()) V(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) {
        ::new (Ptr()) V(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    MSCALE_ASSERT(has_value_);
    return *Ptr();
  }
  const V& value() const& noexcept {
    MSCALE_ASSERT(has_value_);
    return *Ptr();
  }

  const E& get_error() const noexcept {
    MSCALE_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& default_val) const {
    return has_value_ ? *Ptr() : default_val;
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }

  V* Ptr() noexcept { return reinterpret_cast<V*>(storage_); }
  const V* Ptr() const noexcept {
    return reinterpret_cast<const V*>(storage_);
  }

  alignas(V) unsigned char storage_[sizeof(V)];
  E error_;
  bool has_value_;
};

template <typename E>
class expected<void, E> {
 public:
  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(const E& e) {
    expected r;
    r.error_ = e;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    MSCALE_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/** Tag selecting the truncating constructor / assign overloads. */
struct TruncateToCapacity_t {
  explicit TruncateToCapacity_t() = default;
};
inline constexpr TruncateToCapacity_t TruncateToCapacity{};

template <uint32_t Capacity>
class FixedString {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <size_t N>
  FixedString(const char (&str)[N]) noexcept : size_(0) {
    static_assert(N - 1 <= Capacity, "literal exceeds FixedString capacity");
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    assign(TruncateToCapacity, str,
           static_cast<uint32_t>(std::strlen(str)));
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    size_ = (len < Capacity) ? len : Capacity;
    std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() &&
           std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }

  bool operator!=(const char* other) const noexcept {
    return !(*this == other);
  }

  template <uint32_t M>
  bool operator<(const FixedString<M>& other) const noexcept {
    return std::strcmp(buf_, other.c_str()) < 0;
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_;
};

// ============================================================================
// FixedVector<T, Capacity>
// ============================================================================

template <typename T, uint32_t Capacity>
class FixedVector {
 public:
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept : size_(0) {}

  FixedVector(const FixedVector& other) : size_(0) {
    for (uint32_t i = 0; i < other.size_; ++i) {
      ::new (Data() + i) T(other.Data()[i]);
    }
    size_ = other.size_;
  }

  FixedVector(FixedVector&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : size_(0) {
    for (uint32_t i = 0; i < other.size_; ++i) {
      ::new (Data() + i) T(std::move(other.Data()[i]));
    }
    size_ = other.size_;
    other.clear();
  }

  FixedVector& operator=(const FixedVector& other) {
    if (this != &other) {
      clear();
      for (uint32_t i = 0; i < other.size_; ++i) {
        ::new (Data() + i) T(other.Data()[i]);
      }
      size_ = other.size_;
    }
    return *this;
  }

  FixedVector& operator=(FixedVector&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      clear();
      for (uint32_t i = 0; i < other.size_; ++i) {
        ::new (Data() + i) T(std::move(other.Data()[i]));
      }
      size_ = other.size_;
      other.clear();
    }
    return *this;
  }

  ~FixedVector() { clear(); }

  bool push_back(const T& v) {
    if (size_ >= Capacity) return false;
    ::new (Data() + size_) T(v);
    ++size_;
    return true;
  }

  bool push_back(T&& v) {
    if (size_ >= Capacity) return false;
    ::new (Data() + size_) T(std::move(v));
    ++size_;
    return true;
  }

  template <typename... Args>
  bool emplace_back(Args&&... args) {
    if (size_ >= Capacity) return false;
    ::new (Data() + size_) T(std::forward<Args>(args)...);
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0) return false;
    --size_;
    Data()[size_].~T();
    return true;
  }

  /** Remove element at @p index by moving the last element into its slot. */
  bool erase_unordered(uint32_t index) noexcept {
    if (index >= size_) return false;
    if (index != size_ - 1) {
      Data()[index] = std::move(Data()[size_ - 1]);
    }
    return pop_back();
  }

  void clear() noexcept {
    while (size_ > 0) {
      --size_;
      Data()[size_].~T();
    }
  }

  T& operator[](uint32_t i) noexcept {
    MSCALE_ASSERT(i < size_);
    return Data()[i];
  }
  const T& operator[](uint32_t i) const noexcept {
    MSCALE_ASSERT(i < size_);
    return Data()[i];
  }

  iterator begin() noexcept { return Data(); }
  iterator end() noexcept { return Data() + size_; }
  const_iterator begin() const noexcept { return Data(); }
  const_iterator end() const noexcept { return Data() + size_; }

  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0; }
  bool full() const noexcept { return size_ >= Capacity; }

 private:
  T* Data() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* Data() const noexcept {
    return reinterpret_cast<const T*>(storage_);
  }

  alignas(T) unsigned char storage_[sizeof(T) * Capacity];
  uint32_t size_;
};

}  // namespace mscale

#endif  // MSCALE_VOCABULARY_HPP_
