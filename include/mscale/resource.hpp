/**
 * @file resource.hpp
 * @brief Cluster resource model: Node, Machine, MachineSet, MachineDeployment.
 *
 * All resources are plain value types. Copying one yields a deep,
 * independently owned copy, so objects read from a cache can be modified
 * by the caller without affecting the cache.
 *
 * Owner and node references are identity records only (kind, name, uid).
 * They are never dereferenced directly; see owner_resolver.hpp for the
 * verified lookup.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_RESOURCE_HPP_
#define MSCALE_RESOURCE_HPP_

#include "mscale/platform.hpp"
#include "mscale/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>

namespace mscale {

// ============================================================================
// Configuration Constants
// ============================================================================

#ifndef MSCALE_MAX_ANNOTATIONS
#define MSCALE_MAX_ANNOTATIONS 16U
#endif

#ifndef MSCALE_MAX_LABELS
#define MSCALE_MAX_LABELS 16U
#endif

#ifndef MSCALE_MAX_OWNER_REFERENCES
#define MSCALE_MAX_OWNER_REFERENCES 4U
#endif

inline constexpr uint32_t kMaxNamespaceLen = 63;   // DNS label
inline constexpr uint32_t kMaxNameLen = 253;       // DNS subdomain
inline constexpr uint32_t kMaxKeyLen = kMaxNamespaceLen + 1 + kMaxNameLen;

using Namespace = FixedString<kMaxNamespaceLen>;
using Name = FixedString<kMaxNameLen>;
using Uid = FixedString<63>;
using KindName = FixedString<31>;
using ProviderId = FixedString<255>;
using AnnotationKey = FixedString<127>;
using AnnotationValue = FixedString<255>;
using LabelKey = FixedString<127>;
using LabelValue = FixedString<63>;
using KeyString = FixedString<kMaxKeyLen>;

inline constexpr const char kKindNode[] = "Node";
inline constexpr const char kKindMachine[] = "Machine";
inline constexpr const char kKindMachineSet[] = "MachineSet";
inline constexpr const char kKindMachineDeployment[] = "MachineDeployment";

// ============================================================================
// FixedStringMap - small ordered-by-insertion string map
// ============================================================================

template <typename K, typename V, uint32_t MaxEntries>
class FixedStringMap {
 public:
  struct Entry {
    K key;
    V value;
  };

  /** @return false when the map is full and @p key is new. */
  bool Set(const char* key, const char* value) {
    for (Entry& e : entries_) {
      if (e.key == key) {
        e.value.assign(TruncateToCapacity, value);
        return true;
      }
    }
    Entry e;
    e.key.assign(TruncateToCapacity, key);
    e.value.assign(TruncateToCapacity, value);
    return entries_.push_back(e);
  }

  /** @return the stored value, or nullptr when @p key is absent. */
  const V* Find(const char* key) const noexcept {
    for (const Entry& e : entries_) {
      if (e.key == key) return &e.value;
    }
    return nullptr;
  }

  bool Contains(const char* key) const noexcept { return Find(key) != nullptr; }

  bool Erase(const char* key) noexcept {
    for (uint32_t i = 0; i < entries_.size(); ++i) {
      if (entries_[i].key == key) return entries_.erase_unordered(i);
    }
    return false;
  }

  void Clear() noexcept { entries_.clear(); }
  uint32_t Size() const noexcept { return entries_.size(); }
  bool Empty() const noexcept { return entries_.empty(); }

  const Entry* begin() const noexcept { return entries_.begin(); }
  const Entry* end() const noexcept { return entries_.end(); }

 private:
  FixedVector<Entry, MaxEntries> entries_;
};

using Annotations =
    FixedStringMap<AnnotationKey, AnnotationValue, MSCALE_MAX_ANNOTATIONS>;
using Labels = FixedStringMap<LabelKey, LabelValue, MSCALE_MAX_LABELS>;

// ============================================================================
// Object Metadata
// ============================================================================

/** Identity back-pointer to the resource that created an object. */
struct OwnerReference {
  KindName kind;
  Name name;
  Uid uid;
};

/** Kind + name pointer from a Machine to its Node. */
struct ObjectReference {
  KindName kind;
  Name name;
};

struct ObjectMeta {
  Namespace ns;  // empty for cluster-scoped objects (Node)
  Name name;
  Uid uid;
  Labels labels;
  Annotations annotations;
  FixedVector<OwnerReference, MSCALE_MAX_OWNER_REFERENCES> owner_references;
};

/** First owner reference of @p kind, or nullptr. */
inline const OwnerReference* FindOwnerReference(const ObjectMeta& meta,
                                                const char* kind) noexcept {
  for (const OwnerReference& ref : meta.owner_references) {
    if (ref.kind == kind) return &ref;
  }
  return nullptr;
}

// ============================================================================
// Resources
// ============================================================================

struct Node {
  static constexpr const char* kKind = kKindNode;

  ObjectMeta meta;
  ProviderId provider_id;  // empty until assigned by the infrastructure
};

struct Machine {
  static constexpr const char* kKind = kKindMachine;

  ObjectMeta meta;
  ProviderId provider_id;           // empty until provisioning completes
  optional<ObjectReference> node_ref;  // set once a Node is linked
};

struct MachineSet {
  static constexpr const char* kKind = kKindMachineSet;

  ObjectMeta meta;
  int32_t replicas = 0;
};

struct MachineDeployment {
  static constexpr const char* kKind = kKindMachineDeployment;

  ObjectMeta meta;
  int32_t replicas = 0;
};

// ============================================================================
// ObjectKey - validated "namespace/name"
// ============================================================================

struct ObjectKey {
  Namespace ns;
  Name name;

  KeyString ToString() const noexcept {
    char buf[kMaxKeyLen + 1];
    int n = std::snprintf(buf, sizeof(buf), "%s/%s", ns.c_str(), name.c_str());
    return KeyString(TruncateToCapacity, buf,
                     static_cast<uint32_t>(n < 0 ? 0 : n));
  }
};

/**
 * @brief Validate a namespaced key given as separate parts.
 * @return KeyError when either part is empty, too long, or contains '/'.
 */
inline expected<ObjectKey, KeyError> MakeObjectKey(const char* ns,
                                                   const char* name) noexcept {
  if (ns == nullptr || ns[0] == '\0') {
    return expected<ObjectKey, KeyError>::error(KeyError::kEmptyNamespace);
  }
  if (name == nullptr || name[0] == '\0') {
    return expected<ObjectKey, KeyError>::error(KeyError::kEmptyName);
  }
  if (std::strchr(ns, '/') != nullptr || std::strchr(name, '/') != nullptr) {
    return expected<ObjectKey, KeyError>::error(KeyError::kInvalidCharacter);
  }
  if (std::strlen(ns) > kMaxNamespaceLen || std::strlen(name) > kMaxNameLen) {
    return expected<ObjectKey, KeyError>::error(KeyError::kTooLong);
  }
  ObjectKey key;
  key.ns.assign(TruncateToCapacity, ns);
  key.name.assign(TruncateToCapacity, name);
  return expected<ObjectKey, KeyError>::success(key);
}

/**
 * @brief Parse a "namespace/name" string. A second '/' is rejected by
 * MakeObjectKey as kInvalidCharacter.
 */
inline expected<ObjectKey, KeyError> ParseObjectKey(const char* str) noexcept {
  if (str == nullptr || str[0] == '\0') {
    return expected<ObjectKey, KeyError>::error(KeyError::kEmpty);
  }
  const char* slash = std::strchr(str, '/');
  if (slash == nullptr) {
    return expected<ObjectKey, KeyError>::error(KeyError::kMissingSeparator);
  }
  uint32_t ns_len = static_cast<uint32_t>(slash - str);
  if (ns_len == 0) {
    return expected<ObjectKey, KeyError>::error(KeyError::kEmptyNamespace);
  }
  if (ns_len > kMaxNamespaceLen) {
    return expected<ObjectKey, KeyError>::error(KeyError::kTooLong);
  }
  char ns[kMaxNamespaceLen + 1];
  std::memcpy(ns, str, ns_len);
  ns[ns_len] = '\0';
  return MakeObjectKey(ns, slash + 1);
}

/** Cache key of an object: "namespace/name", or "name" when cluster-scoped. */
inline KeyString StoreKey(const char* ns, const char* name) noexcept {
  if (ns == nullptr || ns[0] == '\0') {
    return KeyString(TruncateToCapacity, name);
  }
  char buf[kMaxKeyLen + 1];
  int n = std::snprintf(buf, sizeof(buf), "%s/%s", ns, name);
  return KeyString(TruncateToCapacity, buf,
                   static_cast<uint32_t>(n < 0 ? 0 : n));
}

inline KeyString StoreKey(const ObjectMeta& meta) noexcept {
  return StoreKey(meta.ns.c_str(), meta.name.c_str());
}

// ============================================================================
// LabelSelector
// ============================================================================

/** Equality-based selector; an empty selector matches everything. */
struct LabelSelector {
  Labels match_labels;

  static LabelSelector Everything() noexcept { return LabelSelector{}; }

  bool Matches(const Labels& labels) const noexcept {
    for (const auto& want : match_labels) {
      const LabelValue* got = labels.Find(want.key.c_str());
      if (got == nullptr || *got != want.value) return false;
    }
    return true;
  }
};

}  // namespace mscale

#endif  // MSCALE_RESOURCE_HPP_
