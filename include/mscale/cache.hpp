/**
 * @file cache.hpp
 * @brief Synchronized resource cache boundary and an in-memory implementation.
 *
 * Lister<T> is the read interface the discovery core consumes. A watch-driven
 * cache (list-then-watch against the cluster API) implements it outside this
 * library; MemoryStore<T> implements it for embedding and tests.
 *
 * Reads return value copies. Callers may modify what they get back without
 * touching the cache.
 *
 * Header-only, C++17.
 */

#ifndef MSCALE_CACHE_HPP_
#define MSCALE_CACHE_HPP_

#include "mscale/resource.hpp"
#include "mscale/vocabulary.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

#ifndef MSCALE_STORE_DEFAULT_CAPACITY
#define MSCALE_STORE_DEFAULT_CAPACITY 4096U
#endif

namespace mscale {

// ============================================================================
// Lister<T> - read boundary of a synchronized cache
// ============================================================================

template <typename T>
class Lister {
 public:
  virtual ~Lister() = default;

  /**
   * @brief Indexed lookup.
   * @param ns Namespace, empty for cluster-scoped kinds.
   * @return Copy of the object, or empty when the cache has no such key.
   */
  virtual optional<T> Get(const char* ns, const char* name) const = 0;

  /**
   * @brief Snapshot of every object matching @p selector.
   * @param ns Namespace to list, empty for all namespaces.
   */
  virtual std::vector<T> List(const char* ns,
                              const LabelSelector& selector) const = 0;

  std::vector<T> List(const char* ns) const {
    return List(ns, LabelSelector::Everything());
  }
};

// ============================================================================
// MemoryStore<T>
// ============================================================================

/**
 * @brief Thread-safe in-memory Lister.
 *
 * Readers share the lock; Add/Update/Delete take it exclusively, so a
 * background synchronizer can apply events while discovery reads.
 */
template <typename T>
class MemoryStore final : public Lister<T> {
 public:
  using Lister<T>::List;

  explicit MemoryStore(uint32_t capacity = MSCALE_STORE_DEFAULT_CAPACITY)
      : capacity_(capacity) {}

  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  optional<T> Get(const char* ns, const char* name) const override {
    KeyString key = StoreKey(ns, name);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return {};
    return optional<T>(it->second);
  }

  std::vector<T> List(const char* ns,
                      const LabelSelector& selector) const override {
    std::vector<T> out;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& kv : objects_) {
      const ObjectMeta& meta = kv.second.meta;
      if (ns != nullptr && ns[0] != '\0' && meta.ns != ns) continue;
      if (!selector.Matches(meta.labels)) continue;
      out.push_back(kv.second);
    }
    return out;
  }

  /** Insert a new object; fails with kAlreadyExists if the key is taken. */
  expected<void, StoreError> Add(const T& obj) {
    if (obj.meta.name.empty()) {
      return expected<void, StoreError>::error(StoreError::kInvalidKey);
    }
    KeyString key = StoreKey(obj.meta);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (objects_.find(key) != objects_.end()) {
      return expected<void, StoreError>::error(StoreError::kAlreadyExists);
    }
    if (objects_.size() >= capacity_) {
      return expected<void, StoreError>::error(StoreError::kFull);
    }
    objects_.emplace(key, obj);
    return expected<void, StoreError>::success();
  }

  /** Replace an existing object; fails with kNotFound if absent. */
  expected<void, StoreError> Update(const T& obj) {
    KeyString key = StoreKey(obj.meta);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
      return expected<void, StoreError>::error(StoreError::kNotFound);
    }
    it->second = obj;
    return expected<void, StoreError>::success();
  }

  expected<void, StoreError> Delete(const char* ns, const char* name) {
    KeyString key = StoreKey(ns, name);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (objects_.erase(key) == 0) {
      return expected<void, StoreError>::error(StoreError::kNotFound);
    }
    return expected<void, StoreError>::success();
  }

  expected<void, StoreError> Delete(const T& obj) {
    return Delete(obj.meta.ns.c_str(), obj.meta.name.c_str());
  }

  void Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    objects_.clear();
  }

  uint32_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<uint32_t>(objects_.size());
  }

 private:
  mutable std::shared_mutex mutex_;
  std::map<KeyString, T> objects_;
  uint32_t capacity_;
};

// ============================================================================
// ResourceCache - the four listers the discovery core reads
// ============================================================================

class ResourceCache {
 public:
  ResourceCache(const Lister<Node>& nodes, const Lister<Machine>& machines,
                const Lister<MachineSet>& machine_sets,
                const Lister<MachineDeployment>& machine_deployments) noexcept
      : nodes_(&nodes),
        machines_(&machines),
        machine_sets_(&machine_sets),
        machine_deployments_(&machine_deployments) {}

  const Lister<Node>& Nodes() const noexcept { return *nodes_; }
  const Lister<Machine>& Machines() const noexcept { return *machines_; }
  const Lister<MachineSet>& MachineSets() const noexcept {
    return *machine_sets_;
  }
  const Lister<MachineDeployment>& MachineDeployments() const noexcept {
    return *machine_deployments_;
  }

 private:
  const Lister<Node>* nodes_;
  const Lister<Machine>* machines_;
  const Lister<MachineSet>* machine_sets_;
  const Lister<MachineDeployment>* machine_deployments_;
};

/** Four MemoryStores bundled with a ResourceCache view over them. */
struct MemoryCache {
  MemoryStore<Node> nodes;
  MemoryStore<Machine> machines;
  MemoryStore<MachineSet> machine_sets;
  MemoryStore<MachineDeployment> machine_deployments;

  ResourceCache View() const noexcept {
    return ResourceCache(nodes, machines, machine_sets, machine_deployments);
  }
};

}  // namespace mscale

#endif  // MSCALE_CACHE_HPP_
