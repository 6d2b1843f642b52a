/**
 * @file node_group.hpp
 * @brief NodeGroup: a scalable view over a MachineSet or MachineDeployment.
 *
 * A NodeGroup is derived on demand from its root resource and validated
 * scaling bounds; it is a snapshot and is never stored back. The root is a
 * tagged variant:
 *   - MachineSet-rooted:        root -> Machines (one owner hop)
 *   - MachineDeployment-rooted: root -> MachineSets -> Machines (two hops)
 *
 * Resizing is delegated to a ReplicaWriter supplied by the embedding
 * process (the component that patches the declared replica count).
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_NODE_GROUP_HPP_
#define MSCALE_NODE_GROUP_HPP_

#include "mscale/cache.hpp"
#include "mscale/correlator.hpp"
#include "mscale/log.hpp"
#include "mscale/options.hpp"
#include "mscale/owner_resolver.hpp"
#include "mscale/resource.hpp"
#include "mscale/scaling_bounds.hpp"
#include "mscale/vocabulary.hpp"

#include <cstdio>
#include <map>
#include <utility>
#include <variant>
#include <vector>

namespace mscale {

using ScalableResource = std::variant<MachineSet, MachineDeployment>;

enum class RootKind : uint8_t {
  kMachineSet = 0,
  kMachineDeployment = 1,
};

/** One registered member of a node group. */
struct Instance {
  ProviderId id;   // provider id reported to the capacity manager
  Name node_name;  // empty when the Node is not cached yet
};

using GroupId = FixedString<31 + 1 + kMaxKeyLen>;
using GroupDebug = FixedString<511>;

// ============================================================================
// ReplicaWriter - external resize collaborator
// ============================================================================

class ReplicaWriter {
 public:
  virtual ~ReplicaWriter() = default;

  /**
   * @brief Set the declared replica count of a scalable resource.
   * @return kWriteFailed (or any NodeGroupError) on failure.
   */
  virtual expected<void, NodeGroupError> SetReplicas(const char* kind,
                                                     const char* ns,
                                                     const char* name,
                                                     int32_t replicas) = 0;
};

// ============================================================================
// NodeGroup
// ============================================================================

class NodeGroup {
 public:
  NodeGroup(ScalableResource root, const ScalingBounds& bounds,
            const ResourceCache& cache, const AnnotationKeys& keys,
            ReplicaWriter* writer = nullptr)
      : root_(std::move(root)),
        bounds_(bounds),
        cache_(cache),
        keys_(keys),
        writer_(writer) {}

  RootKind Root() const noexcept {
    return std::holds_alternative<MachineSet>(root_)
               ? RootKind::kMachineSet
               : RootKind::kMachineDeployment;
  }

  const char* Kind() const noexcept {
    return Root() == RootKind::kMachineSet ? kKindMachineSet
                                           : kKindMachineDeployment;
  }

  const ObjectMeta& Meta() const noexcept {
    if (const auto* ms = std::get_if<MachineSet>(&root_)) return ms->meta;
    return std::get_if<MachineDeployment>(&root_)->meta;
  }

  const char* Namespace() const noexcept { return Meta().ns.c_str(); }
  const char* Name() const noexcept { return Meta().name.c_str(); }
  const char* Uid() const noexcept { return Meta().uid.c_str(); }

  /** "<Kind>/<namespace>/<name>" */
  GroupId Id() const noexcept {
    char buf[GroupId::capacity() + 1];
    int n = std::snprintf(buf, sizeof(buf), "%s/%s/%s", Kind(), Namespace(),
                          Name());
    return GroupId(TruncateToCapacity, buf,
                   static_cast<uint32_t>(n < 0 ? 0 : n));
  }

  int32_t MinSize() const noexcept { return bounds_.min_size; }
  int32_t MaxSize() const noexcept { return bounds_.max_size; }

  /** Declared (desired) replica count of the root resource. */
  int32_t Size() const noexcept {
    if (const auto* ms = std::get_if<MachineSet>(&root_)) return ms->replicas;
    return std::get_if<MachineDeployment>(&root_)->replicas;
  }

  /**
   * @brief Registered members of the group.
   *
   * Per Machine: its provider id when set, else the provider id of the Node
   * named by its node reference. A Machine with neither is mid-provisioning
   * and contributes nothing.
   */
  std::vector<Instance> Members() const {
    std::vector<Instance> out;
    const NodeIndex nodes = IndexNodes();
    if (const auto* ms = std::get_if<MachineSet>(&root_)) {
      AppendMachineSetMembers(*ms, nodes, out);
      return out;
    }
    const auto& md = *std::get_if<MachineDeployment>(&root_);
    for (const MachineSet& ms : cache_.MachineSets().List(md.meta.ns.c_str())) {
      if (IsOwnedBy(ms.meta, kKindMachineDeployment, md.meta)) {
        AppendMachineSetMembers(ms, nodes, out);
      }
    }
    return out;
  }

  /**
   * @brief Whether @p node correlates to this group's root.
   * @return KeyError when a machine link or owner reference is malformed.
   */
  expected<bool, KeyError> Belongs(const Node& node) const {
    using Result = expected<bool, KeyError>;
    Correlator correlator(cache_, keys_);
    auto machine = correlator.FindMachineForNode(node);
    if (!machine.has_value()) return Result::error(machine.get_error());
    if (!machine.value().has_value()) return Result::success(false);

    OwnerResolver resolver(cache_);
    auto ms = resolver.MachineSetOf(*machine.value());
    if (!ms.has_value()) return Result::error(ms.get_error());
    if (!ms.value().has_value()) return Result::success(false);

    if (Root() == RootKind::kMachineSet) {
      return Result::success(SameIdentity(ms.value()->meta, Meta()));
    }
    auto md = resolver.MachineDeploymentOf(*ms.value());
    if (!md.has_value()) return Result::error(md.get_error());
    return Result::success(md.value().has_value() &&
                           SameIdentity(md.value()->meta, Meta()));
  }

  /** Set the declared replica count; @p size must lie in [min, max]. */
  expected<void, NodeGroupError> SetSize(int32_t size) {
    if (size > bounds_.max_size) {
      return expected<void, NodeGroupError>::error(NodeGroupError::kAboveMaxSize);
    }
    if (size < bounds_.min_size) {
      return expected<void, NodeGroupError>::error(NodeGroupError::kBelowMinSize);
    }
    return WriteReplicas(size);
  }

  expected<void, NodeGroupError> IncreaseSize(int32_t delta) {
    if (delta <= 0) {
      return expected<void, NodeGroupError>::error(NodeGroupError::kInvalidDelta);
    }
    int64_t target = static_cast<int64_t>(Size()) + delta;
    if (target > bounds_.max_size) {
      return expected<void, NodeGroupError>::error(NodeGroupError::kAboveMaxSize);
    }
    return WriteReplicas(static_cast<int32_t>(target));
  }

  /**
   * @brief Shrink the declared size without deleting registered members.
   * @param delta Negative amount.
   */
  expected<void, NodeGroupError> DecreaseTargetSize(int32_t delta) {
    if (delta >= 0) {
      return expected<void, NodeGroupError>::error(NodeGroupError::kInvalidDelta);
    }
    int64_t target = static_cast<int64_t>(Size()) + delta;
    if (target < bounds_.min_size) {
      return expected<void, NodeGroupError>::error(NodeGroupError::kBelowMinSize);
    }
    if (target < static_cast<int64_t>(Members().size())) {
      return expected<void, NodeGroupError>::error(
          NodeGroupError::kBelowCurrentSize);
    }
    return WriteReplicas(static_cast<int32_t>(target));
  }

  GroupDebug Debug() const noexcept {
    char buf[GroupDebug::capacity() + 1];
    int n = std::snprintf(buf, sizeof(buf), "%s (min: %d, max: %d, replicas: %d)",
                          Id().c_str(), MinSize(), MaxSize(), Size());
    return GroupDebug(TruncateToCapacity, buf,
                      static_cast<uint32_t>(n < 0 ? 0 : n));
  }

  const ScalableResource& Resource() const noexcept { return root_; }

 private:
  static bool SameIdentity(const ObjectMeta& a, const ObjectMeta& b) noexcept {
    return a.ns == b.ns && a.name == b.name && a.uid == b.uid;
  }

  // Built once per Members() call; the Node list is read a single time.
  struct NodeIndex {
    std::map<ProviderId, ::mscale::Name> by_provider;
    std::map<::mscale::Name, ProviderId> by_name;
  };

  NodeIndex IndexNodes() const {
    NodeIndex index;
    for (const Node& n : cache_.Nodes().List("")) {
      index.by_name.emplace(n.meta.name, n.provider_id);
      if (!n.provider_id.empty()) {
        index.by_provider.emplace(n.provider_id, n.meta.name);
      }
    }
    return index;
  }

  void AppendMachineSetMembers(const MachineSet& ms, const NodeIndex& nodes,
                               std::vector<Instance>& out) const {
    for (const Machine& m : cache_.Machines().List(ms.meta.ns.c_str())) {
      if (!IsOwnedBy(m.meta, kKindMachineSet, ms.meta)) continue;

      Instance inst;
      if (!m.provider_id.empty()) {
        inst.id = m.provider_id;
        auto it = nodes.by_provider.find(m.provider_id);
        if (it != nodes.by_provider.end()) inst.node_name = it->second;
        out.push_back(inst);
        continue;
      }

      if (!m.node_ref.has_value() || m.node_ref->name.empty()) {
        MSCALE_LOG_DEBUG("NodeGroup", "%s/%s: machine %s not linked to a node",
                         ms.meta.ns.c_str(), ms.meta.name.c_str(),
                         m.meta.name.c_str());
        continue;
      }

      auto it = nodes.by_name.find(m.node_ref->name);
      if (it == nodes.by_name.end() || it->second.empty()) {
        MSCALE_LOG_DEBUG("NodeGroup", "%s/%s: node %s of machine %s not ready",
                         ms.meta.ns.c_str(), ms.meta.name.c_str(),
                         m.node_ref->name.c_str(), m.meta.name.c_str());
        continue;
      }
      inst.id = it->second;
      inst.node_name = it->first;
      out.push_back(inst);
    }
  }

  expected<void, NodeGroupError> WriteReplicas(int32_t replicas) {
    if (writer_ == nullptr) {
      return expected<void, NodeGroupError>::error(
          NodeGroupError::kNoReplicaWriter);
    }
    auto r = writer_->SetReplicas(Kind(), Namespace(), Name(), replicas);
    if (!r.has_value()) {
      MSCALE_LOG_WARN("NodeGroup", "%s: set replicas %d failed: %s",
                      Id().c_str(), replicas,
                      NodeGroupErrorToString(r.get_error()));
      return r;
    }
    MSCALE_LOG_INFO("NodeGroup", "%s: replicas %d -> %d", Id().c_str(), Size(),
                    replicas);
    if (auto* ms = std::get_if<MachineSet>(&root_)) {
      ms->replicas = replicas;
    } else {
      std::get_if<MachineDeployment>(&root_)->replicas = replicas;
    }
    return r;
  }

  ScalableResource root_;
  ScalingBounds bounds_;
  ResourceCache cache_;
  AnnotationKeys keys_;
  ReplicaWriter* writer_;
};

}  // namespace mscale

#endif  // MSCALE_NODE_GROUP_HPP_
