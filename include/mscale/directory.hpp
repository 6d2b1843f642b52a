/**
 * @file directory.hpp
 * @brief NodeGroupDirectory: enumerates scalable node groups and maps nodes
 *        to the group that owns them.
 *
 * Candidate selection in ListNodeGroups():
 *   - every MachineDeployment
 *   - every MachineSet without a resolvable MachineDeployment owner
 *     (a MachineSet whose MachineDeployment is gone falls back to being its
 *     own candidate)
 *
 * Only the root of a hierarchy is checked for scaling bounds. A candidate
 * with missing or degenerate (min == max) bounds is skipped; a candidate
 * with misconfigured bounds aborts the whole enumeration so the caller
 * never acts on a partial group set.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_DIRECTORY_HPP_
#define MSCALE_DIRECTORY_HPP_

#include "mscale/cache.hpp"
#include "mscale/correlator.hpp"
#include "mscale/log.hpp"
#include "mscale/node_group.hpp"
#include "mscale/options.hpp"
#include "mscale/owner_resolver.hpp"
#include "mscale/resource.hpp"
#include "mscale/scaling_bounds.hpp"
#include "mscale/vocabulary.hpp"

#include <utility>
#include <vector>

namespace mscale {

/** Why a directory query failed, and on which resource. */
struct NodeGroupFailure {
  NodeGroupError code = NodeGroupError::kMalformedKey;
  BoundsError bounds = BoundsError::kInvalidMinValue;  // kMisconfiguredBounds
  KeyError key = KeyError::kEmpty;                     // kMalformedKey
  KindName kind;
  KeyString resource;  // "namespace/name"
};

class NodeGroupDirectory {
 public:
  using ListResult = expected<std::vector<NodeGroup>, NodeGroupFailure>;
  using LookupResult = expected<optional<NodeGroup>, NodeGroupFailure>;

  NodeGroupDirectory(const ResourceCache& cache, const DiscoveryOptions& opts,
                     ReplicaWriter* writer = nullptr) noexcept
      : cache_(cache), opts_(opts), writer_(writer) {}

  /**
   * @brief All scalable node groups in scope.
   * @return NodeGroupFailure for the first misconfigured candidate or
   * malformed owner reference; no partial result is returned.
   */
  ListResult ListNodeGroups() const {
    OwnerResolver resolver(cache_);
    std::vector<ScalableResource> candidates;

    for (MachineSet& ms :
         cache_.MachineSets().List(opts_.scope_namespace.c_str())) {
      auto owner = resolver.MachineDeploymentOf(ms);
      if (!owner.has_value()) {
        return ListResult::error(KeyFailure(kKindMachineSet, ms.meta,
                                            owner.get_error()));
      }
      if (owner.value().has_value()) continue;
      if (FindOwnerReference(ms.meta, kKindMachineDeployment) != nullptr) {
        MSCALE_LOG_DEBUG("Directory",
                         "machineset %s/%s: deployment owner unresolved, "
                         "using machineset as root",
                         ms.meta.ns.c_str(), ms.meta.name.c_str());
      }
      candidates.emplace_back(std::move(ms));
    }

    for (MachineDeployment& md :
         cache_.MachineDeployments().List(opts_.scope_namespace.c_str())) {
      candidates.emplace_back(std::move(md));
    }

    std::vector<NodeGroup> groups;
    for (ScalableResource& candidate : candidates) {
      const ObjectMeta& meta = MetaOf(candidate);
      const char* kind = KindOf(candidate);
      auto bounds = ParseScalingBounds(meta.annotations, opts_.keys);
      if (!bounds.has_value()) {
        MSCALE_LOG_ERROR("Directory", "%s %s/%s: %s", kind, meta.ns.c_str(),
                         meta.name.c_str(),
                         BoundsErrorToString(bounds.get_error()));
        return ListResult::error(BoundsFailure(kind, meta, bounds.get_error()));
      }
      if (!bounds.value().has_value() || !bounds.value()->CanScale()) {
        continue;
      }
      ScalingBounds b = *bounds.value();
      groups.emplace_back(std::move(candidate), b, cache_, opts_.keys,
                          writer_);
    }

    MSCALE_LOG_DEBUG("Directory", "%u node groups from %u candidates",
                     static_cast<unsigned>(groups.size()),
                     static_cast<unsigned>(candidates.size()));
    return ListResult::success(std::move(groups));
  }

  /**
   * @brief The node group that owns @p node.
   * @return Empty optional for unmanaged nodes, unowned machines, and roots
   * that are out of scope or have no usable bounds. NodeGroupFailure only
   * for a malformed machine link or owner reference.
   */
  LookupResult NodeGroupForNode(const Node& node) const {
    Correlator correlator(cache_, opts_.keys);
    auto machine = correlator.FindMachineForNode(node);
    if (!machine.has_value()) {
      NodeGroupFailure f;
      f.key = machine.get_error();
      f.kind.assign(TruncateToCapacity, kKindNode);
      f.resource = KeyString(TruncateToCapacity, node.meta.name.c_str());
      return LookupResult::error(f);
    }
    if (!machine.value().has_value()) {
      MSCALE_LOG_DEBUG("Directory", "node %s: no machine",
                       node.meta.name.c_str());
      return None();
    }
    const Machine& m = *machine.value();

    OwnerResolver resolver(cache_);
    auto ms = resolver.MachineSetOf(m);
    if (!ms.has_value()) {
      return LookupResult::error(KeyFailure(kKindMachine, m.meta,
                                            ms.get_error()));
    }
    if (!ms.value().has_value()) {
      MSCALE_LOG_DEBUG("Directory", "machine %s/%s: no owning machineset",
                       m.meta.ns.c_str(), m.meta.name.c_str());
      return None();
    }

    auto md = resolver.MachineDeploymentOf(*ms.value());
    if (!md.has_value()) {
      return LookupResult::error(KeyFailure(kKindMachineSet, ms.value()->meta,
                                            md.get_error()));
    }

    ScalableResource root =
        md.value().has_value()
            ? ScalableResource(std::move(*md.value()))
            : ScalableResource(std::move(*ms.value()));
    const ObjectMeta& meta = MetaOf(root);

    if (!opts_.scope_namespace.empty() && meta.ns != opts_.scope_namespace) {
      return None();
    }

    auto bounds = ParseScalingBounds(meta.annotations, opts_.keys);
    if (!bounds.has_value()) {
      MSCALE_LOG_WARN("Directory", "node %s: %s %s/%s: %s",
                      node.meta.name.c_str(), KindOf(root), meta.ns.c_str(),
                      meta.name.c_str(),
                      BoundsErrorToString(bounds.get_error()));
      return None();
    }
    if (!bounds.value().has_value() || !bounds.value()->CanScale()) {
      return None();
    }

    ScalingBounds b = *bounds.value();
    return LookupResult::success(optional<NodeGroup>(
        NodeGroup(std::move(root), b, cache_, opts_.keys, writer_)));
  }

 private:
  static LookupResult None() {
    return LookupResult::success(optional<NodeGroup>());
  }

  static const ObjectMeta& MetaOf(const ScalableResource& r) noexcept {
    if (const auto* ms = std::get_if<MachineSet>(&r)) return ms->meta;
    return std::get_if<MachineDeployment>(&r)->meta;
  }

  static const char* KindOf(const ScalableResource& r) noexcept {
    return std::holds_alternative<MachineSet>(r) ? kKindMachineSet
                                                 : kKindMachineDeployment;
  }

  static NodeGroupFailure KeyFailure(const char* kind, const ObjectMeta& meta,
                                     KeyError err) noexcept {
    NodeGroupFailure f;
    f.code = NodeGroupError::kMalformedKey;
    f.key = err;
    f.kind.assign(TruncateToCapacity, kind);
    f.resource = StoreKey(meta);
    return f;
  }

  static NodeGroupFailure BoundsFailure(const char* kind,
                                        const ObjectMeta& meta,
                                        BoundsError err) noexcept {
    NodeGroupFailure f;
    f.code = NodeGroupError::kMisconfiguredBounds;
    f.bounds = err;
    f.kind.assign(TruncateToCapacity, kind);
    f.resource = StoreKey(meta);
    return f;
  }

  ResourceCache cache_;
  DiscoveryOptions opts_;
  ReplicaWriter* writer_;
};

}  // namespace mscale

#endif  // MSCALE_DIRECTORY_HPP_
