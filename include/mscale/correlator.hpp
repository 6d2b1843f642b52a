/**
 * @file correlator.hpp
 * @brief Node <-> Machine correlation over the resource cache.
 *
 * Provider ids reach the Machine asynchronously, after the Node already
 * exists and carries the machine-link annotation ("namespace/name"). Every
 * lookup is therefore an ordered fallback chain in which each step either
 * finds something or reports absence; a missing field is never an error.
 *
 * Lookup chains:
 *   FindMachineByProviderID(id):
 *     1. Machine whose provider id == id
 *     2. Node whose provider id == id -> machine-link annotation -> Machine
 *   FindMachineForNode(node):
 *     1. node has a provider id -> FindMachineByProviderID
 *     2. otherwise node's own machine-link annotation -> Machine
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_CORRELATOR_HPP_
#define MSCALE_CORRELATOR_HPP_

#include "mscale/cache.hpp"
#include "mscale/log.hpp"
#include "mscale/options.hpp"
#include "mscale/resource.hpp"
#include "mscale/vocabulary.hpp"

namespace mscale {

class Correlator {
 public:
  using MachineResult = expected<optional<Machine>, KeyError>;

  Correlator(const ResourceCache& cache, const AnnotationKeys& keys) noexcept
      : cache_(cache), keys_(keys) {}

  /**
   * @brief Direct lookup of a Machine by "namespace/name".
   * @return KeyError if @p key does not parse; empty optional if not cached.
   */
  MachineResult FindMachine(const char* key) const {
    auto parsed = ParseObjectKey(key);
    if (!parsed.has_value()) {
      return MachineResult::error(parsed.get_error());
    }
    return MachineResult::success(cache_.Machines().Get(
        parsed.value().ns.c_str(), parsed.value().name.c_str()));
  }

  MachineResult FindMachineByProviderID(const char* provider_id) const {
    if (provider_id == nullptr || provider_id[0] == '\0') {
      return MachineResult::success(optional<Machine>());
    }

    for (Machine& m : cache_.Machines().List("")) {
      if (m.provider_id == provider_id) {
        return MachineResult::success(optional<Machine>(std::move(m)));
      }
    }

    optional<Node> node = FindNodeByProviderID(provider_id);
    if (!node.has_value()) {
      MSCALE_LOG_DEBUG("Correlator", "no machine or node with provider id %s",
                       provider_id);
      return MachineResult::success(optional<Machine>());
    }
    return FindMachineFromAnnotation(node.value());
  }

  /** Provider id first, then the node's own machine-link annotation. */
  MachineResult FindMachineForNode(const Node& node) const {
    if (!node.provider_id.empty()) {
      return FindMachineByProviderID(node.provider_id.c_str());
    }
    return FindMachineFromAnnotation(node);
  }

  optional<Node> FindNodeByName(const char* name) const {
    if (name == nullptr || name[0] == '\0') return {};
    return cache_.Nodes().Get("", name);
  }

  optional<Node> FindNodeByProviderID(const char* provider_id) const {
    if (provider_id == nullptr || provider_id[0] == '\0') return {};
    for (Node& n : cache_.Nodes().List("")) {
      if (n.provider_id == provider_id) return optional<Node>(std::move(n));
    }
    return {};
  }

 private:
  MachineResult FindMachineFromAnnotation(const Node& node) const {
    const AnnotationValue* link =
        node.meta.annotations.Find(keys_.machine.c_str());
    if (link == nullptr || link->empty()) {
      MSCALE_LOG_DEBUG("Correlator", "node %s has no %s annotation",
                       node.meta.name.c_str(), keys_.machine.c_str());
      return MachineResult::success(optional<Machine>());
    }
    return FindMachine(link->c_str());
  }

  ResourceCache cache_;
  AnnotationKeys keys_;
};

}  // namespace mscale

#endif  // MSCALE_CORRELATOR_HPP_
