/**
 * @file owner_resolver.hpp
 * @brief Verified one-hop owner lookup: Machine -> MachineSet,
 *        MachineSet -> MachineDeployment.
 *
 * An owner reference is only followed after the cached owner's uid has been
 * compared with the reference. A stale reference (owner deleted, or deleted
 * and recreated under the same name) resolves to "no owner", never to the
 * new object.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_OWNER_RESOLVER_HPP_
#define MSCALE_OWNER_RESOLVER_HPP_

#include "mscale/cache.hpp"
#include "mscale/log.hpp"
#include "mscale/resource.hpp"
#include "mscale/vocabulary.hpp"

namespace mscale {

/**
 * @brief True when @p child carries an owner reference whose kind, name and
 * uid all equal @p owner's identity.
 */
inline bool IsOwnedBy(const ObjectMeta& child, const char* owner_kind,
                      const ObjectMeta& owner) noexcept {
  if (child.ns != owner.ns) return false;
  for (const OwnerReference& ref : child.owner_references) {
    if (ref.kind == owner_kind && ref.name == owner.name &&
        ref.uid == owner.uid) {
      return true;
    }
  }
  return false;
}

class OwnerResolver {
 public:
  explicit OwnerResolver(const ResourceCache& cache) noexcept : cache_(cache) {}

  /**
   * @brief Resolve the MachineSet that owns @p machine.
   * @return Empty optional when the machine has no MachineSet reference, the
   * MachineSet is not cached, or its uid differs. KeyError only when the
   * reference cannot form a valid "namespace/name" key.
   */
  expected<optional<MachineSet>, KeyError> MachineSetOf(
      const Machine& machine) const {
    return Resolve(machine.meta, cache_.MachineSets());
  }

  /** @brief Resolve the MachineDeployment that owns @p machine_set. */
  expected<optional<MachineDeployment>, KeyError> MachineDeploymentOf(
      const MachineSet& machine_set) const {
    return Resolve(machine_set.meta, cache_.MachineDeployments());
  }

 private:
  template <typename Owner>
  expected<optional<Owner>, KeyError> Resolve(
      const ObjectMeta& child, const Lister<Owner>& lister) const {
    using Result = expected<optional<Owner>, KeyError>;

    const OwnerReference* ref = FindOwnerReference(child, Owner::kKind);
    if (ref == nullptr) {
      return Result::success(optional<Owner>());
    }

    auto key = MakeObjectKey(child.ns.c_str(), ref->name.c_str());
    if (!key.has_value()) {
      MSCALE_LOG_WARN("OwnerResolver", "%s/%s: bad %s reference '%s': %s",
                      child.ns.c_str(), child.name.c_str(), Owner::kKind,
                      ref->name.c_str(), KeyErrorToString(key.get_error()));
      return Result::error(key.get_error());
    }

    optional<Owner> owner =
        lister.Get(key.value().ns.c_str(), key.value().name.c_str());
    if (!owner.has_value()) {
      MSCALE_LOG_DEBUG("OwnerResolver", "%s/%s: %s %s not in cache",
                       child.ns.c_str(), child.name.c_str(), Owner::kKind,
                       ref->name.c_str());
      return Result::success(optional<Owner>());
    }

    if (owner->meta.uid != ref->uid) {
      MSCALE_LOG_DEBUG("OwnerResolver",
                       "%s/%s: %s %s uid mismatch (ref %s, cached %s)",
                       child.ns.c_str(), child.name.c_str(), Owner::kKind,
                       ref->name.c_str(), ref->uid.c_str(),
                       owner->meta.uid.c_str());
      return Result::success(optional<Owner>());
    }

    return Result::success(std::move(owner));
  }

  ResourceCache cache_;
};

}  // namespace mscale

#endif  // MSCALE_OWNER_RESOLVER_HPP_
