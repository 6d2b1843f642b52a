/**
 * @file discovery_demo.cpp
 * @brief Node group discovery over an in-memory cache.
 *
 * Demonstrates:
 *   - Loading DiscoveryOptions from an INI file (optional argv[1])
 *   - Populating MemoryStores the way a watch synchronizer would
 *   - Listing node groups and their members
 *   - Mapping a node back to its node group
 *   - Resizing through a ReplicaWriter
 *
 * Usage: discovery_demo [discovery.ini]
 */

#include "mscale/cache.hpp"
#include "mscale/config.hpp"
#include "mscale/directory.hpp"
#include "mscale/log.hpp"
#include "mscale/options.hpp"

#include <cstdio>
#include <cstring>

namespace {

/** Writes straight into the in-memory stores. */
class StoreReplicaWriter final : public mscale::ReplicaWriter {
 public:
  explicit StoreReplicaWriter(mscale::MemoryCache& cache) : cache_(cache) {}

  mscale::expected<void, mscale::NodeGroupError> SetReplicas(
      const char* kind, const char* ns, const char* name,
      int32_t replicas) override {
    if (std::strcmp(kind, mscale::kKindMachineSet) == 0) {
      return Patch(cache_.machine_sets, ns, name, replicas);
    }
    return Patch(cache_.machine_deployments, ns, name, replicas);
  }

 private:
  template <typename T>
  static mscale::expected<void, mscale::NodeGroupError> Patch(
      mscale::MemoryStore<T>& store, const char* ns, const char* name,
      int32_t replicas) {
    auto obj = store.Get(ns, name);
    if (!obj.has_value()) {
      return mscale::expected<void, mscale::NodeGroupError>::error(
          mscale::NodeGroupError::kWriteFailed);
    }
    obj->replicas = replicas;
    if (!store.Update(obj.value()).has_value()) {
      return mscale::expected<void, mscale::NodeGroupError>::error(
          mscale::NodeGroupError::kWriteFailed);
    }
    return mscale::expected<void, mscale::NodeGroupError>::success();
  }

  mscale::MemoryCache& cache_;
};

void SetName(mscale::ObjectMeta& meta, const char* ns, const char* name,
             const char* uid) {
  meta.ns.assign(mscale::TruncateToCapacity, ns);
  meta.name.assign(mscale::TruncateToCapacity, name);
  meta.uid.assign(mscale::TruncateToCapacity, uid);
}

void AddOwner(mscale::ObjectMeta& meta, const char* kind,
              const mscale::ObjectMeta& owner) {
  mscale::OwnerReference ref;
  ref.kind.assign(mscale::TruncateToCapacity, kind);
  ref.name = owner.name;
  ref.uid = owner.uid;
  meta.owner_references.push_back(ref);
}

template <typename T>
bool AddObject(mscale::MemoryStore<T>& store, const T& obj) {
  auto r = store.Add(obj);
  if (!r.has_value()) {
    MSCALE_LOG_WARN("demo", "cannot add %s %s/%s: %s", T::kKind,
                    obj.meta.ns.c_str(), obj.meta.name.c_str(),
                    mscale::StoreErrorToString(r.get_error()));
    return false;
  }
  return true;
}

/** One MachineSet with @p count linked Machine/Node pairs. */
void Populate(mscale::MemoryCache& cache, const mscale::AnnotationKeys& keys,
              const char* ns, const char* set_name,
              const mscale::ObjectMeta* deployment, int32_t count) {
  mscale::MachineSet ms;
  SetName(ms.meta, ns, set_name, set_name);
  if (deployment != nullptr) {
    AddOwner(ms.meta, mscale::kKindMachineDeployment, *deployment);
  } else {
    ms.meta.annotations.Set(keys.min_size.c_str(), "1");
    ms.meta.annotations.Set(keys.max_size.c_str(), "6");
    ms.replicas = count;
  }
  if (!AddObject(cache.machine_sets, ms)) return;

  for (int32_t i = 0; i < count; ++i) {
    char machine_name[128];
    char node_name[128];
    char provider_id[128];
    char link[192];
    std::snprintf(machine_name, sizeof(machine_name), "%s-machine-%d",
                  set_name, i);
    std::snprintf(node_name, sizeof(node_name), "%s-node-%d", set_name, i);
    std::snprintf(provider_id, sizeof(provider_id), "demo://%s/%d", set_name,
                  i);
    std::snprintf(link, sizeof(link), "%s/%s", ns, machine_name);

    mscale::Machine m;
    SetName(m.meta, ns, machine_name, machine_name);
    AddOwner(m.meta, mscale::kKindMachineSet, ms.meta);
    m.provider_id.assign(mscale::TruncateToCapacity, provider_id);
    if (!AddObject(cache.machines, m)) continue;

    mscale::Node n;
    n.meta.name.assign(mscale::TruncateToCapacity, node_name);
    n.meta.annotations.Set(keys.machine.c_str(), link);
    n.provider_id.assign(mscale::TruncateToCapacity, provider_id);
    AddObject(cache.nodes, n);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  mscale::log::Init();

  mscale::DiscoveryOptions opts;
#ifdef MSCALE_CONFIG_INI_ENABLED
  if (argc > 1) {
    mscale::IniConfig cfg;
    auto loaded = cfg.LoadFile(argv[1]);
    if (!loaded.has_value()) {
      MSCALE_LOG_ERROR("demo", "cannot load %s: %s", argv[1],
                       mscale::ConfigErrorToString(loaded.get_error()));
      return 1;
    }
    auto parsed = mscale::LoadDiscoveryOptions(cfg);
    if (!parsed.has_value()) return 1;
    opts = parsed.value();
  }
#else
  (void)argc;
  (void)argv;
#endif
  mscale::ApplyLogLevel(opts);

  mscale::MemoryCache cache;
  StoreReplicaWriter writer(cache);

  Populate(cache, opts.keys, "demo", "workers-a", nullptr, 3);
  Populate(cache, opts.keys, "demo", "workers-b", nullptr, 2);

  mscale::MachineDeployment md;
  SetName(md.meta, "demo", "gpu", "gpu-uid");
  md.meta.annotations.Set(opts.keys.min_size.c_str(), "1");
  md.meta.annotations.Set(opts.keys.max_size.c_str(), "4");
  md.replicas = 2;
  if (!AddObject(cache.machine_deployments, md)) return 1;
  Populate(cache, opts.keys, "demo", "gpu-7d9f", &md.meta, 2);

  mscale::NodeGroupDirectory directory(cache.View(), opts, &writer);

  auto groups = directory.ListNodeGroups();
  if (!groups.has_value()) {
    const auto& f = groups.get_error();
    MSCALE_LOG_ERROR("demo", "discovery failed on %s %s: %s", f.kind.c_str(),
                     f.resource.c_str(), mscale::NodeGroupErrorToString(f.code));
    return 1;
  }

  for (const mscale::NodeGroup& ng : groups.value()) {
    std::printf("%s\n", ng.Debug().c_str());
    for (const mscale::Instance& inst : ng.Members()) {
      std::printf("  %-24s %s\n", inst.node_name.c_str(), inst.id.c_str());
    }
  }

  auto node = cache.nodes.Get("", "gpu-7d9f-node-1");
  if (node.has_value()) {
    auto ng = directory.NodeGroupForNode(node.value());
    if (ng.has_value() && ng.value().has_value()) {
      mscale::NodeGroup& group = *ng.value();
      std::printf("node %s -> %s\n", node->meta.name.c_str(),
                  group.Id().c_str());
      auto resized = group.IncreaseSize(1);
      if (!resized.has_value()) {
        MSCALE_LOG_WARN("demo", "resize failed: %s",
                        mscale::NodeGroupErrorToString(resized.get_error()));
      } else {
        std::printf("resized: %s\n", group.Debug().c_str());
      }
    }
  }

  mscale::log::Shutdown();
  return 0;
}
