/**
 * @file test_node_group.cpp
 * @brief Tests for node_group.hpp: identity, members, membership, resize.
 */

#include "mscale/node_group.hpp"

#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace mscale_test;

namespace {

NodeGroup GroupOf(const TestConfig& cfg, const MemoryCache& cache,
                  ReplicaWriter* writer = nullptr, int32_t min = 1,
                  int32_t max = 10) {
  ScalingBounds b;
  b.min_size = min;
  b.max_size = max;
  if (cfg.deployment_root) {
    return NodeGroup(ScalableResource(cfg.machine_deployment), b, cache.View(),
                     AnnotationKeys{}, writer);
  }
  return NodeGroup(ScalableResource(cfg.machine_set), b, cache.View(),
                   AnnotationKeys{}, writer);
}

/** Node lister that counts reads against the wrapped store. */
class CountingNodeLister final : public Lister<Node> {
 public:
  explicit CountingNodeLister(const Lister<Node>& inner) : inner_(inner) {}

  optional<Node> Get(const char* ns, const char* name) const override {
    ++gets;
    return inner_.Get(ns, name);
  }

  std::vector<Node> List(const char* ns,
                         const LabelSelector& selector) const override {
    ++lists;
    return inner_.List(ns, selector);
  }
  using Lister<Node>::List;

  mutable int gets = 0;
  mutable int lists = 0;

 private:
  const Lister<Node>& inner_;
};

std::vector<std::string> Ids(const std::vector<Instance>& members) {
  std::vector<std::string> out;
  for (const Instance& i : members) out.emplace_back(i.id.c_str());
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace

// ============================================================================
// Identity
// ============================================================================

TEST_CASE("node_group - MachineSet root identity", "[node_group][identity]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 3);
  REQUIRE(AddTestConfig(cache, cfg));

  NodeGroup ng = GroupOf(cfg, cache);
  REQUIRE(ng.Root() == RootKind::kMachineSet);
  REQUIRE(std::string(ng.Kind()) == "MachineSet");
  REQUIRE(std::string(ng.Namespace()) == "ns");
  REQUIRE(std::string(ng.Name()) == "pool");
  REQUIRE(std::string(ng.Uid()) == "pool-uid");
  REQUIRE(ng.Id() == "MachineSet/ns/pool");
  REQUIRE(ng.MinSize() == 1);
  REQUIRE(ng.MaxSize() == 10);
  REQUIRE(ng.Size() == 3);
  REQUIRE(ng.Debug() == "MachineSet/ns/pool (min: 1, max: 10, replicas: 3)");
}

TEST_CASE("node_group - MachineDeployment root identity",
          "[node_group][identity]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "deploy", true, 2);
  REQUIRE(AddTestConfig(cache, cfg));

  NodeGroup ng = GroupOf(cfg, cache);
  REQUIRE(ng.Root() == RootKind::kMachineDeployment);
  REQUIRE(ng.Id() == "MachineDeployment/ns/deploy");
  REQUIRE(ng.Size() == 2);
  REQUIRE(std::holds_alternative<MachineDeployment>(ng.Resource()));
}

// ============================================================================
// Members
// ============================================================================

TEST_CASE("node_group - MachineSet members by provider id",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 3);
  REQUIRE(AddTestConfig(cache, cfg));

  auto members = GroupOf(cfg, cache).Members();
  REQUIRE(members.size() == 3);
  REQUIRE(Ids(members) == std::vector<std::string>{"ns-pool-nodeid-0",
                                                    "ns-pool-nodeid-1",
                                                    "ns-pool-nodeid-2"});
  for (const Instance& i : members) REQUIRE_FALSE(i.node_name.empty());
}

TEST_CASE("node_group - MachineDeployment members through MachineSet",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "deploy", true, 4);
  REQUIRE(AddTestConfig(cache, cfg));

  auto members = GroupOf(cfg, cache).Members();
  REQUIRE(members.size() == 4);
}

TEST_CASE("node_group - members span every owned MachineSet",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "deploy", true, 5);
  REQUIRE(AddTestConfig(cache, cfg));

  // A rollout leaves a second MachineSet owned by the same deployment.
  TestConfig next = MakeTestConfig("ns", "deploy-next", false, 5, nullptr,
                                   nullptr);
  AddOwnerRef(next.machine_set.meta, kKindMachineDeployment,
              cfg.machine_deployment.meta);
  REQUIRE(AddTestConfig(cache, next));

  NodeGroup ng = GroupOf(cfg, cache);
  REQUIRE(ng.Members().size() == 10);

  // A MachineSet that only shares the deployment's name is not included.
  TestConfig impostor = MakeTestConfig("ns", "impostor", false, 2, nullptr,
                                       nullptr);
  ObjectMeta fake = cfg.machine_deployment.meta;
  fake.uid.assign(TruncateToCapacity, "other-uid");
  AddOwnerRef(impostor.machine_set.meta, kKindMachineDeployment, fake);
  REQUIRE(AddTestConfig(cache, impostor));
  REQUIRE(ng.Members().size() == 10);
}

TEST_CASE("node_group - members read the node list once",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "deploy", true, 40);
  REQUIRE(AddTestConfig(cache, cfg));
  // Half the machines resolve through their node reference only.
  for (int32_t i = 0; i < 40; i += 2) {
    Machine m = cfg.machines[static_cast<size_t>(i)];
    m.provider_id.clear();
    REQUIRE(cache.machines.Update(m).has_value());
  }

  CountingNodeLister nodes(cache.nodes);
  ResourceCache view(nodes, cache.machines, cache.machine_sets,
                     cache.machine_deployments);
  ScalingBounds b;
  b.min_size = 1;
  b.max_size = 50;
  NodeGroup ng(ScalableResource(cfg.machine_deployment), b, view,
               AnnotationKeys{});

  auto members = ng.Members();
  REQUIRE(members.size() == 40);
  REQUIRE(nodes.lists == 1);
  REQUIRE(nodes.gets == 0);
  for (const Instance& i : members) REQUIRE_FALSE(i.node_name.empty());
}

TEST_CASE("node_group - machines without linkage are not members",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 3);
  cfg.machines[1].provider_id.clear();
  cfg.machines[1].node_ref.reset();
  REQUIRE(AddTestConfig(cache, cfg));

  auto members = GroupOf(cfg, cache).Members();
  REQUIRE(members.size() == 2);
  REQUIRE(Ids(members) == std::vector<std::string>{"ns-pool-nodeid-0",
                                                    "ns-pool-nodeid-2"});
}

TEST_CASE("node_group - members resolved through node reference",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 2);
  for (Machine& m : cfg.machines) m.provider_id.clear();
  cfg.machines[1].node_ref.reset();
  REQUIRE(AddTestConfig(cache, cfg));

  auto members = GroupOf(cfg, cache).Members();
  REQUIRE(members.size() == 1);
  REQUIRE(members[0].id == "ns-pool-nodeid-0");
  REQUIRE(members[0].node_name == "ns-pool-node-0");
}

TEST_CASE("node_group - node reference to an unready node is skipped",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 2);
  for (Machine& m : cfg.machines) m.provider_id.clear();
  ObjectReference ref;
  ref.kind.assign(TruncateToCapacity, kKindNode);
  ref.name = cfg.nodes[0].meta.name;
  cfg.machines[0].node_ref = ref;
  ref.name.assign(TruncateToCapacity, "missing-node");
  cfg.machines[1].node_ref = ref;
  cfg.nodes[0].provider_id.clear();
  REQUIRE(AddTestConfig(cache, cfg));

  REQUIRE(GroupOf(cfg, cache).Members().empty());
}

TEST_CASE("node_group - machines owned elsewhere are not members",
          "[node_group][members]") {
  MemoryCache cache;
  TestConfig a = MakeTestConfig("ns", "pool-a", false, 2);
  TestConfig b = MakeTestConfig("ns", "pool-b", false, 3);
  REQUIRE(AddTestConfig(cache, a));
  REQUIRE(AddTestConfig(cache, b));

  REQUIRE(GroupOf(a, cache).Members().size() == 2);
  REQUIRE(GroupOf(b, cache).Members().size() == 3);
}

// ============================================================================
// Belongs
// ============================================================================

TEST_CASE("node_group - Belongs", "[node_group][belongs]") {
  MemoryCache cache;
  TestConfig a = MakeTestConfig("ns", "pool-a", false, 1);
  TestConfig b = MakeTestConfig("ns", "deploy-b", true, 1);
  REQUIRE(AddTestConfig(cache, a));
  REQUIRE(AddTestConfig(cache, b));

  NodeGroup ga = GroupOf(a, cache);
  NodeGroup gb = GroupOf(b, cache);

  auto r = ga.Belongs(a.nodes[0]);
  REQUIRE(r.has_value());
  REQUIRE(r.value());
  r = ga.Belongs(b.nodes[0]);
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value());
  r = gb.Belongs(b.nodes[0]);
  REQUIRE(r.has_value());
  REQUIRE(r.value());

  Node stranger;
  stranger.meta.name.assign(TruncateToCapacity, "stranger");
  r = gb.Belongs(stranger);
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value());
}

TEST_CASE("node_group - Belongs reports malformed link", "[node_group][belongs]") {
  MemoryCache cache;
  TestConfig a = MakeTestConfig("ns", "pool-a", false, 1);
  REQUIRE(AddTestConfig(cache, a));

  Node n = a.nodes[0];
  n.provider_id.clear();
  n.meta.annotations.Set(AnnotationKeys{}.machine.c_str(), "/no-namespace");
  auto r = GroupOf(a, cache).Belongs(n);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == KeyError::kEmptyNamespace);
}

// ============================================================================
// Resize
// ============================================================================

TEST_CASE("node_group - SetSize within bounds", "[node_group][resize]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 3);
  REQUIRE(AddTestConfig(cache, cfg));
  RecordingReplicaWriter writer;
  NodeGroup ng = GroupOf(cfg, cache, &writer);

  REQUIRE(ng.SetSize(5).has_value());
  REQUIRE(writer.calls == 1);
  REQUIRE(writer.last_kind == "MachineSet");
  REQUIRE(writer.last_ns == "ns");
  REQUIRE(writer.last_name == "pool");
  REQUIRE(writer.last_replicas == 5);
  REQUIRE(ng.Size() == 5);

  auto above = ng.SetSize(11);
  REQUIRE_FALSE(above.has_value());
  REQUIRE(above.get_error() == NodeGroupError::kAboveMaxSize);
  auto below = ng.SetSize(0);
  REQUIRE_FALSE(below.has_value());
  REQUIRE(below.get_error() == NodeGroupError::kBelowMinSize);
  REQUIRE(writer.calls == 1);
}

TEST_CASE("node_group - IncreaseSize", "[node_group][resize]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "deploy", true, 3);
  REQUIRE(AddTestConfig(cache, cfg));
  RecordingReplicaWriter writer;
  NodeGroup ng = GroupOf(cfg, cache, &writer, 1, 5);

  REQUIRE(ng.IncreaseSize(0).get_error() == NodeGroupError::kInvalidDelta);
  REQUIRE(ng.IncreaseSize(-1).get_error() == NodeGroupError::kInvalidDelta);
  REQUIRE(ng.IncreaseSize(3).get_error() == NodeGroupError::kAboveMaxSize);

  REQUIRE(ng.IncreaseSize(2).has_value());
  REQUIRE(writer.last_kind == "MachineDeployment");
  REQUIRE(writer.last_replicas == 5);
  REQUIRE(ng.Size() == 5);
}

TEST_CASE("node_group - DecreaseTargetSize", "[node_group][resize]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 2);
  cfg.machine_set.replicas = 5;
  REQUIRE(AddTestConfig(cache, cfg));
  RecordingReplicaWriter writer;
  NodeGroup ng = GroupOf(cfg, cache, &writer, 1, 10);

  REQUIRE(ng.DecreaseTargetSize(0).get_error() == NodeGroupError::kInvalidDelta);
  REQUIRE(ng.DecreaseTargetSize(1).get_error() == NodeGroupError::kInvalidDelta);
  REQUIRE(ng.DecreaseTargetSize(-4).get_error() ==
          NodeGroupError::kBelowCurrentSize);

  REQUIRE(ng.DecreaseTargetSize(-3).has_value());
  REQUIRE(writer.last_replicas == 2);
  REQUIRE(ng.Size() == 2);
}

TEST_CASE("node_group - DecreaseTargetSize respects min", "[node_group][resize]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 0);
  cfg.machine_set.replicas = 3;
  REQUIRE(AddTestConfig(cache, cfg));
  RecordingReplicaWriter writer;
  NodeGroup ng = GroupOf(cfg, cache, &writer, 2, 10);

  REQUIRE(ng.DecreaseTargetSize(-2).get_error() == NodeGroupError::kBelowMinSize);
  REQUIRE(ng.DecreaseTargetSize(-1).has_value());
  REQUIRE(ng.Size() == 2);
}

TEST_CASE("node_group - resize without writer", "[node_group][resize]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 1);
  REQUIRE(AddTestConfig(cache, cfg));
  NodeGroup ng = GroupOf(cfg, cache);

  auto r = ng.IncreaseSize(1);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == NodeGroupError::kNoReplicaWriter);
  REQUIRE(ng.Size() == 1);
}

TEST_CASE("node_group - failed write leaves size unchanged",
          "[node_group][resize]") {
  MemoryCache cache;
  TestConfig cfg = MakeTestConfig("ns", "pool", false, 1);
  REQUIRE(AddTestConfig(cache, cfg));
  RecordingReplicaWriter writer;
  writer.fail = true;
  NodeGroup ng = GroupOf(cfg, cache, &writer);

  auto r = ng.SetSize(4);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == NodeGroupError::kWriteFailed);
  REQUIRE(writer.calls == 1);
  REQUIRE(ng.Size() == 1);
}
