/**
 * @file options.hpp
 * @brief Discovery options: annotation keys, namespace scope, log level.
 *
 * Read from a ConfigStore:
 *
 *   [discovery]
 *   namespace = openshift-machine-api
 *   min_size_annotation = machine.openshift.io/cluster-api-autoscaler-node-group-min-size
 *   max_size_annotation = machine.openshift.io/cluster-api-autoscaler-node-group-max-size
 *   machine_annotation = machine.openshift.io/machine
 *
 *   [log]
 *   level = info
 */

#ifndef MSCALE_OPTIONS_HPP_
#define MSCALE_OPTIONS_HPP_

#include "mscale/config.hpp"
#include "mscale/log.hpp"
#include "mscale/resource.hpp"
#include "mscale/vocabulary.hpp"

namespace mscale {

inline constexpr const char kDefaultMinSizeAnnotation[] =
    "machine.openshift.io/cluster-api-autoscaler-node-group-min-size";
inline constexpr const char kDefaultMaxSizeAnnotation[] =
    "machine.openshift.io/cluster-api-autoscaler-node-group-max-size";
inline constexpr const char kDefaultMachineAnnotation[] =
    "machine.openshift.io/machine";

/** Well-known annotation keys (the wire contract with the cluster). */
struct AnnotationKeys {
  AnnotationKey min_size{kDefaultMinSizeAnnotation};
  AnnotationKey max_size{kDefaultMaxSizeAnnotation};
  AnnotationKey machine{kDefaultMachineAnnotation};
};

struct DiscoveryOptions {
  AnnotationKeys keys;
  Namespace scope_namespace;  // empty: every namespace
  log::Level log_level = log::Level::kInfo;
};

/**
 * @brief Build DiscoveryOptions from @p cfg, falling back to defaults for
 * missing keys.
 * @return kInvalidValue for an empty annotation key, a namespace that does
 * not fit, or an unknown log level.
 */
inline expected<DiscoveryOptions, ConfigError> LoadDiscoveryOptions(
    const ConfigStore& cfg) {
  DiscoveryOptions opts;

  struct KeyField {
    const char* name;
    AnnotationKey* dst;
  };
  const KeyField fields[] = {
      {"min_size_annotation", &opts.keys.min_size},
      {"max_size_annotation", &opts.keys.max_size},
      {"machine_annotation", &opts.keys.machine},
  };
  for (const auto& f : fields) {
    auto v = cfg.FindString("discovery", f.name);
    if (!v.has_value()) continue;
    if (v.value()[0] == '\0' ||
        std::strlen(v.value()) > AnnotationKey::capacity()) {
      MSCALE_LOG_ERROR("Options", "discovery.%s: invalid annotation key '%s'",
                       f.name, v.value());
      return expected<DiscoveryOptions, ConfigError>::error(
          ConfigError::kInvalidValue);
    }
    f.dst->assign(TruncateToCapacity, v.value());
  }

  auto ns = cfg.FindString("discovery", "namespace");
  if (ns.has_value()) {
    if (std::strlen(ns.value()) > Namespace::capacity() ||
        std::strchr(ns.value(), '/') != nullptr) {
      MSCALE_LOG_ERROR("Options", "discovery.namespace: invalid value '%s'",
                       ns.value());
      return expected<DiscoveryOptions, ConfigError>::error(
          ConfigError::kInvalidValue);
    }
    opts.scope_namespace.assign(TruncateToCapacity, ns.value());
  }

  auto level = cfg.FindString("log", "level");
  if (level.has_value() && !log::ParseLevel(level.value(), opts.log_level)) {
    MSCALE_LOG_ERROR("Options", "log.level: unknown level '%s'", level.value());
    return expected<DiscoveryOptions, ConfigError>::error(
        ConfigError::kInvalidValue);
  }

  return expected<DiscoveryOptions, ConfigError>::success(opts);
}

inline void ApplyLogLevel(const DiscoveryOptions& opts) noexcept {
  log::SetLevel(opts.log_level);
}

}  // namespace mscale

#endif  // MSCALE_OPTIONS_HPP_
