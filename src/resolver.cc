#include "resolver.hpp"

#include <tuple>
#include <vector>

namespace libapk {

namespace {

enum DensityClass {
  kAtOrAbove = 0,
  kBelow = 1,
  kUnqualified = 2,
  kAnyDensity = 3,
};

struct Rank {
  int densityClass;
  uint32_t distance;
};

Rank rankDensity(uint16_t candidate, uint16_t requested) {
  if (candidate == Configuration::kDensityDefault ||
      candidate == Configuration::kDensityNone) {
    return {kUnqualified, 0};
  }
  if (candidate == Configuration::kDensityAny) {
    return {kAnyDensity, 0};
  }
  if (candidate >= requested) {
    return {kAtOrAbove, static_cast<uint32_t>(candidate - requested)};
  }
  return {kBelow, static_cast<uint32_t>(requested - candidate)};
}

int compareValues(const ResourceEntry &a, const ResourceEntry &b) {
  auto key = [](const ResourceEntry &e) {
    return std::make_tuple(e.value.dataType, e.value.data, e.parent,
                           e.bag.size());
  };
  if (key(a) < key(b)) {
    return -1;
  }
  if (key(b) < key(a)) {
    return 1;
  }
  // Same bag size from here on.
  auto item = [](const ResourceEntry::BagItem &i) {
    return std::make_tuple(i.name, i.value.dataType, i.value.data);
  };
  for (size_t i = 0; i < a.bag.size(); ++i) {
    if (item(a.bag[i]) < item(b.bag[i])) {
      return -1;
    }
    if (item(b.bag[i]) < item(a.bag[i])) {
      return 1;
    }
  }
  return 0;
}

// True if a should be chosen over b.
bool better(const ConfigValue &a, const ConfigValue &b, uint16_t requested) {
  const Rank ra = rankDensity(a.config.density, requested);
  const Rank rb = rankDensity(b.config.density, requested);
  if (ra.densityClass != rb.densityClass) {
    return ra.densityClass < rb.densityClass;
  }
  if (ra.distance != rb.distance) {
    return ra.distance < rb.distance;
  }
  const int sa = a.config.specificity();
  const int sb = b.config.specificity();
  if (sa != sb) {
    return sa > sb;
  }
  const int config_order = a.config.compare(b.config);
  if (config_order != 0) {
    return config_order > 0;
  }
  return compareValues(a.entry, b.entry) > 0;
}

} // namespace

const ConfigValue *ResourceResolver::bestMatch(
    uint32_t id, const Configuration &request) const {
  const std::vector<ConfigValue> *values = mTable.find(id);
  if (values == nullptr) {
    return nullptr;
  }

  const uint16_t requested = request.density == Configuration::kDensityDefault
                                 ? Configuration::kDensityMedium
                                 : request.density;

  const ConfigValue *best = nullptr;
  for (const ConfigValue &candidate : *values) {
    if (!candidate.config.matches(request)) {
      continue;
    }
    // Strict comparison keeps the first declared of fully equal candidates.
    if (best == nullptr || better(candidate, *best, requested)) {
      best = &candidate;
    }
  }
  return best;
}

ResolvedValue ResourceResolver::resolve(uint32_t id,
                                        const Configuration &request) const {
  ResolvedValue result;
  uint32_t current = id;

  for (int hops = 0;; ++hops) {
    const ConfigValue *match = bestMatch(current, request);
    if (match == nullptr) {
      throw ResourceNotFoundError("No value for resource " +
                                  formatResourceId(current) + " matching " +
                                  request.toString());
    }

    const TypedValue &value = match->entry.value;
    if (!match->entry.isComplex() && value.isReference()) {
      if (value.data == 0) {
        throw ResourceNotFoundError("Resource " + formatResourceId(current) +
                                    " is a null reference");
      }
      if (hops == kMaxReferenceDepth) {
        throw ResourceCycleError("Resource " + formatResourceId(id) +
                                 " exceeds " +
                                 std::to_string(kMaxReferenceDepth) +
                                 " reference hops");
      }
      current = value.data;
      continue;
    }
    if (!match->entry.isComplex() &&
        (value.dataType == TypedValue::TYPE_ATTRIBUTE ||
         value.dataType == TypedValue::TYPE_DYNAMIC_ATTRIBUTE)) {
      throw ResourceNotFoundError("Resource " + formatResourceId(current) +
                                  " refers to theme attribute " +
                                  formatResourceId(value.data));
    }

    result.id = current;
    result.source = match;
    result.value = value;
    result.hops = hops;
    result.text = value.isString() ? mTable.valueStrings().at(value.data)
                                   : value.format(&mTable.valueStrings());
    return result;
  }
}

std::string ResourceResolver::resolveString(
    uint32_t id, const Configuration &request) const {
  return resolve(id, request).text;
}

ResolvedValue resolve(const ResourceTable &table, uint32_t id,
                      const Configuration &request) {
  return ResourceResolver(table).resolve(id, request);
}

} // namespace libapk
