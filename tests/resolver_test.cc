#include "resolver.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "test_builders.hpp"

using apktest::TableBuilder;
using namespace libapk;

static const uint8_t kMipmap = 1;
static const uint8_t kString = 2;

static ResourceTable decode(const TableBuilder& builder) {
  apktest::Bytes bytes = builder.build();
  return ResourceTable::decode(bytes.data(), bytes.size());
}

static std::string iconPath(uint16_t dpi) { return "res/mipmap-" + std::to_string(dpi) + "/ic_launcher.png"; }

static TableBuilder iconTable(const std::vector<uint16_t>& densities) {
  TableBuilder b;
  b.typeName(kMipmap, "mipmap").typeName(kString, "string");
  for (uint16_t dpi : densities) {
    b.string(kMipmap, 0, "ic_launcher", apktest::density(dpi), iconPath(dpi));
  }
  return b;
}

TEST(resolver, PicksNearestDensityAtOrAbove) {
  ResourceTable table = decode(iconTable({160, 320, 480, 640}));
  ResourceResolver resolver(table);
  ASSERT_EQ(iconPath(480), resolver.resolveString(0x7f010000, Configuration::withDensity(480)));
  ASSERT_EQ(iconPath(320), resolver.resolveString(0x7f010000, Configuration::withDensity(240)));
  ASSERT_EQ(iconPath(160), resolver.resolveString(0x7f010000, Configuration::withDensity(120)));
}

TEST(resolver, FallsBackToNearestBelow) {
  ResourceTable table = decode(iconTable({160, 320, 480, 640}));
  ResourceResolver resolver(table);
  ASSERT_EQ(iconPath(640), resolver.resolveString(0x7f010000, Configuration::withDensity(720)));
}

TEST(resolver, DefaultRequestIsMedium) {
  ResourceTable table = decode(iconTable({120, 160, 240}));
  ASSERT_EQ(iconPath(160), ResourceResolver(table).resolveString(0x7f010000, Configuration()));
}

TEST(resolver, UnqualifiedAndAnyDensityRankLast) {
  TableBuilder b;
  b.typeName(kMipmap, "mipmap");
  b.string(kMipmap, 0, "ic_launcher", apktest::density(Configuration::kDensityAny), "res/mipmap-anydpi/ic.xml");
  b.string(kMipmap, 0, "ic_launcher", Configuration(), "res/mipmap/ic.png");
  b.string(kMipmap, 0, "ic_launcher", apktest::density(120), "res/mipmap-ldpi/ic.png");
  ResourceTable table = decode(b);
  ResourceResolver resolver(table);

  // A concrete density, even a lower one, wins over the others.
  ASSERT_EQ("res/mipmap-ldpi/ic.png", resolver.resolveString(0x7f010000, Configuration::withDensity(640)));

  TableBuilder without_concrete;
  without_concrete.typeName(kMipmap, "mipmap");
  without_concrete.string(kMipmap, 0, "ic_launcher", apktest::density(Configuration::kDensityAny),
                          "res/mipmap-anydpi/ic.xml");
  without_concrete.string(kMipmap, 0, "ic_launcher", Configuration(), "res/mipmap/ic.png");
  ResourceTable fallback = decode(without_concrete);
  ASSERT_EQ("res/mipmap/ic.png",
            ResourceResolver(fallback).resolveString(0x7f010000, Configuration::withDensity(640)));
}

TEST(resolver, DeterministicUnderReordering) {
  ResourceTable first = decode(iconTable({640, 160, 480, 0, 320}));
  const std::string expected = resolve(first, 0x7f010000, Configuration::withDensity(400)).text;
  ASSERT_EQ(iconPath(480), expected);

  std::vector<std::vector<uint16_t>> orders = {
      {160, 320, 480, 640, 0}, {0, 480, 320, 640, 160}, {480, 640, 0, 160, 320}};
  for (const auto& order : orders) {
    ResourceTable table = decode(iconTable(order));
    ASSERT_EQ(expected, resolve(table, 0x7f010000, Configuration::withDensity(400)).text);
  }
}

struct Candidate {
  Configuration config;
  std::string path;
  bool separate;
};

static std::vector<Candidate> xhdpiCandidates() {
  Configuration xhdpi = apktest::density(320);
  Configuration v21 = xhdpi;
  v21.sdkVersion = 21;
  Configuration land = xhdpi;
  land.orientation = 2;
  return {{xhdpi, "res/drawable-xhdpi/bg.png", false},
          {v21, "res/drawable-xhdpi-v21/bg.png", false},
          {land, "res/drawable-land-xhdpi/bg.png", true},
          {land, "res/drawable-land-xhdpi/bg_alt.png", true}};
}

static TableBuilder candidateTable(const std::vector<Candidate>& all, const std::vector<size_t>& order) {
  TableBuilder b;
  b.typeName(kMipmap, "drawable");
  // Fix the value string indices regardless of declaration order.
  for (const Candidate& c : all) b.addString(c.path);
  for (size_t i : order) {
    if (all[i].separate) b.separateGroup();
    b.string(kMipmap, 0, "bg", all[i].config, all[i].path);
  }
  return b;
}

TEST(resolver, EquallyRankedEntriesIgnoreOrder) {
  const std::vector<Candidate> all = xhdpiCandidates();
  std::vector<size_t> order = {0, 1, 2, 3};
  do {
    ResourceTable table = decode(candidateTable(all, order));
    ASSERT_EQ(4u, table.find(0x7f010000)->size());
    // Both landscape entries carry the same configuration; the greater
    // value wins, never the first declared.
    ASSERT_EQ("res/drawable-land-xhdpi/bg_alt.png",
              ResourceResolver(table).resolveString(0x7f010000, Configuration::withDensity(320)));
  } while (std::next_permutation(order.begin(), order.end()));
}

TEST(resolver, MoreSpecificConfigurationWins) {
  const std::vector<Candidate> all = xhdpiCandidates();
  for (const std::vector<size_t>& order : {std::vector<size_t>{0, 1}, std::vector<size_t>{1, 0}}) {
    ResourceTable table = decode(candidateTable(all, order));
    ASSERT_EQ("res/drawable-xhdpi-v21/bg.png",
              ResourceResolver(table).resolveString(0x7f010000, Configuration::withDensity(320)));
  }
}

TEST(resolver, DuplicateBagsCompareItems) {
  const TypedValue dark{TypedValue::TYPE_INT_COLOR_ARGB8, 0xff000000};
  const TypedValue light{TypedValue::TYPE_INT_COLOR_ARGB8, 0xffffffff};
  for (bool dark_first : {true, false}) {
    TableBuilder b;
    b.typeName(1, "style");
    b.separateGroup().bag(1, 0, "AppTheme", Configuration(), 0x01030005,
                          {{0x01010098, dark_first ? dark : light}});
    b.separateGroup().bag(1, 0, "AppTheme", Configuration(), 0x01030005,
                          {{0x01010098, dark_first ? light : dark}});
    ResourceTable table = decode(b);
    ASSERT_EQ(2u, table.find(0x7f010000)->size());

    const ConfigValue* best = ResourceResolver(table).bestMatch(0x7f010000, Configuration());
    ASSERT_NE(nullptr, best);
    ASSERT_EQ(0xffffffffu, best->entry.bag[0].value.data);
  }
}

TEST(resolver, LocaleSelection) {
  Configuration en;
  en.language = "en";
  Configuration en_us = en;
  en_us.region = "US";

  TableBuilder b;
  b.typeName(kString, "string");
  b.string(kString, 0, "app_name", Configuration(), "Default");
  b.string(kString, 0, "app_name", en, "English");
  b.string(kString, 0, "app_name", en_us, "American");
  ResourceTable table = decode(b);
  ResourceResolver resolver(table);

  const uint32_t id = 0x7f020000;
  ASSERT_EQ("Default", resolver.resolveString(id, Configuration()));
  ASSERT_EQ("English", resolver.resolveString(id, en));
  ASSERT_EQ("American", resolver.resolveString(id, en_us));

  Configuration fr;
  fr.language = "fr";
  ASSERT_EQ("Default", resolver.resolveString(id, fr));
}

TEST(resolver, FollowsReferences) {
  TableBuilder b;
  b.typeName(kMipmap, "mipmap").typeName(kString, "string");
  b.string(kString, 0, "app_name", Configuration(), "Example");
  b.reference(kString, 1, "launcher_name", Configuration(), 0x7f020000);
  b.reference(kString, 2, "title", Configuration(), 0x7f020001);
  ResourceTable table = decode(b);

  ResolvedValue value = resolve(table, 0x7f020002, Configuration());
  ASSERT_EQ("Example", value.text);
  ASSERT_EQ(0x7f020000u, value.id);
  ASSERT_EQ(2, value.hops);
  ASSERT_NE(nullptr, value.source);
  ASSERT_EQ("app_name", value.source->entry.key);
}

TEST(resolver, SelfReferenceIsCycle) {
  TableBuilder b;
  b.typeName(kString, "string");
  b.reference(kString, 0, "loop", Configuration(), 0x7f020000);
  ResourceTable table = decode(b);
  ASSERT_THROW(resolve(table, 0x7f020000, Configuration()), ResourceCycleError);
}

TEST(resolver, MutualReferenceIsCycle) {
  TableBuilder b;
  b.typeName(kString, "string");
  b.reference(kString, 0, "a", Configuration(), 0x7f020001);
  b.reference(kString, 1, "b", Configuration(), 0x7f020000);
  ResourceTable table = decode(b);
  ASSERT_THROW(resolve(table, 0x7f020000, Configuration()), ResourceCycleError);
}

TEST(resolver, NotFound) {
  TableBuilder b;
  b.typeName(kString, "string");
  b.string(kString, 0, "app_name", Configuration(), "Example");
  b.reference(kString, 1, "dangling", Configuration(), 0x7f020005);
  b.reference(kString, 2, "null", Configuration(), 0);
  b.value(kString, 3, "themed", Configuration(), TypedValue::TYPE_ATTRIBUTE, 0x01010036);
  ResourceTable table = decode(b);

  ASSERT_THROW(resolve(table, 0x7f020009, Configuration()), ResourceNotFoundError);
  ASSERT_THROW(resolve(table, 0x7f020001, Configuration()), ResourceNotFoundError);
  ASSERT_THROW(resolve(table, 0x7f020002, Configuration()), ResourceNotFoundError);
  ASSERT_THROW(resolve(table, 0x7f020003, Configuration()), ResourceNotFoundError);
}

TEST(resolver, NoMatchingConfiguration) {
  Configuration de;
  de.language = "de";
  TableBuilder b;
  b.typeName(kString, "string");
  b.string(kString, 0, "only_german", de, "Nur Deutsch");
  ResourceTable table = decode(b);

  ResourceResolver resolver(table);
  ASSERT_EQ(nullptr, resolver.bestMatch(0x7f020000, Configuration()));
  ASSERT_THROW(resolver.resolve(0x7f020000, Configuration()), ResourceNotFoundError);
  ASSERT_EQ("Nur Deutsch", resolver.resolveString(0x7f020000, de));
}

TEST(resolver, NonStringValueIsFormatted) {
  TableBuilder b;
  b.typeName(kString, "integer");
  b.value(kString, 0, "count", Configuration(), TypedValue::TYPE_INT_DEC, 42);
  ResourceTable table = decode(b);
  ResolvedValue value = resolve(table, 0x7f020000, Configuration());
  ASSERT_EQ("42", value.text);
  ASSERT_EQ(TypedValue::TYPE_INT_DEC, value.value.dataType);
}
