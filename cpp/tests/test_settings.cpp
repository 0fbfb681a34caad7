// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cdgw/data/settings.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "ut_common.hpp"

using namespace cdgw::data;

// Derived settings with one key of every supported kind
class ExampleSettings : public Settings {
 public:
  ExampleSettings() {
    set_default("flag", false, "A switch");
    set_default<int64_t>("count", 10, "Bounded integer",
                         BoundConstraint<int64_t>{-1, 100});
    set_default<int64_t>("order", 2, "Listed integer",
                         ListConstraint<int64_t>{{2, 4, 8}});
    set_default("step", 0.01, "Bounded double",
                BoundConstraint<double>{0.0, 1.0});
    set_default("mode", "fast", "Listed string",
                ListConstraint<std::string>{{"fast", "exact"}});
    set_default("label", std::string("none"));
    set_default("indices", std::vector<int64_t>{1, 2});
    set_default("weights", std::vector<double>{0.5});
  }
};

class SettingsTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::filesystem::remove(testing::scratch_file("test.settings.json"));
    std::filesystem::remove(testing::scratch_file("test.settings.h5"));
  }

  ExampleSettings settings;
};

TEST_F(SettingsTest, DefaultsAreDeclared) {
  EXPECT_EQ(settings.size(), 8u);
  EXPECT_FALSE(settings.empty());
  EXPECT_TRUE(settings.has("count"));
  EXPECT_FALSE(settings.has("missing"));
  EXPECT_EQ(settings.get<int64_t>("count"), 10);
  EXPECT_EQ(settings.get<std::string>("mode"), "fast");
  EXPECT_EQ(settings.get_type_name("step"), "double");
  EXPECT_EQ(settings.get_description("count"), "Bounded integer");
  EXPECT_FALSE(settings.has_description("label"));
  EXPECT_TRUE(settings.has_limits("order"));
  EXPECT_FALSE(settings.has_limits("flag"));

  const auto keys = settings.keys();
  EXPECT_NE(std::find(keys.begin(), keys.end(), "weights"), keys.end());
}

TEST_F(SettingsTest, SetAndGet) {
  settings.set("flag", true);
  settings.set("count", 42);
  settings.set("step", 0.5);
  settings.set("mode", "exact");
  settings.set("indices", std::vector<int64_t>{3, 4, 5});

  EXPECT_TRUE(settings.get<bool>("flag"));
  EXPECT_EQ(settings.get<int>("count"), 42);
  EXPECT_EQ(settings.get<std::size_t>("count"), 42u);
  EXPECT_DOUBLE_EQ(settings.get<double>("step"), 0.5);
  EXPECT_EQ(settings.get<std::string>("mode"), "exact");
  EXPECT_EQ(settings.get<std::vector<int64_t>>("indices").size(), 3u);
  EXPECT_TRUE(std::holds_alternative<int64_t>(settings.get("count")));
}

TEST_F(SettingsTest, UnknownKeysAndTypeMismatch) {
  EXPECT_THROW(settings.set("missing", 1), SettingNotFound);
  EXPECT_THROW(settings.get<int64_t>("missing"), SettingNotFound);
  EXPECT_THROW(settings.set("count", 0.5), SettingTypeMismatch);
  EXPECT_THROW(settings.set("flag", "yes"), SettingTypeMismatch);
  EXPECT_THROW(settings.get<double>("count"), SettingTypeMismatch);

  settings.set("count", -1);
  EXPECT_THROW(settings.get<std::size_t>("count"), SettingTypeMismatch);
}

TEST_F(SettingsTest, ConstraintsAreEnforced) {
  EXPECT_THROW(settings.set("count", 101), std::invalid_argument);
  EXPECT_THROW(settings.set("count", -2), std::invalid_argument);
  EXPECT_NO_THROW(settings.set("count", -1));
  EXPECT_THROW(settings.set("order", 3), std::invalid_argument);
  EXPECT_NO_THROW(settings.set("order", 8));
  EXPECT_THROW(settings.set("step", 1.5), std::invalid_argument);
  EXPECT_THROW(settings.set("mode", "slow"), std::invalid_argument);

  // Rejected values leave the old one in place
  EXPECT_EQ(settings.get<int64_t>("order"), 8);
  EXPECT_DOUBLE_EQ(settings.get<double>("step"), 0.01);
}

TEST_F(SettingsTest, GetOrDefault) {
  EXPECT_EQ(settings.get_or_default<int64_t>("count", 7), 10);
  EXPECT_EQ(settings.get_or_default<int64_t>("missing", 7), 7);
  EXPECT_DOUBLE_EQ(settings.get_or_default("count", 3.0), 3.0);
}

TEST_F(SettingsTest, LockPreventsModification) {
  EXPECT_FALSE(settings.is_locked());
  settings.lock();
  EXPECT_TRUE(settings.is_locked());
  EXPECT_THROW(settings.set("count", 5), SettingsAreLocked);
  EXPECT_THROW(settings.update(std::map<std::string, std::string>{
                   {"count", "5"}}),
               SettingsAreLocked);
  EXPECT_EQ(settings.get<int64_t>("count"), 10);
}

TEST_F(SettingsTest, UpdateFromStrings) {
  settings.update(std::map<std::string, std::string>{
      {"flag", "yes"}, {"count", "64"}, {"step", "1e-3"}, {"label", "cd"},
      {"weights", "[0.25, 0.75]"}});
  EXPECT_TRUE(settings.get<bool>("flag"));
  EXPECT_EQ(settings.get<int64_t>("count"), 64);
  EXPECT_DOUBLE_EQ(settings.get<double>("step"), 1e-3);
  EXPECT_EQ(settings.get<std::string>("label"), "cd");
  EXPECT_EQ(settings.get<std::vector<double>>("weights").size(), 2u);
}

TEST_F(SettingsTest, UpdateFromStringsIsAllOrNothing) {
  EXPECT_THROW(settings.update(std::map<std::string, std::string>{
                   {"count", "12"}, {"step", "small"}}),
               std::invalid_argument);
  EXPECT_EQ(settings.get<int64_t>("count"), 10);

  EXPECT_THROW(settings.update(std::map<std::string, std::string>{
                   {"count", "12"}, {"missing", "1"}}),
               SettingNotFound);
  EXPECT_EQ(settings.get<int64_t>("count"), 10);
}

TEST_F(SettingsTest, UpdateFromOtherSettings) {
  ExampleSettings other;
  other.set("count", 33);
  other.set("mode", "exact");
  settings.update(other);
  EXPECT_EQ(settings.get<int64_t>("count"), 33);
  EXPECT_EQ(settings.get<std::string>("mode"), "exact");
}

TEST_F(SettingsTest, TableAndSummary) {
  const auto table = settings.as_table();
  EXPECT_NE(table.find("count"), std::string::npos);
  EXPECT_NE(table.find("Bounded integer"), std::string::npos);
  EXPECT_EQ(settings.get_as_string("mode"), "\"fast\"");
  EXPECT_EQ(settings.get_as_string("indices"), "[1, 2]");
  EXPECT_NE(settings.get_summary().find("flag = false"), std::string::npos);
}

TEST_F(SettingsTest, JsonRoundTrip) {
  settings.set("count", 55);
  settings.set("weights", std::vector<double>{0.1, 0.2});
  auto restored = Settings::from_json(settings.to_json());
  EXPECT_EQ(restored->size(), settings.size());
  EXPECT_EQ(restored->get<int64_t>("count"), 55);
  EXPECT_DOUBLE_EQ(restored->get<double>("step"), 0.01);
  EXPECT_FALSE(restored->get<bool>("flag"));
  EXPECT_EQ(restored->get<std::vector<double>>("weights").size(), 2u);
  EXPECT_EQ(restored->get_description("step"), "Bounded double");

  const auto filename = testing::scratch_file("test.settings.json");
  settings.to_file(filename, "json");
  auto from_file = Settings::from_file(filename, "json");
  EXPECT_EQ(from_file->get<std::string>("mode"), "fast");
}

TEST_F(SettingsTest, Hdf5RoundTrip) {
  settings.set("flag", true);
  settings.set("indices", std::vector<int64_t>{7, 8, 9});
  const auto filename = testing::scratch_file("test.settings.h5");
  settings.to_hdf5_file(filename);
  auto restored = Settings::from_hdf5_file(filename);
  EXPECT_TRUE(restored->get<bool>("flag"));
  EXPECT_EQ(restored->get<std::vector<int64_t>>("indices"),
            (std::vector<int64_t>{7, 8, 9}));
  EXPECT_EQ(restored->get<std::string>("label"), "none");
  EXPECT_DOUBLE_EQ(restored->get<double>("step"), 0.01);
}

TEST_F(SettingsTest, UnsupportedFileType) {
  EXPECT_THROW(settings.to_file(testing::scratch_file("test.settings.json"),
                                "yaml"),
               std::invalid_argument);
  EXPECT_THROW(Settings::from_file(testing::scratch_file("test.settings.json"),
                                   "yaml"),
               std::invalid_argument);
}
