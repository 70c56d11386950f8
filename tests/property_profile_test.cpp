#include "property_profile.h"

#include "bacnet_types.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace bacproxy;

namespace {

class PropertyProfileTest : public ::testing::Test {
  protected:
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::string write(const std::string &xml) {
        std::ofstream out(path);
        out << xml;
        return path.string();
    }

    std::filesystem::path path = std::filesystem::temp_directory_path() /
                                 ("bacproxy_profile_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                                  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".xml");
    PropertyProfile profile;
};

} // namespace

TEST_F(PropertyProfileTest, BuiltInDefaults) {
    using namespace property_id;
    EXPECT_EQ(profile.propertiesFor(object_type::kAnalogInput),
              (std::vector<std::uint32_t>{kObjectName, kPresentValue, kUnits, kStatusFlags, kDescription}));
    EXPECT_EQ(profile.propertiesFor(object_type::kBinaryValue),
              (std::vector<std::uint32_t>{kObjectName, kPresentValue, kStatusFlags, kDescription}));
    EXPECT_EQ(profile.propertiesFor(object_type::kDevice),
              (std::vector<std::uint32_t>{kObjectName, kVendorName, kModelName, kFirmwareRevision, kProtocolVersion}));
    // Types without an entry get the common properties only.
    EXPECT_EQ(profile.propertiesFor(17), (std::vector<std::uint32_t>{kObjectName}));
}

TEST_F(PropertyProfileTest, LoadsXmlProfile) {
    const auto file = write(R"(<?xml version="1.0"?>
<profile>
  <object type="*">
    <property name="object-name"/>
    <property name="description"/>
  </object>
  <object type="analog-value">
    <property name="present-value"/>
    <property name="description"/>
    <property name="relinquish-default"/>
  </object>
</profile>)");

    ASSERT_TRUE(profile.loadFromXml(file));
    using namespace property_id;
    EXPECT_EQ(profile.propertiesFor(object_type::kAnalogValue),
              (std::vector<std::uint32_t>{kObjectName, kDescription, kPresentValue, kRelinquishDefault}));
    // Types the file does not mention lose their defaults.
    EXPECT_EQ(profile.propertiesFor(object_type::kAnalogInput), (std::vector<std::uint32_t>{kObjectName, kDescription}));
}

TEST_F(PropertyProfileTest, SkipsUnknownEntries) {
    const auto file = write(R"(<profile>
  <object type="not-a-type"><property name="present-value"/></object>
  <object><property name="present-value"/></object>
  <object type="binary-input">
    <property name="not-a-property"/>
    <property/>
    <property name="present-value"/>
  </object>
</profile>)");

    ASSERT_TRUE(profile.loadFromXml(file));
    using namespace property_id;
    // No wildcard entry: object-name stays the common property.
    EXPECT_EQ(profile.propertiesFor(object_type::kBinaryInput), (std::vector<std::uint32_t>{kObjectName, kPresentValue}));
}

TEST_F(PropertyProfileTest, FailedLoadKeepsCurrentProfile) {
    const auto before = profile.propertiesFor(object_type::kAnalogInput);

    EXPECT_FALSE(profile.loadFromXml((std::filesystem::temp_directory_path() / "bacproxy_missing.xml").string()));
    EXPECT_FALSE(profile.loadFromXml(write("<profile><object type=\"*\">")));
    EXPECT_FALSE(profile.loadFromXml(write("<points/>")));

    EXPECT_EQ(profile.propertiesFor(object_type::kAnalogInput), before);
}

TEST_F(PropertyProfileTest, ResetRestoresDefaults) {
    const auto defaults = profile.propertiesFor(object_type::kMultiStateValue);
    ASSERT_TRUE(profile.loadFromXml(write("<profile/>")));
    EXPECT_EQ(profile.propertiesFor(object_type::kMultiStateValue), (std::vector<std::uint32_t>{property_id::kObjectName}));

    profile.resetToDefaults();
    EXPECT_EQ(profile.propertiesFor(object_type::kMultiStateValue), defaults);
}
