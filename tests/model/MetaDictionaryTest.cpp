#include "model/MetaDictionary.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace WFE;

TEST(MetaDictionaryTest, EmptyByDefault) {
    MetaDictionary meta;
    EXPECT_TRUE(meta.empty());
    EXPECT_EQ(meta.size(), 0u);
    EXPECT_EQ(meta.find("label"), nullptr);
    EXPECT_FALSE(meta.contains("label"));
}

TEST(MetaDictionaryTest, KeyedLookup) {
    MetaDictionary meta{{"label", "Awaiting review"}, {"sla_hours", 48}};

    ASSERT_NE(meta.find("label"), nullptr);
    EXPECT_EQ(*meta.find("label"), "Awaiting review");
    EXPECT_EQ(meta.at("sla_hours"), 48);
    EXPECT_EQ(meta["sla_hours"], 48);
    EXPECT_THROW(meta.at("owner"), std::out_of_range);
}

TEST(MetaDictionaryTest, AttributeStyleAccess) {
    MetaDictionary meta{{"label", "Draft"}, {"weight", 2.5}, {"nothing", nullptr}};

    EXPECT_EQ(meta.get<std::string>("label"), "Draft");
    EXPECT_DOUBLE_EQ(meta.get<double>("weight"), 2.5);
    EXPECT_EQ(meta.value<std::string>("owner", "nobody"), "nobody");
    EXPECT_EQ(meta.value<std::string>("nothing", "fallback"), "fallback");
    EXPECT_EQ(meta.value<int>("missing", 7), 7);
    EXPECT_THROW(meta.get<int>("label"), nlohmann::json::type_error);
}

TEST(MetaDictionaryTest, EnumerationKeepsInsertionOrder) {
    MetaDictionary meta;
    meta.set("zeta", 1);
    meta.set("alpha", 2);
    meta.set("mid", 3);

    std::vector<std::string> seen;
    for (const auto &[key, value] : meta) {
        seen.push_back(key + "=" + value.dump());
    }

    EXPECT_EQ(seen, (std::vector<std::string>{"zeta=1", "alpha=2", "mid=3"}));
    EXPECT_EQ(meta.keys(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(MetaDictionaryTest, OverwriteKeepsPosition) {
    MetaDictionary meta{{"a", 1}, {"b", 2}};
    meta.set("a", "changed");

    EXPECT_EQ(meta.size(), 2u);
    EXPECT_EQ(meta.keys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(meta.at("a"), "changed");
}

TEST(MetaDictionaryTest, MergeAppendsAndOverwrites) {
    MetaDictionary meta{{"label", "Old"}, {"color", "grey"}};
    meta.merge(MetaDictionary{{"label", "New"}, {"icon", "pen"}});

    EXPECT_EQ(meta.keys(), (std::vector<std::string>{"label", "color", "icon"}));
    EXPECT_EQ(meta.get<std::string>("label"), "New");
    EXPECT_EQ(meta.get<std::string>("icon"), "pen");
}

TEST(MetaDictionaryTest, JsonRoundTripPreservesOrder) {
    auto source = MetaValue::parse(R"({"z": {"nested": [1, 2]}, "a": true})");
    MetaDictionary meta = MetaDictionary::fromJson(source);

    EXPECT_EQ(meta.keys(), (std::vector<std::string>{"z", "a"}));
    EXPECT_EQ(meta.at("z")["nested"][1], 2);
    EXPECT_EQ(meta.toJson().dump(), R"({"z":{"nested":[1,2]},"a":true})");
}

TEST(MetaDictionaryTest, FromJsonRejectsNonObjects) {
    EXPECT_TRUE(MetaDictionary::fromJson(MetaValue()).empty());
    EXPECT_THROW(MetaDictionary::fromJson(MetaValue::array()), std::invalid_argument);
    EXPECT_THROW(MetaDictionary::fromJson(MetaValue("label")), std::invalid_argument);
}
