#include "CohortSim.Core/api.h"
#include "pch.h"

#include <string>
#include <vector>

TEST(TestCore, StringTrim) {
    using namespace csim::core;

    ASSERT_EQ("80+", trim("  80+ "));
    ASSERT_EQ("20-24", trim("\t20-24\n"));
    ASSERT_EQ("", trim("   "));
}

TEST(TestCore, StringToLower) {
    using namespace csim::core;

    ASSERT_EQ("medium", to_lower("MeDiUm"));
    ASSERT_EQ("age_group", to_lower("Age_Group"));
}

TEST(TestCore, SplitString) {
    using namespace csim::core;

    auto parts = split_string("age,male,,female", ",");
    ASSERT_EQ(3, parts.size());
    ASSERT_EQ("age", parts[0]);
    ASSERT_EQ("male", parts[1]);
    ASSERT_EQ("female", parts[2]);
}

TEST(TestCore, JoinStrings) {
    using namespace csim::core;

    auto values = std::vector<std::string>{"low", "medium", "high"};
    ASSERT_EQ("low; medium; high", join_strings("; ", values));
    ASSERT_EQ("", join_strings(", ", std::vector<std::string>{}));
}

TEST(TestCore, CaseInsensitiveCompare) {
    using namespace csim::core;

    auto columns = std::vector<std::string>{"Age", "Male", "Female"};
    ASSERT_TRUE(case_insensitive::equals("HIGH", "high"));
    ASSERT_FALSE(case_insensitive::equals("high", "higher"));
    ASSERT_EQ(2, case_insensitive::index_of(columns, "female"));
    ASSERT_EQ(-1, case_insensitive::index_of(columns, "rate"));
}

TEST(TestCore, ExceptionWithLocation) {
    using namespace csim::core;

    try {
        throw CsimException("Invalid population table");
    } catch (const CsimException &ex) {
        ASSERT_STREQ("Invalid population table", ex.message());
        ASSERT_GT(ex.line(), 0u);
        ASSERT_NE(std::string::npos, std::string{ex.what()}.find("Invalid population table"));
    }
}
