#include "pch.h"

#include "CohortSim.Core/interval.h"

TEST(TestCore_Interval, CreateEmpty) {
    using namespace csim::core;
    auto empty = IntegerInterval{};

    ASSERT_EQ(0, empty.length());
    ASSERT_EQ(0, empty.lower());
    ASSERT_EQ(0, empty.upper());
    ASSERT_TRUE(empty.contains(0));
}

TEST(TestCore_Interval, CreatePositive) {
    using namespace csim::core;
    auto lower = 0;
    auto upper = 10;
    auto len = upper - lower;
    auto mid = len / 2;
    auto animal = IntegerInterval{lower, upper};
    auto cat = IntegerInterval{mid, upper};
    auto dog = IntegerInterval{lower, mid};

    ASSERT_EQ(lower, animal.lower());
    ASSERT_EQ(upper, animal.upper());
    ASSERT_EQ(len, animal.length());
    ASSERT_TRUE(animal.contains(mid));
    ASSERT_TRUE(animal.contains(cat));
    ASSERT_TRUE(animal.contains(dog));
    ASSERT_FALSE(cat.contains(animal));
}

TEST(TestCore_Interval, CreateInvertedThrows) {
    using namespace csim::core;

    ASSERT_THROW(IntegerInterval(10, 0), CsimException);
    ASSERT_THROW(DoubleInterval(0.5, -0.5), CsimException);
}

TEST(TestCore_Interval, Comparable) {
    using namespace csim::core;

    auto lower = 0;
    auto upper = 10;
    auto mid = 5;

    auto cat = IntegerInterval{lower, upper};
    auto gato = IntegerInterval{lower, upper};
    auto dog = IntegerInterval{upper, upper + mid};
    auto cow = IntegerInterval{lower - mid, lower};

    ASSERT_EQ(cat, gato);
    ASSERT_GT(dog, cat);
    ASSERT_LT(cow, dog);
    ASSERT_FALSE(cat > dog);
    ASSERT_FALSE(dog < cow);
}

TEST(TestCore_Interval, Clamp) {
    using namespace csim::core;
    auto rates = DoubleInterval{0.0, 1.0};

    ASSERT_EQ(0.0, rates.clamp(-0.2));
    ASSERT_EQ(0.4, rates.clamp(0.4));
    ASSERT_EQ(1.0, rates.clamp(1.7));
}

TEST(TestCore_Interval, ParseInteger) {
    using namespace csim::core;

    auto animal = IntegerInterval{0, 10};
    const auto *any_str = "TheFox";
    auto cat = parse_integer_interval(animal.to_string());
    ASSERT_EQ(animal, cat);
    ASSERT_THROW(parse_integer_interval(any_str), std::invalid_argument);
    ASSERT_THROW(parse_integer_interval("1-2-3"), std::invalid_argument);
}

TEST(TestCore_Interval, ParseAgeGroup) {
    using namespace csim::core;

    ASSERT_EQ(IntegerInterval(20, 24), parse_age_group("20-24", 99));
    ASSERT_EQ(IntegerInterval(85, 100), parse_age_group(" 85+", 100));
    ASSERT_EQ(IntegerInterval(80, 99), parse_age_group("80+", 99));
    ASSERT_THROW(parse_age_group("abc+", 99), std::invalid_argument);
    ASSERT_THROW(parse_age_group("101+", 100), std::invalid_argument);
    ASSERT_THROW(parse_age_group("elderly", 100), std::invalid_argument);
}
