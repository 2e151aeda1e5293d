#include <gtest/gtest.h>
#include "agent/state_discretizer.hpp"
#include <cmath>
#include <limits>

using namespace phenom;

TEST(DiscretizerTest, OriginIsBucketZero) {
    StateDiscretizer d(2.0);
    EXPECT_EQ(d.bucket(0.0), 0);
    EXPECT_EQ(d.bucket(-0.0), 0);
    EXPECT_EQ(d.key({0.0, 0.0, 0.0}), "0:0:0");
}

TEST(DiscretizerTest, FoveatedBuckets) {
    StateDiscretizer d(2.0);
    // round(ln(2) * 2) = round(1.386) = 1
    EXPECT_EQ(d.bucket(1.0), 1);
    // round(ln(11) * 2) = round(4.796) = 5
    EXPECT_EQ(d.bucket(10.0), 5);
    // round(ln(101) * 2) = round(9.230) = 9
    EXPECT_EQ(d.bucket(100.0), 9);
}

TEST(DiscretizerTest, SignIsPreserved) {
    StateDiscretizer d(2.0);
    for (double v : {0.5, 1.0, 3.7, 42.0, 1234.5}) {
        EXPECT_EQ(d.bucket(-v), -d.bucket(v)) << "v=" << v;
    }
    EXPECT_EQ(d.key({-10.0, 1.0, 0.0}), "-5:1:0");
}

TEST(DiscretizerTest, ResolutionCoarsensAwayFromOrigin) {
    StateDiscretizer d(2.0);
    // Near the origin a unit step changes the bucket...
    EXPECT_NE(d.bucket(0.0), d.bucket(1.0));
    // ...far away it does not.
    EXPECT_EQ(d.bucket(500.0), d.bucket(501.0));
}

TEST(DiscretizerTest, Deterministic) {
    StateDiscretizer d(2.0);
    Vec3 s{12.345, -6.789, 23.456};
    StateKey first = d.key(s);
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(d.key(s), first);
    }
    StateDiscretizer twin(2.0);
    EXPECT_EQ(twin.key(s), first);
}

TEST(DiscretizerTest, SmallPerturbationStaysInBucket) {
    StateDiscretizer d(2.0);
    // ln(11.05) * 2 = 4.805, still bucket 5
    EXPECT_EQ(d.key({10.0, 10.0, 10.0}), d.key({10.05, 9.95, 10.02}));
}

TEST(DiscretizerTest, NonFiniteInputs) {
    StateDiscretizer d(2.0);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_EQ(d.bucket(nan), 0);
    EXPECT_EQ(d.bucket(inf), d.bucket(StateDiscretizer::kMaxMagnitude));
    EXPECT_EQ(d.bucket(-inf), -d.bucket(StateDiscretizer::kMaxMagnitude));

    Vec3 clean = StateDiscretizer::sanitize({nan, inf, -inf});
    EXPECT_DOUBLE_EQ(clean[0], 0.0);
    EXPECT_DOUBLE_EQ(clean[1], StateDiscretizer::kMaxMagnitude);
    EXPECT_DOUBLE_EQ(clean[2], -StateDiscretizer::kMaxMagnitude);
}

TEST(DiscretizerTest, ScaleChangesResolution) {
    StateDiscretizer coarse(1.0);
    StateDiscretizer fine(4.0);
    EXPECT_LT(coarse.bucket(50.0), fine.bucket(50.0));
}

TEST(DiscretizerTest, RejectsBadScale) {
    EXPECT_THROW(StateDiscretizer(0.0), std::invalid_argument);
    EXPECT_THROW(StateDiscretizer(-1.0), std::invalid_argument);
}
