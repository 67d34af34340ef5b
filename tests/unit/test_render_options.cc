#include <gtest/gtest.h>

#include <stdexcept>

#include "session/render_options.h"

namespace strata {

class RenderOptionsTest : public ::testing::Test {
  protected:
    RenderOptions options_;
};

TEST_F(RenderOptionsTest, DefaultsAreValid) {
    EXPECT_NO_THROW(ValidateOptions(options_));
    EXPECT_EQ(options_.image_config.height(), 225);
}

TEST_F(RenderOptionsTest, HeightIsAtLeastOne) {
    options_.image_config.width = 3;
    options_.image_config.aspect_ratio = 10.0;
    EXPECT_EQ(options_.image_config.height(), 1);
}

TEST_F(RenderOptionsTest, RejectsBadWorkerCounts) {
    options_.image_config.width = 8;
    options_.integrator_config.num_workers = 9;
    EXPECT_THROW(ValidateOptions(options_), std::invalid_argument);
    options_.integrator_config.num_workers = -1;
    EXPECT_THROW(ValidateOptions(options_), std::invalid_argument);
    options_.integrator_config.num_workers = 0;
    EXPECT_THROW(ValidateOptions(options_), std::invalid_argument);
    options_.integrator_config.num_workers = 1;
    EXPECT_NO_THROW(ValidateOptions(options_));
    options_.integrator_config.num_workers = 8;
    EXPECT_NO_THROW(ValidateOptions(options_));
}

TEST_F(RenderOptionsTest, DefaultWorkerCountIsOne) {
    EXPECT_EQ(options_.integrator_config.num_workers, 1);
}

TEST_F(RenderOptionsTest, HostAutoWorkerCountIsClampedToWidth) {
    EXPECT_EQ(ResolveWorkerCount(0, 1), 1);
    int automatic = ResolveWorkerCount(0, 400);
    EXPECT_GE(automatic, 1);
    EXPECT_LE(automatic, 400);

    // Explicit counts pass through untouched, validation happens later
    EXPECT_EQ(ResolveWorkerCount(3, 400), 3);
    EXPECT_EQ(ResolveWorkerCount(9, 8), 9);
}

TEST_F(RenderOptionsTest, RejectsBadImageAndCamera) {
    RenderOptions o = options_;
    o.image_config.width = 0;
    EXPECT_THROW(ValidateOptions(o), std::invalid_argument);

    o = options_;
    o.image_config.aspect_ratio = 0;
    EXPECT_THROW(ValidateOptions(o), std::invalid_argument);

    o = options_;
    o.integrator_config.max_depth = 0;
    EXPECT_THROW(ValidateOptions(o), std::invalid_argument);

    o = options_;
    o.camera_config.focus_dist = 0;
    EXPECT_THROW(ValidateOptions(o), std::invalid_argument);

    o = options_;
    o.camera_config.look_at = o.camera_config.look_from;
    EXPECT_THROW(ValidateOptions(o), std::invalid_argument);

    o = options_;
    o.camera_config.vup = Vec3(0, 0, 1);  // Parallel to the view axis
    EXPECT_THROW(ValidateOptions(o), std::invalid_argument);
}

TEST(IntegratorTypeNameTest, Names) {
    EXPECT_STREQ(IntegratorTypeName(IntegratorType::PathTrace), "path");
    EXPECT_STREQ(IntegratorTypeName(IntegratorType::Normals), "normals");
}

}  // namespace strata
