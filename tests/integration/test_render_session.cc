#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

#include "core/rng.h"
#include "film/image_buffer.h"
#include "geometry/sphere.h"
#include "integrators/path_trace.h"
#include "io/image_io.h"
#include "materials/material.h"
#include "scene/camera.h"
#include "scene/scene.h"
#include "session/render_options.h"
#include "session/render_session.h"
#include "session/view_worker.h"

namespace strata {

namespace {

using Clock = RenderSession::Clock;

// Lambertian sphere r=0.5 at (0,0,-1), camera at the origin looking down -Z.
// With vfov 90 and focus 1 the viewport is 2x2 at z = -1.
std::shared_ptr<Scene> MakeSingleSphereScene() {
    auto scene = std::make_shared<Scene>();
    uint32_t mat = scene->AddMaterial(Material::MakeLambertian(RGB(0.5)));
    scene->AddSphere(Sphere{Point3(0, 0, -1), 0.5, mat});
    return scene;
}

RenderOptions MakeOptions(int width, Float aspect, int workers, int depth, uint64_t seed) {
    RenderOptions opts;
    opts.image_config.width = width;
    opts.image_config.aspect_ratio = aspect;
    opts.image_config.outfile.clear();
    opts.camera_config.vfov = 90;
    opts.camera_config.look_from = Point3(0, 0, 0);
    opts.camera_config.look_at = Point3(0, 0, -1);
    opts.camera_config.focus_dist = 1;
    opts.integrator_config.num_workers = workers;
    opts.integrator_config.max_depth = depth;
    opts.integrator_config.seed = seed;
    return opts;
}

Clock::time_point In(int ms) { return Clock::now() + std::chrono::milliseconds(ms); }

// Runs ticks with generous deadlines until every strip finished passes passes
void RenderPasses(RenderSession& session, int passes) {
    while (session.target_passes() <= passes) {
        session.Render(In(20));
    }
}

Float MeanAbsDiff(const ImageBuffer& a, const ImageBuffer& b) {
    double sum = 0;
    for (int y = 0; y < a.GetHeight(); ++y) {
        for (int x = 0; x < a.GetWidth(); ++x) {
            RGB d = a.GetPixel(x, y) - b.GetPixel(x, y);
            sum += std::fabs(d.r()) + std::fabs(d.g()) + std::fabs(d.b());
        }
    }
    return sum / (3.0 * a.GetWidth() * a.GetHeight());
}

}  // namespace

// ============================================================================
// One pass over a 2x2 image
// ============================================================================

class TwoByTwoTest : public ::testing::TestWithParam<int> {};

TEST_P(TwoByTwoTest, OnePassMatchesReplayedSampleStream) {
    const int depth = GetParam();
    const uint64_t seed = 2024;
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(2, 1.0, 1, depth, seed);

    RenderSession session(scene, opts);
    EXPECT_EQ(session.Render(In(200)), 1);
    EXPECT_EQ(session.target_passes(), 2);

    // Worker 0 samples pixels row by row with RNG(seed): GetRay then RayColor
    Camera camera(opts.image_config, opts.camera_config);
    RNG rng(seed);
    ImageBuffer snapshot = session.Snapshot();

    // Seed 2024 jitters both top pixels inside the silhouette and both bottom
    // pixels outside it (x^2 + y^2 is about 0.08, 0.17, 0.44 and 0.67)
    const bool kExpectedHit[2][2] = {{true, true}, {false, false}};

    for (int j = 0; j < 2; ++j) {
        for (int i = 0; i < 2; ++i) {
            Ray r = camera.GetRay(i, j, rng);
            // Jittered target on the z = -1 plane
            Point3 target = r.at(1.0);
            bool hit = target.x() * target.x() + target.y() * target.y() < 1.0 / 3.0;
            EXPECT_EQ(hit, kExpectedHit[j][i]) << "pixel (" << i << ", " << j << ")";
            RGB expected = RayColor(rng, depth, r, *scene);

            const RGB& got = snapshot.GetPixel(i, j);
            EXPECT_EQ(got.r(), expected.r());
            EXPECT_EQ(got.g(), expected.g());
            EXPECT_EQ(got.b(), expected.b());

            if (kExpectedHit[j][i]) {
                // Depth 1 is spent on the first scatter
                EXPECT_EQ(got.IsBlack(), depth == 1);
            } else {
                EXPECT_FALSE(got.IsBlack());
                EXPECT_EQ(got.r(), Background(r).r());
                EXPECT_EQ(got.b(), Background(r).b());
            }
        }
    }
}

INSTANTIATE_TEST_SUITE_P(Depths, TwoByTwoTest, ::testing::Values(1, 2));

// ============================================================================
// Time boxing and display buffers
// ============================================================================

TEST(RenderSessionTest, PastDeadlineStillRendersARow) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(64, 1.0, 4, 10, 3);
    RenderSession session(scene, opts);
    ASSERT_EQ(session.num_strips(), 4u);

    session.Render(Clock::now() - std::chrono::seconds(1));

    for (size_t s = 0; s < session.num_strips(); ++s) {
        Film::PixelLock pixels = session.LockStripPixels(s);
        ASSERT_EQ(pixels.width(), session.strip_bounds(s).width);
        // Row 0 is always the first one rendered
        for (int x = 0; x < pixels.width(); ++x) {
            EXPECT_EQ(pixels.at(x, 0)[3], 255);
        }
        // Every pixel is either untouched or fully published
        for (int y = 0; y < pixels.height(); ++y) {
            for (int x = 0; x < pixels.width(); ++x) {
                const uint8_t* p = pixels.at(x, y);
                if (p[3] == 0) {
                    EXPECT_EQ(p[0] | p[1] | p[2], 0);
                } else {
                    EXPECT_EQ(p[3], 255);
                }
            }
        }
    }
}

TEST(RenderSessionTest, PassTargetOnlyAdvancesWhenEveryStripReachesIt) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(32, 1.0, 2, 5, 11);
    RenderSession session(scene, opts);

    int target = session.target_passes();
    EXPECT_EQ(target, 1);
    for (int tick = 0; tick < 50; ++tick) {
        int min_passes = session.Render(Clock::now());
        const std::vector<int>& reports = session.last_reports();
        ASSERT_EQ(reports.size(), 2u);
        for (int r : reports) {
            EXPECT_LE(r, target);
            EXPECT_GE(r, min_passes);
        }
        int expected = min_passes >= target ? target + 1 : target;
        EXPECT_EQ(session.target_passes(), expected);
        target = session.target_passes();
    }
}

TEST(RenderSessionTest, StripsCoverTheWholeImage) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(10, 2.0, 3, 5, 1);
    RenderSession session(scene, opts);

    EXPECT_EQ(session.image_width(), 10);
    EXPECT_EQ(session.image_height(), 5);
    int next = 0;
    for (size_t s = 0; s < session.num_strips(); ++s) {
        EXPECT_EQ(session.strip_bounds(s).x_offset, next);
        next += session.strip_bounds(s).width;
    }
    EXPECT_EQ(next, 10);
    EXPECT_THROW(session.strip_bounds(3), std::out_of_range);
}

// ============================================================================
// Progressive refinement
// ============================================================================

TEST(RenderSessionTest, ImageConvergesWithMorePasses) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(16, 1.0, 2, 10, 77);
    RenderSession session(scene, opts);

    const int n = 16;
    RenderPasses(session, n);
    ImageBuffer at_n = session.Snapshot();
    RenderPasses(session, 2 * n);
    ImageBuffer at_2n = session.Snapshot();
    RenderPasses(session, 4 * n);
    ImageBuffer at_4n = session.Snapshot();

    EXPECT_LT(MeanAbsDiff(at_2n, at_4n), MeanAbsDiff(at_n, at_2n));
}

TEST(RenderSessionTest, DisplayBytesMatchSnapshot) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(8, 1.0, 2, 4, 5);
    RenderSession session(scene, opts);
    RenderPasses(session, 3);

    // Between ticks every row was resolved with the same count Snapshot uses
    ImageBuffer snapshot = session.Snapshot();
    std::vector<uint8_t> rgba = session.ComposeDisplay();
    ASSERT_EQ(rgba.size(), 8u * 8 * 4);
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) {
            const uint8_t* p = &rgba[4 * (y * 8 + x)];
            const RGB& c = snapshot.GetPixel(x, y);
            EXPECT_EQ(p[0], ToDisplayByte(c.r()));
            EXPECT_EQ(p[1], ToDisplayByte(c.g()));
            EXPECT_EQ(p[2], ToDisplayByte(c.b()));
            EXPECT_EQ(p[3], 255);
        }
    }
}

TEST(RenderSessionTest, NormalsIntegratorRendersThroughWorkers) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(8, 1.0, 2, 5, 8);
    opts.integrator_config.integrator_type = IntegratorType::Normals;
    RenderSession session(scene, opts);
    RenderPasses(session, 1);

    // Pixels next to the image centre look straight at the sphere: normal mostly +Z
    ImageBuffer snapshot = session.Snapshot();
    for (int y : {3, 4}) {
        for (int x : {3, 4}) {
            EXPECT_GT(snapshot.GetPixel(x, y).b(), 0.75);
        }
    }
    // Corners see the sky
    EXPECT_FALSE(snapshot.GetPixel(0, 0).IsBlack());
}

TEST(ViewWorkerTest, PausedPassResumesFromSavedRow) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(4, 1.0, 1, 5, 11);
    auto camera = std::make_shared<Camera>(opts.image_config, opts.camera_config);
    auto integrator = std::make_shared<PathTrace>(5);
    const int height = opts.image_config.height();

    std::atomic<bool> pause{true};
    ViewWorker worker(0, StripBounds{0, 4}, height, scene, camera, integrator, 11, pause);

    // One row per request while paused, pass not finished
    EXPECT_EQ(worker.Advance(1), 0);
    EXPECT_EQ(worker.start_row(), 1);
    EXPECT_EQ(worker.SamplesInRow(0), 1);
    EXPECT_EQ(worker.SamplesInRow(1), 0);

    std::vector<RGB> row0;
    for (int x = 0; x < 4; ++x) row0.push_back(worker.film().Average(x, 0, 1));

    pause.store(false);
    EXPECT_EQ(worker.Advance(1), 1);
    EXPECT_EQ(worker.start_row(), 0);
    EXPECT_EQ(worker.render_passes(), 1);
    for (int y = 0; y < height; ++y) EXPECT_EQ(worker.SamplesInRow(y), 1);

    // Row 0 was not rendered again: its sum is still the single first sample
    for (int x = 0; x < 4; ++x) {
        RGB now = worker.film().Average(x, 0, 1);
        EXPECT_DOUBLE_EQ(now.r(), row0[x].r());
        EXPECT_DOUBLE_EQ(now.g(), row0[x].g());
        EXPECT_DOUBLE_EQ(now.b(), row0[x].b());
    }
}

// ============================================================================
// Configuration errors and export
// ============================================================================

TEST(RenderSessionTest, RejectsInvalidConfiguration) {
    auto scene = MakeSingleSphereScene();
    // Zero workers, more workers than columns
    EXPECT_THROW({ RenderSession s(scene, MakeOptions(8, 1.0, 0, 5, 0)); }, std::invalid_argument);
    EXPECT_THROW({ RenderSession s(scene, MakeOptions(4, 1.0, 5, 5, 0)); }, std::invalid_argument);
    EXPECT_THROW({ RenderSession s(scene, MakeOptions(4, 1.0, -2, 5, 0)); }, std::invalid_argument);
    // Zero bounce budget
    EXPECT_THROW({ RenderSession s(scene, MakeOptions(4, 1.0, 1, 0, 0)); }, std::invalid_argument);
    EXPECT_THROW({ RenderSession s(nullptr, MakeOptions(4, 1.0, 1, 5, 0)); },
                 std::invalid_argument);
}

TEST(RenderSessionTest, SaveSnapshotWritesPPM) {
    auto scene = MakeSingleSphereScene();
    RenderOptions opts = MakeOptions(6, 2.0, 2, 5, 4);
    opts.image_config.outfile = "session_snapshot.ppm";
    RenderSession session(scene, opts);
    RenderPasses(session, 2);
    session.SaveSnapshot();

    PPMImage img = ImageIO::LoadPPM(opts.image_config.outfile);
    EXPECT_EQ(img.width, 6);
    EXPECT_EQ(img.height, 3);

    std::vector<uint8_t> rgba = session.ComposeDisplay();
    for (int p = 0; p < 6 * 3; ++p) {
        EXPECT_EQ(img.rgb[3 * p], rgba[4 * p]);
    }
    std::filesystem::remove(opts.image_config.outfile);
}

}  // namespace strata
