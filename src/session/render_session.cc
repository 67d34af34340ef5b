#include "session/render_session.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "core/constants.h"
#include "core/log.h"
#include "integrators/integrator.h"
#include "integrators/normals.h"
#include "integrators/path_trace.h"
#include "io/image_io.h"
#include "scene/camera.h"
#include "scene/scene.h"
#include "session/view_worker.h"

namespace strata {

/* FACTORY FUNCTION for Creating Integrators */
static std::shared_ptr<const Integrator> CreateIntegrator(const IntegratorConfig& config) {
    switch (config.integrator_type) {
        case IntegratorType::PathTrace:
            return std::make_shared<PathTrace>(config.max_depth);
        case IntegratorType::Normals:
            return std::make_shared<Normals>();
    }
    throw std::invalid_argument("Unknown integrator type");
}

RenderSession::RenderSession(std::shared_ptr<const Scene> scene, const RenderOptions& options)
    : scene_(std::move(scene)), options_(options) {
    if (!scene_) {
        throw std::invalid_argument("RenderSession needs a scene");
    }
    ValidateOptions(options_);

    image_width_ = options_.image_config.width;
    image_height_ = options_.image_config.height();
    camera_ = std::make_shared<Camera>(options_.image_config, options_.camera_config);
    integrator_ = CreateIntegrator(options_.integrator_config);

    const std::vector<StripBounds> strips =
        PartitionStrips(image_width_, options_.integrator_config.num_workers);
    const uint64_t seed = options_.integrator_config.seed;

    workers_.reserve(strips.size());
    for (size_t i = 0; i < strips.size(); ++i) {
        // Independent stream per strip
        workers_.push_back(std::make_unique<ViewWorker>(
            static_cast<int>(i), strips[i], image_height_, scene_, camera_, integrator_,
            seed + i * kGoldenRatio, pause_));
    }
    for (auto& worker : workers_) {
        worker->Start();
    }
    last_reports_.assign(workers_.size(), 0);

    Log("Session", std::to_string(image_width_) + "x" + std::to_string(image_height_) + " | " +
                       std::to_string(workers_.size()) + " strips | " +
                       IntegratorTypeName(options_.integrator_config.integrator_type) +
                       " | depth " + std::to_string(options_.integrator_config.max_depth) +
                       " | " + std::to_string(scene_->NumSpheres()) + " spheres");
}

// Stop() closes the worker channels and joins; unique_ptr frees the workers afterwards
RenderSession::~RenderSession() {
    for (auto& worker : workers_) {
        worker->Stop();
    }
}

int RenderSession::Render(Clock::time_point deadline) {
    const int passes_wanted = target_passes_;

    for (auto& worker : workers_) {
        worker->RequestPasses(passes_wanted);
    }

    std::this_thread::sleep_until(deadline);
    pause_.store(true, std::memory_order_relaxed);

    int min_passes = std::numeric_limits<int>::max();
    for (size_t i = 0; i < workers_.size(); ++i) {
        last_reports_[i] = workers_[i]->AwaitReport();
        min_passes = std::min(min_passes, last_reports_[i]);
    }

    // Lock-step: only move on once every strip finished the requested passes
    if (min_passes >= passes_wanted) {
        ++target_passes_;
        LogVerbose("Session", "All strips reached pass " + std::to_string(passes_wanted));
    }

    pause_.store(false, std::memory_order_relaxed);
    return min_passes;
}

const StripBounds& RenderSession::strip_bounds(size_t i) const {
    return workers_.at(i)->film().bounds();
}

Film::PixelLock RenderSession::LockStripPixels(size_t i) const {
    return workers_.at(i)->film().LockPixels();
}

ImageBuffer RenderSession::Snapshot() const {
    ImageBuffer image(image_width_, image_height_);
    for (const auto& worker : workers_) {
        const Film& film = worker->film();
        for (int y = 0; y < film.height(); ++y) {
            const int samples = worker->SamplesInRow(y);
            for (int x = 0; x < film.width(); ++x) {
                image.SetPixel(film.bounds().x_offset + x, y, film.Average(x, y, samples));
            }
        }
    }
    return image;
}

std::vector<uint8_t> RenderSession::ComposeDisplay() const {
    std::vector<uint8_t> rgba(static_cast<size_t>(image_width_) * image_height_ * 4, 0);
    for (const auto& worker : workers_) {
        Film::PixelLock pixels = worker->film().LockPixels();
        const int x_offset = worker->film().bounds().x_offset;
        const size_t row_bytes = static_cast<size_t>(pixels.width()) * 4;
        for (int y = 0; y < pixels.height(); ++y) {
            const uint8_t* src = pixels.at(0, y);
            uint8_t* dst = &rgba[4 * (static_cast<size_t>(y) * image_width_ + x_offset)];
            std::copy(src, src + row_bytes, dst);
        }
    }
    return rgba;
}

void RenderSession::SaveSnapshot() const {
    const ImageConfig& image = options_.image_config;
    if (!image.outfile.empty()) {
        ImageIO::SavePPM(image_width_, image_height_, ComposeDisplay(), image.outfile);
    }
    if (!image.exrfile.empty()) {
        ImageIO::SaveEXR(Snapshot(), image.exrfile);
    }
}

}  // namespace strata
