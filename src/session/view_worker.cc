#include "session/view_worker.h"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/log.h"

namespace strata {

ViewWorker::ViewWorker(int index, const StripBounds& bounds, int image_height,
                       std::shared_ptr<const Scene> scene, std::shared_ptr<const Camera> camera,
                       std::shared_ptr<const Integrator> integrator, uint64_t seed,
                       const std::atomic<bool>& pause)
    : index_(index),
      film_(bounds, image_height),
      rng_(seed),
      scene_(std::move(scene)),
      camera_(std::move(camera)),
      integrator_(std::move(integrator)),
      pause_(pause) {}

ViewWorker::~ViewWorker() { Stop(); }

void ViewWorker::Start() {
    thread_ = std::thread(&ViewWorker::Run, this);
}

void ViewWorker::Stop() {
    requests_.Close();
    reports_.Close();
    if (thread_.joinable()) {
        thread_.join();
        LogVerbose("Worker", "Strip " + std::to_string(index_) + " stopped after " +
                                 std::to_string(render_passes_) + " passes");
    }
}

int ViewWorker::Advance(int passes_wanted) {
    while (render_passes_ < passes_wanted) {
        RenderRow(start_row_);

        if (++start_row_ == film_.height()) {
            start_row_ = 0;
            ++render_passes_;
        }

        // Checked per row, not per pixel. A stale read costs at most one more row.
        if (pause_.load(std::memory_order_relaxed)) break;
    }
    return render_passes_;
}

void ViewWorker::RenderRow(int y) {
    const int x_offset = film_.bounds().x_offset;
    for (int x = 0; x < film_.width(); ++x) {
        Ray r = camera_->GetRay(x_offset + x, y, rng_);
        film_.AddSample(x, y, integrator_->Li(r, *scene_, rng_));
    }
    // This row now holds one more sample than the completed pass count
    film_.ResolveRow(y, render_passes_ + 1);
}

void ViewWorker::RequestPasses(int passes_wanted) { requests_.Send(passes_wanted); }

int ViewWorker::AwaitReport() {
    std::optional<int> passes = reports_.Receive();
    if (!passes) {
        throw std::runtime_error("Render worker " + std::to_string(index_) +
                                 " is no longer running");
    }
    return *passes;
}

void ViewWorker::Run() {
    try {
        while (std::optional<int> wanted = requests_.Receive()) {
            reports_.Send(Advance(*wanted));
        }
    } catch (const std::exception& e) {
        // Only expected while stopping. Otherwise the coordinator sees the closed
        // report channel and fails on its next AwaitReport().
        if (!requests_.IsClosed()) {
            LogError("Worker", "Strip " + std::to_string(index_) + ": " + e.what());
        }
    }
    // Wake a coordinator blocked on either hand-off
    requests_.Close();
    reports_.Close();
}

}  // namespace strata
