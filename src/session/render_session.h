#ifndef STRATA_SESSION_RENDER_SESSION_H_
#define STRATA_SESSION_RENDER_SESSION_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "film/film.h"
#include "film/image_buffer.h"
#include "session/render_options.h"

/*
 * The entry point to the engine.
 * Owns the camera, the integrator and one ViewWorker per vertical strip, and
 * runs the pass-synchronized, time-boxed render tick for the host loop.
 */

namespace strata {

class Scene;
class Camera;
class Integrator;
class ViewWorker;

class RenderSession {
  public:
    using Clock = std::chrono::steady_clock;

    // Validates options (std::invalid_argument on failure), partitions the image
    // and starts the workers. The scene is shared read-only with every worker.
    RenderSession(std::shared_ptr<const Scene> scene, const RenderOptions& options);
    ~RenderSession();

    RenderSession(const RenderSession&) = delete;
    RenderSession& operator=(const RenderSession&) = delete;

    /**
     * One tick of the host loop:
     *  1. hand the current pass target to every worker (rendezvous)
     *  2. sleep until deadline
     *  3. raise the pause flag
     *  4. collect every worker's pass count (rendezvous, at its next row boundary)
     *  5. move the target on by one pass if every strip reached it
     *  6. lower the pause flag
     * Returns the smallest pass count reported. A deadline in the past still lets
     * each worker with work left finish at least one row.
     */
    int Render(Clock::time_point deadline);

    int image_width() const { return image_width_; }
    int image_height() const { return image_height_; }
    size_t num_strips() const { return workers_.size(); }
    const StripBounds& strip_bounds(size_t i) const;

    // Scoped access to a strip's RGBA bytes for the presentation layer
    Film::PixelLock LockStripPixels(size_t i) const;

    // Pass count the next tick will ask for
    int target_passes() const { return target_passes_; }

    // Pass counts reported in the last tick, one per strip
    const std::vector<int>& last_reports() const { return last_reports_; }

    // The following read the accumulators: call them between ticks only.

    // Linear mean color of every pixel
    ImageBuffer Snapshot() const;

    // Full-image RGBA8 assembled from the strips' display buffers
    std::vector<uint8_t> ComposeDisplay() const;

    // Writes image_config.outfile (PPM) and, if set, image_config.exrfile (EXR)
    void SaveSnapshot() const;

    const RenderOptions& options() const { return options_; }

  private:
    std::shared_ptr<const Scene> scene_;
    RenderOptions options_;
    int image_width_;
    int image_height_;

    std::shared_ptr<const Camera> camera_;
    std::shared_ptr<const Integrator> integrator_;

    // Advisory only: workers poll it once per row
    std::atomic<bool> pause_{false};
    std::vector<std::unique_ptr<ViewWorker>> workers_;

    int target_passes_ = 1;
    std::vector<int> last_reports_;
};

}  // namespace strata

#endif  // STRATA_SESSION_RENDER_SESSION_H_
