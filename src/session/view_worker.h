#ifndef STRATA_SESSION_VIEW_WORKER_H_
#define STRATA_SESSION_VIEW_WORKER_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "core/channel.h"
#include "core/rng.h"
#include "film/film.h"
#include "integrators/integrator.h"
#include "scene/camera.h"
#include "scene/scene.h"

namespace strata {

/**
 * Renders one vertical strip of the image on its own thread.
 *
 * Idle -> receives "passes wanted = N" -> renders rows from start_row until it
 * has N complete passes or sees the pause flag at a row boundary -> reports its
 * pass count -> Idle. A paused pass keeps its row cursor and resumes on the next
 * request.
 *
 * Advance() may be called directly (tests) as long as Start() was not called.
 */
class ViewWorker {
  public:
    ViewWorker(int index, const StripBounds& bounds, int image_height,
               std::shared_ptr<const Scene> scene, std::shared_ptr<const Camera> camera,
               std::shared_ptr<const Integrator> integrator, uint64_t seed,
               const std::atomic<bool>& pause);
    ~ViewWorker();

    ViewWorker(const ViewWorker&) = delete;
    ViewWorker& operator=(const ViewWorker&) = delete;

    void Start();

    // Closes both channels and joins the thread. Safe to call more than once.
    void Stop();

    // Renders rows until passes_wanted passes are complete, or until the pause
    // flag is seen after a row. Returns render_passes().
    int Advance(int passes_wanted);

    // Rendezvous send of a new request; blocks until the worker picks it up
    void RequestPasses(int passes_wanted);

    // Rendezvous receive of the worker's pass count. Throws std::runtime_error if
    // the worker thread is gone.
    int AwaitReport();

    // Number of samples every pixel of row y holds right now
    int SamplesInRow(int y) const { return y < start_row_ ? render_passes_ + 1 : render_passes_; }

    int index() const { return index_; }
    int render_passes() const { return render_passes_; }
    int start_row() const { return start_row_; }
    const Film& film() const { return film_; }

  private:
    void Run();
    void RenderRow(int y);

    int index_;
    Film film_;
    RNG rng_;
    std::shared_ptr<const Scene> scene_;
    std::shared_ptr<const Camera> camera_;
    std::shared_ptr<const Integrator> integrator_;
    const std::atomic<bool>& pause_;

    int render_passes_ = 0;  // Completed passes over the whole strip
    int start_row_ = 0;      // First row of the in-progress pass

    RendezvousChannel<int> requests_;
    RendezvousChannel<int> reports_;
    std::thread thread_;
};

}  // namespace strata

#endif  // STRATA_SESSION_VIEW_WORKER_H_
