#ifndef TOOLS_FRAME_SCHEDULER_H
#define TOOLS_FRAME_SCHEDULER_H
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <thread>
#include <utility>
#include <vector>

/*
 * Host tick source. Callbacks requested during a frame run on the next frame,
 * so a callback that requests itself again runs once per frame.
 */
class FrameScheduler {
  public:
    using frame_id_t = size_t;
    using callback_t = std::function<void()>;

  public:
    FrameScheduler(std::chrono::microseconds frame_interval =
                       std::chrono::microseconds(0))
        : frame_interval_(frame_interval) {}

  public:
    frame_id_t request_frame(callback_t callback) {
        frame_id_t id = next_id_++;
        pending_.push_back({id, std::move(callback)});
        return id;
    }

    /*
     * Cancels a pending callback, including one of the current frame that has
     * not run yet. Returns false when the callback already ran or is unknown.
     */
    bool cancel_frame(frame_id_t id) {
        auto cancel = [id](std::vector<request_t> &requests) {
            auto it = std::find_if(
                requests.begin(), requests.end(),
                [id](request_t const &request) { return request.id == id; });

            if (it == requests.end() || !it->callback)
                return false;
            it->callback = nullptr;
            return true;
        };
        return cancel(pending_) || cancel(running_);
    }

    // runs the callbacks requested before the frame started
    size_t run_frame() {
        size_t nb_callbacks = 0;

        running_.clear();
        std::swap(running_, pending_);
        ++frame_count_;

        for (size_t i = 0; i < running_.size(); ++i) {
            callback_t callback = std::move(running_[i].callback);

            if (!callback)
                continue;
            running_[i].callback = nullptr;
            callback();
            ++nb_callbacks;
        }
        running_.clear();
        return nb_callbacks;
    }

    /*
     * Runs frames until `done` returns true, no callback is pending or
     * `max_frames` frames have been run. Returns the number of frames.
     */
    size_t run_until(std::function<bool()> const &done,
                     size_t max_frames = std::numeric_limits<size_t>::max()) {
        size_t nb_frames = 0;
        auto next_frame = std::chrono::steady_clock::now();

        while (!done() && has_pending() && nb_frames < max_frames) {
            if (frame_interval_.count() > 0) {
                std::this_thread::sleep_until(next_frame);
                next_frame += frame_interval_;
            }
            run_frame();
            ++nb_frames;
        }
        return nb_frames;
    }

  public:
    bool has_pending() const {
        return std::any_of(
            pending_.begin(), pending_.end(),
            [](request_t const &request) { return (bool)request.callback; });
    }

    size_t frame_count() const { return frame_count_; }
    std::chrono::microseconds frame_interval() const { return frame_interval_; }

  private:
    struct request_t {
        frame_id_t id;
        callback_t callback;
    };

  private:
    std::vector<request_t> pending_ = {};
    std::vector<request_t> running_ = {};
    frame_id_t next_id_ = 1;
    size_t frame_count_ = 0;
    std::chrono::microseconds frame_interval_;
};

#endif
