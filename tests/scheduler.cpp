#include "scheduler.hpp"
#include "../src/tools/frame_scheduler.hpp"
#include <chrono>
#include <functional>
#include <vector>

UTest(frame_scheduler_run_frame) {
    FrameScheduler scheduler;
    std::vector<int> calls;

    scheduler.request_frame([&]() { calls.push_back(1); });
    scheduler.request_frame([&]() { calls.push_back(2); });
    uassert(scheduler.has_pending());
    uassert(calls.empty());

    uassert_equal(scheduler.run_frame(), (size_t)2);
    uassert(calls == std::vector<int>({1, 2}));
    uassert(!scheduler.has_pending());
    uassert_equal(scheduler.run_frame(), (size_t)0);
    uassert_equal(scheduler.frame_count(), (size_t)2);
}

UTest(frame_scheduler_deferred_requests) {
    FrameScheduler scheduler;
    size_t nb_calls = 0;
    std::function<void()> loop = [&]() {
        ++nb_calls;
        if (nb_calls < 3) {
            scheduler.request_frame(loop);
        }
    };

    scheduler.request_frame(loop);

    // a request made during a frame runs on the next one
    uassert_equal(scheduler.run_frame(), (size_t)1);
    uassert_equal(nb_calls, (size_t)1);
    uassert(scheduler.has_pending());
    uassert_equal(scheduler.run_frame(), (size_t)1);
    uassert_equal(nb_calls, (size_t)2);
    uassert_equal(scheduler.run_frame(), (size_t)1);
    uassert_equal(nb_calls, (size_t)3);
    uassert(!scheduler.has_pending());
}

UTest(frame_scheduler_cancel) {
    FrameScheduler scheduler;
    std::vector<int> calls;

    auto first = scheduler.request_frame([&]() { calls.push_back(1); });
    FrameScheduler::frame_id_t second = 0;
    scheduler.request_frame([&]() {
        calls.push_back(2);
        // cancels a callback of the current frame that did not run yet
        uassert(scheduler.cancel_frame(second));
    });
    second = scheduler.request_frame([&]() { calls.push_back(3); });

    uassert(scheduler.cancel_frame(first));
    uassert(!scheduler.cancel_frame(first));
    uassert(!scheduler.cancel_frame(12345));

    uassert_equal(scheduler.run_frame(), (size_t)1);
    uassert(calls == std::vector<int>({2}));
    uassert(!scheduler.cancel_frame(second));
    uassert(!scheduler.has_pending());
}

UTest(frame_scheduler_run_until) {
    FrameScheduler unpaced;
    size_t nb_calls = 0;
    std::function<void()> loop = [&]() {
        ++nb_calls;
        unpaced.request_frame(loop);
    };

    unpaced.request_frame(loop);
    uassert_equal(unpaced.run_until([&]() { return nb_calls >= 10; }),
                  (size_t)10);
    uassert_equal(nb_calls, (size_t)10);

    // limited number of frames
    uassert_equal(unpaced.run_until([]() { return false; }, 5), (size_t)5);
    uassert_equal(nb_calls, (size_t)15);

    // stops when nothing is pending
    FrameScheduler empty;
    uassert_equal(empty.run_until([]() { return false; }), (size_t)0);

    // paced frames
    FrameScheduler paced(std::chrono::milliseconds(2));
    size_t nb_paced = 0;
    std::function<void()> paced_loop = [&]() {
        if (++nb_paced < 5) {
            paced.request_frame(paced_loop);
        }
    };
    auto start = std::chrono::steady_clock::now();
    paced.request_frame(paced_loop);
    uassert_equal(paced.run_until([]() { return false; }), (size_t)5);
    auto elapsed = std::chrono::steady_clock::now() - start;
    uassert(elapsed >= std::chrono::milliseconds(8));
}
