/**
 * Tests for the camera arbiter.
 * Asserts:
 * - At most one operation holds the camera at a time.
 * - Queued operations run in submission order.
 * - An operation that throws still releases the camera and later ones run.
 * - try_acquire() refuses while the camera is held or waited for.
 *
 * Run from build dir: ./test_camera_arbiter
 */

#include "camera_arbiter.h"
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace optidex;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- try_acquire ---
    {
        CameraArbiter camera;
        ASSERT(!camera.busy());

        auto first = camera.try_acquire();
        ASSERT(first.is_ok());
        ASSERT(camera.busy());

        auto second = camera.try_acquire();
        ASSERT(second.is_error());
        ASSERT(second.error().type == ErrorType::ResourceBusy);

        first.value().release();
        ASSERT(!camera.busy());
        ASSERT(camera.try_acquire().is_ok());   // released again when the temporary dies
        ASSERT(!camera.busy());
    }

    // --- lease moves keep one owner ---
    {
        CameraArbiter camera;
        CameraLease a = camera.acquire();
        ASSERT(a.valid());
        CameraLease b = std::move(a);
        ASSERT(!a.valid());
        ASSERT(b.valid());
        ASSERT(camera.busy());
        b.release();
        ASSERT(!camera.busy());
        b.release();   // second release is a no-op
        ASSERT(!camera.busy());
    }

    // --- FIFO order and mutual exclusion ---
    {
        CameraArbiter camera;
        CameraLease gate = camera.acquire();

        std::mutex order_mutex;
        std::vector<int> order;
        std::atomic<int> inside{0};
        std::atomic<int> max_inside{0};

        std::vector<std::future<int>> results;
        for (int i = 0; i < 5; ++i) {
            results.push_back(camera.run_exclusive([&, i]() {
                int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                {
                    std::lock_guard<std::mutex> lock(order_mutex);
                    order.push_back(i);
                }
                --inside;
                return i * 10;
            }));
        }
        ASSERT(camera.queued() == 5);
        ASSERT(camera.try_acquire().is_error());

        gate.release();
        for (int i = 0; i < 5; ++i) {
            ASSERT(results[i].get() == i * 10);
        }
        ASSERT(max_inside.load() == 1);
        ASSERT(order.size() == 5);
        for (size_t i = 0; i < order.size(); ++i) {
            ASSERT(order[i] == static_cast<int>(i));
        }
    }

    // --- a throwing operation releases the camera ---
    {
        CameraArbiter camera;
        auto bad = camera.run_exclusive([]() -> int {
            throw std::runtime_error("camera unplugged");
        });
        auto good = camera.run_exclusive([]() { return 7; });

        bool threw = false;
        try {
            bad.get();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT(threw);
        ASSERT(good.get() == 7);

        // The detached thread may still be finishing its bookkeeping
        for (int i = 0; i < 100 && camera.busy(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        ASSERT(!camera.busy());
        ASSERT(camera.try_acquire().is_ok());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All camera arbiter tests passed.\n";
    return 0;
}
