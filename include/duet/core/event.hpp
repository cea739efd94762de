#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <chrono>
#include <atomic>

#include <uv.h>

#include <duet/core/error.hpp>

namespace duet::core {

// Event loop single-threaded berbasis libuv.
// post() dan stop() aman dipanggil dari thread lain; semua task dijalankan
// di thread yang memanggil run().
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // Non-copyable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Jalankan loop sampai stop() dipanggil
    void run();
    void stop();

    // Post task ke queue
    void post(Task task);

    // Jalankan task sekali setelah delay. Hanya dari thread loop.
    void runAfter(std::chrono::milliseconds delay, Task task);

    // Process single task
    bool processOne();

    // Process all pending tasks
    void processAll();

    bool isRunning() const noexcept { return running_; }

    std::size_t queueSize() const;

    uv_loop_t* handle() noexcept { return &loop_; }

private:
    static void onWakeup(uv_async_t* handle);

    uv_loop_t loop_;
    uv_async_t wakeup_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace duet::core
