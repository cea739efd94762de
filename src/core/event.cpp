#include <duet/core/event.hpp>
#include <duet/core/logger.hpp>

namespace duet::core {

namespace {

struct TimerRequest {
    uv_timer_t timer;
    EventLoop::Task task;
};

void closeAndDeleteTimer(uv_handle_t* handle) {
    delete static_cast<TimerRequest*>(handle->data);
}

} // namespace

EventLoop::EventLoop() {
    int result = uv_loop_init(&loop_);
    if (result != 0) {
        throw_error(ErrorCode::Unknown,
            std::string("Failed to initialize event loop: ") + uv_strerror(result));
    }

    uv_async_init(&loop_, &wakeup_, &EventLoop::onWakeup);
    wakeup_.data = this;
}

EventLoop::~EventLoop() {
    // Tutup semua handle yang tersisa lalu biarkan close callback berjalan
    uv_walk(&loop_, [](uv_handle_t* handle, void*) {
        if (!uv_is_closing(handle)) {
            if (handle->type == UV_TIMER) {
                uv_close(handle, closeAndDeleteTimer);
            }
            else {
                uv_close(handle, nullptr);
            }
        }
    }, nullptr);
    uv_run(&loop_, UV_RUN_DEFAULT);

    int result = uv_loop_close(&loop_);
    if (result != 0) {
        Logger::warn("Event loop closed with pending handles: {}", uv_strerror(result));
    }
}

void EventLoop::run() {
    running_ = true;
    stop_requested_ = false;

    // Task yang di-post sebelum run() juga harus dieksekusi
    uv_async_send(&wakeup_);
    uv_run(&loop_, UV_RUN_DEFAULT);

    running_ = false;
}

void EventLoop::stop() {
    stop_requested_ = true;
    uv_async_send(&wakeup_);
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    uv_async_send(&wakeup_);
}

void EventLoop::runAfter(std::chrono::milliseconds delay, Task task) {
    auto* request = new TimerRequest{};
    request->task = std::move(task);
    request->timer.data = request;

    uv_timer_init(&loop_, &request->timer);
    uv_timer_start(&request->timer, [](uv_timer_t* timer) {
        auto* request = static_cast<TimerRequest*>(timer->data);
        auto task = std::move(request->task);
        uv_close(reinterpret_cast<uv_handle_t*>(timer), closeAndDeleteTimer);
        if (task) {
            task();
        }
    }, static_cast<uint64_t>(delay.count()), 0);
}

bool EventLoop::processOne() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) {
            return false;
        }
        task = std::move(tasks_.front());
        tasks_.pop();
    }

    try {
        task();
    }
    catch (const std::exception& e) {
        Logger::error("Error processing event: {}", e.what());
    }

    return true;
}

void EventLoop::processAll() {
    while (processOne()) {}
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void EventLoop::onWakeup(uv_async_t* handle) {
    auto* self = static_cast<EventLoop*>(handle->data);
    self->processAll();

    if (self->stop_requested_) {
        uv_stop(&self->loop_);
    }
}

} // namespace duet::core
