#include "tui/BackgroundWorker.hpp"

#include <utility>

BackgroundWorker::~BackgroundWorker() {
    RequestStop();
    Wait();
}

bool BackgroundWorker::Launch(Task task) {
    if (Busy()) {
        return false;
    }
    // The previous task has returned; reap its thread.
    Wait();

    stop_.store(false, std::memory_order_relaxed);
    busy_.store(true, std::memory_order_release);
    thread_ = std::thread([this, task = std::move(task)]() {
        task(stop_);
        busy_.store(false, std::memory_order_release);
    });
    return true;
}

void BackgroundWorker::Wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
}
