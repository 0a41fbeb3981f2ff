#ifndef TUI_BACKGROUNDWORKER_HPP
#define TUI_BACKGROUNDWORKER_HPP

#include <atomic>
#include <functional>
#include <thread>

// Runs one task at a time off the UI thread. Stopping is cooperative: the task
// polls the flag it is handed and the UI never waits for it.
class BackgroundWorker {
public:
    using Task = std::function<void(const std::atomic<bool>& stop)>;

    BackgroundWorker() = default;
    // Requests a stop and waits for the task.
    ~BackgroundWorker();

    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    // Returns false while a previous task is still running.
    bool Launch(Task task);
    void RequestStop() { stop_.store(true, std::memory_order_relaxed); }
    bool Busy() const { return busy_.load(std::memory_order_acquire); }
    // Blocks until the current task returns.
    void Wait();

private:
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> busy_{false};
};

#endif // TUI_BACKGROUNDWORKER_HPP
