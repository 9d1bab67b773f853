#ifndef RBSET_UTIL_PRINTER_HPP
#define RBSET_UTIL_PRINTER_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "rbset/util/affinity.hpp"
#include "rbset/util/print.hpp"

namespace rbset
{
namespace util
{

// Background printer: worker threads hand over formatted lines, one
// dedicated thread writes them, so output never interleaves mid-line.
// Lines queued before stop() are always written.
class printer final
{
public:
    // core_id < 0 leaves the printer thread unpinned.  A pin request the
    // platform refuses is reported as a warning line through the printer.
    inline explicit printer(int core_id = -1);
    inline ~printer() noexcept;

    template <typename... Args>
    void print(const std::string& message, const Args&... args);

    template <typename... Args>
    void log(level l, const std::string& message, const Args&... args);

    // Drains the queue and joins the thread.  Safe to call repeatedly and
    // from several threads at once; only the first caller joins.  Never
    // joins when called on the printer thread itself.
    inline void stop() noexcept;

    // Whether the printer thread was pinned to the requested core.  Settled
    // once stop() has returned.
    bool pinned() const noexcept { return pinned_.load(std::memory_order_acquire); }

    printer(const printer&)            = delete;
    printer(printer&&)                 = delete;
    printer& operator=(const printer&) = delete;
    printer& operator=(printer&&)      = delete;

private:
    void push(std::string value)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push(std::move(value));
        }
        cv_.notify_one();
    }

    inline void flush();

    std::queue<std::string> queue_;
    std::mutex              queue_mutex_;
    std::condition_variable cv_;
    bool                    running_;
    std::atomic<bool>       pinned_{false};
    std::mutex              join_mutex_;
    std::thread             printer_thread_;
};

printer::printer(int core_id)
    : running_(true)
{
    this->printer_thread_ = std::thread([this, core_id]
    {
        if (core_id >= 0)
        {
            if (use_core(core_id))
                this->pinned_.store(true, std::memory_order_release);
            else
                this->log(level::warning, "printer: could not pin to core {}", core_id);
        }
        this->flush();
    });
}

printer::~printer() noexcept
{
    this->stop();
}

void printer::stop() noexcept
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        this->running_ = false;
    }
    cv_.notify_one();

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (this->printer_thread_.joinable() &&
        this->printer_thread_.get_id() != std::this_thread::get_id())
    {
        this->printer_thread_.join();
    }
}

template <typename... Args>
void printer::print(const std::string& message, const Args&... args)
{
    this->push(detail::format(message, args...));
}

template <typename... Args>
void printer::log(level l, const std::string& message, const Args&... args)
{
    if (!log_enabled(l)) return;
    this->push("[" + std::string(to_string(l)) + "] " + detail::format(message, args...));
}

void printer::flush()
{
    std::unique_lock<std::mutex> lock(this->queue_mutex_);
    for (;;)
    {
        cv_.wait(lock, [this] { return !queue_.empty() || !this->running_; });

        while (!this->queue_.empty())
        {
            std::string content = std::move(this->queue_.front());
            this->queue_.pop();

            lock.unlock();
            std::cout << content << '\n';
            lock.lock();
        }

        if (!this->running_) break;
    }
    std::cout.flush();
}

}  // namespace util
}  // namespace rbset

#endif  // RBSET_UTIL_PRINTER_HPP
