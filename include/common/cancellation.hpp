#pragma once

#include <atomic>

namespace grader {

/**
 * @brief 取消标记
 * 由调度器持有并设置，沙箱在监督循环中轮询。设置后不可撤销。
 */
struct cancellation_token {
    void cancel() noexcept { cancelled.store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept { return cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled{false};
};

}  // namespace grader
