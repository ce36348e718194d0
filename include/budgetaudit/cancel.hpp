// ==============================================================================
// budgetaudit/cancel.hpp - Токен отмены задания
// ==============================================================================
//
// Назначение:
// - Общий флаг отмены для детекторов, клиента AI и HTTP-вызовов
// - wait_for: прерываемое ожидание (пробы здоровья, паузы между попытками)
//
// Копии токена разделяют одно состояние.
//
// ==============================================================================

#ifndef BUDGETAUDIT_CANCEL_HPP
#define BUDGETAUDIT_CANCEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace budgetaudit::cancel {

class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    /// Установить флаг и разбудить ожидающих
    void cancel() const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->flag.store(true);
        }
        state_->cv.notify_all();
    }

    bool cancelled() const { return state_->flag.load(); }

    /// Ждать до timeout или отмены; true если отменён
    bool wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->flag.load(); });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> flag{false};
    };

    std::shared_ptr<State> state_;
};

}  // namespace budgetaudit::cancel

#endif  // BUDGETAUDIT_CANCEL_HPP
