#include "../include/single_flight.hpp"
#include <exception>

FlightResult SingleFlight::run(const std::string& key, const std::function<std::string()>& fn) {
    std::promise<std::string> promise;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        auto it = calls_.find(key);
        if (it != calls_.end()) {
            std::shared_future<std::string> pending = it->second;
            lock.unlock();
            return FlightResult{pending.get(), true};
        }
        calls_.emplace(key, promise.get_future().share());
    }

    std::exception_ptr failure;
    std::string value;
    try {
        value = fn();
    } catch (...) {
        failure = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.erase(key);
    }
    if (failure) {
        promise.set_exception(failure);
        std::rethrow_exception(failure);
    }
    promise.set_value(value);
    return FlightResult{std::move(value), false};
}

std::size_t SingleFlight::in_flight() {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_.size();
}
