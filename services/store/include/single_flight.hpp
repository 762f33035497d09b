#pragma once
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

struct FlightResult {
    std::string value;
    bool shared{false}; // true when another caller's computation was reused
};

// At most one computation per key in flight; concurrent callers for the same
// key wait for it and receive its result (or its exception).
class SingleFlight {
public:
    FlightResult run(const std::string& key, const std::function<std::string()>& fn);
    std::size_t in_flight();

private:
    std::mutex mtx_;
    std::unordered_map<std::string, std::shared_future<std::string>> calls_;
};
