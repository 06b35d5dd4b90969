#ifndef PARLEY_TESTS_TEST_SUPPORT_HPP
#define PARLEY_TESTS_TEST_SUPPORT_HPP

#include <atomic>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

#include "parley/services/Responder.hpp"
#include "parley/utils/Clock.hpp"
#include "parley/utils/IdGenerator.hpp"

namespace parley {
namespace fakes {

class ManualClock : public utils::Clock {
public:
    explicit ManualClock(std::chrono::system_clock::time_point start = std::chrono::system_clock::from_time_t(1781697600))
        : _now(start) {}

    std::chrono::system_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _now;
    }

    void set(std::chrono::system_clock::time_point value) {
        std::lock_guard<std::mutex> lock(_mutex);
        _now = value;
    }

    template <typename Duration>
    void advance(Duration by) {
        std::lock_guard<std::mutex> lock(_mutex);
        _now += std::chrono::duration_cast<std::chrono::system_clock::duration>(by);
    }

private:
    mutable std::mutex _mutex;
    std::chrono::system_clock::time_point _now;
};

// chat-1, chat-2, ... and msg-1, msg-2, ...
class SequentialIdGenerator : public utils::IdGenerator {
public:
    std::string conversation_id() override {
        return "chat-" + std::to_string(++_conversations);
    }

    std::string message_id() override {
        return "msg-" + std::to_string(++_messages);
    }

private:
    std::atomic<int> _conversations{0};
    std::atomic<int> _messages{0};
};

class FakeResponder : public services::Responder {
public:
    services::ResponderReply respond(const services::ResponderRequest& request) override {
        std::lock_guard<std::mutex> lock(_mutex);
        requests.push_back(request);
        if (fail) {
            throw services::ResponderError("responder unavailable");
        }
        services::ResponderReply reply;
        reply.message = next_reply.empty() ? "Reply to: " + request.message : next_reply;
        reply.type = "guidance";
        reply.data = {{"step", static_cast<int>(requests.size())}};
        return reply;
    }

    bool fail = false;
    std::string next_reply;
    std::vector<services::ResponderRequest> requests;

private:
    std::mutex _mutex;
};

// Local noon on the given date, so short offsets stay inside one calendar day.
inline std::chrono::system_clock::time_point local_noon(int year, int month, int day) {
    std::tm local{};
    local.tm_year = year - 1900;
    local.tm_mon = month - 1;
    local.tm_mday = day;
    local.tm_hour = 12;
    local.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

} // namespace fakes
} // namespace parley

#endif // PARLEY_TESTS_TEST_SUPPORT_HPP
