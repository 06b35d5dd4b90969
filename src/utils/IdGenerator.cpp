#include "parley/utils/IdGenerator.hpp"

namespace parley {
namespace utils {

RandomIdGenerator::RandomIdGenerator(const Clock& clock)
    : _clock(clock), _engine(std::random_device{}()) {}

std::string RandomIdGenerator::conversation_id() {
    return make_id("chat", 8);
}

std::string RandomIdGenerator::message_id() {
    return make_id("msg", 9);
}

std::string RandomIdGenerator::make_id(const std::string& prefix, size_t suffix_length) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        _clock.now().time_since_epoch()).count();

    std::string suffix;
    suffix.reserve(suffix_length);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        std::uniform_int_distribution<int> pick(0, 35);
        for (size_t i = 0; i < suffix_length; ++i) {
            suffix.push_back(alphabet[pick(_engine)]);
        }
    }

    return prefix + "_" + std::to_string(millis) + "_" + suffix;
}

} // namespace utils
} // namespace parley
