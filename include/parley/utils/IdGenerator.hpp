#ifndef PARLEY_UTILS_ID_GENERATOR_HPP
#define PARLEY_UTILS_ID_GENERATOR_HPP

#include <string>
#include <mutex>
#include <random>

#include "parley/utils/Clock.hpp"

namespace parley {
namespace utils {

class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    virtual std::string conversation_id() = 0;
    virtual std::string message_id() = 0;
};

/**
 * @brief Ids of the form <prefix>_<epoch millis>_<base36 suffix>
 *
 * Conversation ids carry an 8 character suffix, message ids 9.
 */
class RandomIdGenerator : public IdGenerator {
public:
    explicit RandomIdGenerator(const Clock& clock);

    std::string conversation_id() override;
    std::string message_id() override;

private:
    std::string make_id(const std::string& prefix, size_t suffix_length);

    const Clock& _clock;
    std::mutex _mutex;
    std::mt19937_64 _engine;
};

} // namespace utils
} // namespace parley

#endif // PARLEY_UTILS_ID_GENERATOR_HPP
