#pragma once
#include <cstdint>
#include <string>

namespace engram {

// The language model behind the runner. Implementations live outside this
// library; tests provide a mock.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    // Send a fully assembled prompt and return the response text.
    // timeout_ms of 0 means no deadline. Throw on any failure.
    virtual std::string invoke(const std::string& prompt, uint32_t timeout_ms) = 0;

    virtual std::string client_name() const = 0;
};

} // namespace engram
