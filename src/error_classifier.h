#pragma once

#include <exception>
#include <string>

namespace chatgate {

struct ClassifiedError {
    int status_code;
    std::string message;
    std::string code;
};

/**
 * @brief Maps a failure to the status, message and error code shown to the client.
 *
 * | failure             | status | message                                         |
 * |---------------------|--------|-------------------------------------------------|
 * | ValidationError     | 400    | the validation message                          |
 * | TransportError      | 502    | "Error connecting to backend server: <detail>"  |
 * | anything else       | 500    | "Proxy error: <detail>"                         |
 *
 * The most derived exception type decides. Call from inside a catch block with
 * std::current_exception().
 */
auto ClassifyError(const std::exception_ptr& error) -> ClassifiedError;

} // namespace chatgate
