#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace retext {

//=============================================================================
// Error - message with an optional cause chain
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    const std::shared_ptr<Error>& cause() const { return _cause; }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (auto c = _cause; c; c = c->_cause) {
            out += ": ";
            out += c->_message;
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return std::unexpected(Error(message));
}

// Chain a previous failure as the cause
template<typename T = void, typename U>
Result<T> Err(const std::string& message, const Result<U>& previous) {
    if (previous) return std::unexpected(Error(message));
    return std::unexpected(Error(message, previous.error()));
}

template<typename T>
std::string error_msg(const Result<T>& res) {
    if (res) return {};
    return res.error().to_string();
}

} // namespace retext
