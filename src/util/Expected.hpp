#pragma once

#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace gitminer {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    IoError,
    MalformedHeader,
    InvalidTimestamp,
    MalformedChange,
    AmbiguousBlock,
    InternalError
};

/**
 * @brief Failure description carried by Expected
 *
 * `input` holds the offending raw text (a header or change line) when the
 * failure comes from parsing, so callers can point at the bad record.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::string input;
};

template <typename T>
class Expected {
public:
    using value_type = T;

    Expected(const T& value) : value_(value) {}
    Expected(T&& value) : value_(std::move(value)) {}
    Expected(const Error& err) : error_(err) {}
    Expected(Error&& err) : error_(std::move(err)) {}

    bool has_value() const { return value_.has_value(); }
    explicit operator bool() const { return value_.has_value(); }
    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const Error& error() const { return error_; }

private:
    std::optional<T> value_;
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

/**
 * @brief Turn a sequence of results into one result holding every value
 *
 * Stops at the first failure and returns that error; later results are
 * not inspected.
 */
template <typename T>
Expected<std::vector<T>> collect(std::vector<Expected<T>> results) {
    std::vector<T> values;
    values.reserve(results.size());
    for (auto& r : results) {
        if (!r) return r.error();
        values.push_back(std::move(r.value()));
    }
    return Expected<std::vector<T>>(std::move(values));
}

/**
 * @brief Map a fallible function over a range, short-circuiting
 *
 * Equivalent to building every result and calling collect(), except the
 * function is not applied past the first failing element.
 *
 * Example:
 *   auto changes = traverse(lines, parseChange);  // Expected<std::vector<ChangeRecord>>
 */
template <typename Range, typename Fn>
auto traverse(const Range& inputs, Fn fn)
    -> Expected<std::vector<typename std::decay_t<decltype(fn(*std::begin(inputs)))>::value_type>> {
    using Out = typename std::decay_t<decltype(fn(*std::begin(inputs)))>::value_type;
    std::vector<Out> values;
    for (const auto& in : inputs) {
        auto r = fn(in);
        if (!r) return r.error();
        values.push_back(std::move(r.value()));
    }
    return Expected<std::vector<Out>>(std::move(values));
}

/// Printable name of an error code ("MalformedHeader", ...)
inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgs: return "InvalidArgs";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::MalformedHeader: return "MalformedHeader";
        case ErrorCode::InvalidTimestamp: return "InvalidTimestamp";
        case ErrorCode::MalformedChange: return "MalformedChange";
        case ErrorCode::AmbiguousBlock: return "AmbiguousBlock";
        case ErrorCode::InternalError: return "InternalError";
    }
    return "Unknown";
}

}
