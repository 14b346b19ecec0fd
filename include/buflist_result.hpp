#pragma once
#include <variant>
#include <utility>
#include <stdexcept>

namespace buflist {

using Empty = std::monostate;

// Either a value or an error. Used for failures the caller is expected to
// handle (bad seek targets, short reads). Misuse of the API throws instead.
template<typename T, typename E>
class Result {
public:
    Result(const T& value) : _data(std::in_place_index<0>, value) {}
    Result(T&& value) : _data(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : _data(std::in_place_index<1>, error) {}

    bool is_ok() const { return _data.index() == 0; }
    bool is_err() const { return _data.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& unwrap() {
        if (!is_ok()) throw std::runtime_error("Called unwrap on an error Result");
        return std::get<0>(_data);
    }

    const T& unwrap() const {
        if (!is_ok()) throw std::runtime_error("Called unwrap on an error Result");
        return std::get<0>(_data);
    }

    E& unwrap_err() {
        if (!is_err()) throw std::runtime_error("Called unwrap_err on an ok Result");
        return std::get<1>(_data);
    }

    const E& unwrap_err() const {
        if (!is_err()) throw std::runtime_error("Called unwrap_err on an ok Result");
        return std::get<1>(_data);
    }

    T unwrap_or(T fallback) const {
        return is_ok() ? std::get<0>(_data) : fallback;
    }

private:
    std::variant<T, E> _data;
};

} // namespace buflist
