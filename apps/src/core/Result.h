#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace NixBlitz {

/**
 * @brief Holds either a value or an error.
 *
 * Usage:
 *   auto r = Result<int, std::string>::okay(42);
 *   if (r.isError()) { ... r.errorValue() ... }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    Result() : data_(std::in_place_index<0>) {}

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& errorValue() { return std::get<1>(data_); }
    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg) : data_(index, std::forward<Arg>(arg))
    {}

    std::variant<T, E> data_;
};

} // namespace NixBlitz
