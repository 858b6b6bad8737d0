#pragma once

#include "Assert.h"

#include <utility>
#include <variant>

namespace AgentEvo {

/**
 * Value-or-error return type for operations that can fail in expected ways.
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& s);
 *   auto result = parse("42");
 *   if (result.isError()) { log(result.errorValue()); }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    const T& value() const
    {
        AGENTEVO_ASSERT(isValue(), "Result::value() called on an error result");
        return std::get<0>(data_);
    }

    T& value()
    {
        AGENTEVO_ASSERT(isValue(), "Result::value() called on an error result");
        return std::get<0>(data_);
    }

    const E& errorValue() const
    {
        AGENTEVO_ASSERT(isError(), "Result::errorValue() called on a value result");
        return std::get<1>(data_);
    }

private:
    template <size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace AgentEvo
