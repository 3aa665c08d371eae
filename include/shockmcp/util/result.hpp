#pragma once
#include <string>
#include <utility>
#include <variant>

namespace shockmcp::util
{

/// Validation failure carried by value instead of thrown.
struct InvalidArgument
{
    std::string message;
};

/// Either a value of T or an InvalidArgument.
///
/// Returned by the validation/translation layer so callers branch on the outcome
/// explicitly:
/// ```cpp
/// auto r = translator.translate(tool, targets);
/// if (!r)
///     return fail(r.error());
/// use(r.value());
/// ```
template <typename T>
class Result
{
  public:
    static Result success(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result failure(std::string message)
    {
        return Result(std::in_place_index<1>, InvalidArgument{std::move(message)});
    }

    bool has_value() const
    {
        return state_.index() == 0;
    }
    explicit operator bool() const
    {
        return has_value();
    }

    const T& value() const
    {
        return std::get<0>(state_);
    }
    T& value()
    {
        return std::get<0>(state_);
    }
    const std::string& error() const
    {
        return std::get<1>(state_).message;
    }

  private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : state_(tag, std::forward<U>(v))
    {
    }

    std::variant<T, InvalidArgument> state_;
};

} // namespace shockmcp::util
