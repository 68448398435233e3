//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/support/result.hpp
// Purpose: Expected-like result types used to report backend, configuration,
//          and transport failures without exceptions.
// Key invariants: A Result holds exactly one of a value or an Error; a Status
//                 is either ok or carries an Error.
// Ownership/Lifetime: Result owns its contained value or error.
// Links: include/tvkit/term/backend.hpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tvkit::support
{

/// @brief Failure categories surfaced by tvkit APIs.
enum class Errc
{
    Io,           ///< Generic read/write/ioctl failure.
    BrokenPipe,   ///< Remote channel or sink disconnected.
    TerminalInit, ///< Terminal could not be put into raw mode.
    InvalidInput, ///< Caller supplied an unusable argument.
    Parse,        ///< Configuration text could not be parsed.
};

/// @brief Human readable name of an error category.
const char *errcName(Errc code) noexcept;

/// @brief Error value carried by failed Result and Status objects.
struct Error
{
    Errc code{Errc::Io};
    std::string message;

    /// @brief Format as "<category>: <message>".
    std::string toString() const;
};

/// @brief Build an Error from the current errno value.
/// @param code Category to report.
/// @param what Operation that failed, prefixed to the strerror text.
Error errnoError(Errc code, const std::string &what);

/// @brief Tag type used to construct successful Result values explicitly.
struct SuccessTag
{
    constexpr SuccessTag() = default;
};

inline constexpr SuccessTag kSuccessTag{};

/// @brief Minimal expected-like container.
/// @invariant Either holds a value or an error.
template <typename T> class Result
{
  public:
    template <typename U = T>
    Result(SuccessTag /*tag*/, U &&value) : value_(std::in_place, std::forward<U>(value))
    {
    }

    template <typename U = T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                          !std::is_same_v<std::decay_t<U>, Error>>>
    Result(U &&value) : Result(kSuccessTag, std::forward<U>(value))
    {
    }

    Result(Error err) : error_(std::move(err)) {}

    template <typename U = T> static Result success(U &&value)
    {
        return Result(kSuccessTag, std::forward<U>(value));
    }

    static Result error(Errc code, std::string message)
    {
        return Result(Error{code, std::move(message)});
    }

    /// @brief Indicates whether the Result currently holds a value.
    [[nodiscard]] bool isOk() const
    {
        return value_.has_value();
    }

    /// @pre @c isOk() must return true.
    T &value()
    {
        return *value_;
    }

    /// @pre @c isOk() must return true.
    const T &value() const
    {
        return *value_;
    }

    /// @pre @c isOk() must return false.
    const Error &error() const
    {
        return error_;
    }

  private:
    std::optional<T> value_;
    Error error_;
};

/// @brief Outcome of an operation that produces no value.
class Status
{
  public:
    Status() = default;

    Status(Error err) : error_(std::move(err)) {}

    static Status ok()
    {
        return Status();
    }

    static Status error(Errc code, std::string message)
    {
        return Status(Error{code, std::move(message)});
    }

    [[nodiscard]] bool isOk() const
    {
        return !error_.has_value();
    }

    /// @pre @c isOk() must return false.
    const Error &error() const
    {
        return *error_;
    }

  private:
    std::optional<Error> error_;
};

} // namespace tvkit::support
