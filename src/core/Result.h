#ifndef CARVE_RESULT_H
#define CARVE_RESULT_H

#include <expected>
#include <utility>

/**
 * Result<T, E>: success value or error value, built only through okay()
 * and error().
 *
 * Carries failures the caller is expected to inspect: config loading,
 * bitmap parsing, guarded cell transitions and per-ball stepping.
 * Construction errors throw instead (see Errors.h).
 */
template <typename successT, typename failureT>
class Result {
public:
    static Result okay() { return Result(std::expected<successT, failureT>(successT())); }

    static Result okay(successT value)
    {
        return Result(std::expected<successT, failureT>(std::move(value)));
    }

    static Result error(failureT err)
    {
        return Result(std::expected<successT, failureT>(std::unexpect, std::move(err)));
    }

    bool isValue() const { return inner_.has_value(); }
    bool isError() const { return !inner_.has_value(); }

    // Throws std::bad_expected_access when called on an error.
    const successT& value() const& { return inner_.value(); }
    successT value() && { return std::move(inner_).value(); }

    // Not error(): that name is the factory.
    const failureT& errorValue() const& { return inner_.error(); }
    failureT errorValue() && { return std::move(inner_).error(); }

private:
    explicit Result(std::expected<successT, failureT> inner) : inner_(std::move(inner)) {}

    std::expected<successT, failureT> inner_;
};

#endif // CARVE_RESULT_H
