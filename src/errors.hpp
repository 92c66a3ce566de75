#pragma once

#include <stdexcept>
#include <string>

namespace osu_rankings {

/// Base class for every failure to turn a response body into a typed value.
/// Type errors raised by nlohmann::json itself are forwarded unchanged and
/// do not derive from this class.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A required key is absent from a JSON object.
class MissingFieldError : public DecodeError {
public:
    explicit MissingFieldError(const std::string& field)
        : DecodeError("missing field `" + field + "`")
        , mField(field) {}

    const std::string& field() const { return mField; }

private:
    std::string mField;
};

/// A value is present but of a JSON kind the decoder does not accept.
class TypeMismatchError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

/// The API answered with a non-success HTTP status.
class ApiError : public std::runtime_error {
public:
    ApiError(unsigned int status, const std::string& body)
        : std::runtime_error("API returned HTTP " + std::to_string(status)
                             + ": " + body)
        , mStatus(status) {}

    unsigned int status() const { return mStatus; }

private:
    unsigned int mStatus;
};

} // namespace osu_rankings
