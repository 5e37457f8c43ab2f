// File: common/errors.hpp

#ifndef COMMON_ERRORS_HPP
#define COMMON_ERRORS_HPP

#include <stdexcept>

namespace common {

    // Input pixel layout is not one we can reduce to a single 8-bit channel.
    class UnsupportedFormatError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Inconsistent or insufficient arguments (point counts, window sizes, detector settings).
    class ArgumentMismatchError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // A required inverse or normalization does not exist.
    class NumericSingularityError : public std::domain_error {
    public:
        using std::domain_error::domain_error;
    };

} // namespace common

#endif // COMMON_ERRORS_HPP
