#ifndef BIKECALC_COMMON_ERRORS_HPP
#define BIKECALC_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace bikecalc {

// A required measurement is missing or empty (e.g. an empty cog list,
// a wheel without a diameter). Raised before any arithmetic happens.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& message)
        : std::invalid_argument(message) {}
};

// The measurements are present but the formula is undefined for them
// (head tube angle of 180 degrees, zero crank length, a spoke triangle
// that cannot close). Raised where the invalid operation would occur.
class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& message)
        : std::domain_error(message) {}
};

}  // namespace bikecalc

#endif // BIKECALC_COMMON_ERRORS_HPP
