#ifndef BIKECALC_VALIDATION_RECORD_VALIDATOR_HPP
#define BIKECALC_VALIDATION_RECORD_VALIDATOR_HPP

#include <bicycle/bicycle.hpp>
#include <bicycle/wheel.hpp>
#include <string>
#include <vector>

namespace bikecalc {

// Attributes a calculation needs but the record leaves unset or empty.
// Values that are set but physically impossible are left to the
// calculation itself, which raises DomainError.
class ValidationResult {
public:
    void error(const std::string& message) { errors_.push_back(message); }

    const std::vector<std::string>& errors() const { return errors_; }
    bool has_errors() const { return !errors_.empty(); }
    bool ok() const { return errors_.empty(); }

private:
    std::vector<std::string> errors_;
};

// Throws InvalidInput listing every problem, prefixed by context
// (normally the record's name)
void require_valid(const ValidationResult& result, const std::string& context);

// "Bicycle 'name'" or "Nameless bicycle", for messages
std::string record_label(const Bicycle& bicycle);
std::string record_label(const Wheel& wheel);

// One check per calculation, naming the attributes it needs
ValidationResult check_cogs(const Bicycle& bicycle);      // derailer capacity, gear ratios, skid patches
ValidationResult check_gain(const Bicycle& bicycle);      // gain ratios, speed and cadence
ValidationResult check_steering(const Bicycle& bicycle);  // trail
ValidationResult check_spokes(const Wheel& wheel);        // spoke lengths
ValidationResult check_tire(const Wheel& wheel);          // approximate diameter

}  // namespace bikecalc

#endif // BIKECALC_VALIDATION_RECORD_VALIDATOR_HPP
