#ifndef ECAGENT_SCALAR_HPP
#define ECAGENT_SCALAR_HPP

#include <string>
#include <variant>

namespace ecagent {

// Scalar value appearing in conditions and project metadata.
// Integers are carried as double; construct string scalars from std::string,
// a bare string literal would select the bool alternative.
using Scalar = std::variant<bool, double, std::string>;

inline bool is_numeric(const Scalar& value) {
    return std::holds_alternative<double>(value);
}

// Structural equality: alternatives of different kinds never compare equal
inline bool scalar_equals(const Scalar& a, const Scalar& b) {
    return a == b;
}

// String form used by the contains operator and by report output
std::string scalar_to_string(const Scalar& value);

} // namespace ecagent

#endif // ECAGENT_SCALAR_HPP
