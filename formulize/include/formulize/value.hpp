#ifndef FORMULIZE_VALUE_HPP
#define FORMULIZE_VALUE_HPP

#include <variant>
#include <vector>
#include <string>
#include <unordered_map>
#include <optional>
#include <type_traits>
#include <cstddef>

namespace formulize {

// A single member of a set-valued variable
using Element = std::variant<double, std::string>;
using ElementList = std::vector<Element>;

/**
 * Variable value: undefined, a scalar, or an ordered list of numbers/strings.
 * Numeric lists double as vectors in expression evaluation.
 */
struct Value {
    std::variant<
        std::monostate,     // Undefined
        double,             // Scalar
        ElementList         // Set / vector
    > data;

    Value() : data(std::monostate{}) {}
    Value(double number) : data(number) {}
    Value(int number) : data(static_cast<double>(number)) {}
    Value(ElementList list) : data(std::move(list)) {}

    static Value from_numbers(const std::vector<double>& numbers);

    bool is_undefined() const { return std::holds_alternative<std::monostate>(data); }
    bool is_number() const { return std::holds_alternative<double>(data); }
    bool is_list() const { return std::holds_alternative<ElementList>(data); }

    double number() const { return std::get<double>(data); }
    const ElementList& list() const { return std::get<ElementList>(data); }
    ElementList& list() { return std::get<ElementList>(data); }

    // True for a list whose elements are all numbers
    bool is_numeric_list() const;

    // Numeric view of a list; nullopt if any element is a string
    std::optional<std::vector<double>> numbers() const;

    // Finite scalar, or list whose numeric elements are all finite
    bool is_valid_result() const;

    std::string to_string() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
};

using ValueMap = std::unordered_map<std::string, Value>;

// Index of element inside a set (strict equality, no numeric/string coercion)
std::optional<std::size_t> index_of(const ElementList& set, const Value& value);

// Scalar value for a set element; strings are parsed by numeric prefix (NaN otherwise)
double element_to_number(const Element& element);

std::string element_to_string(const Element& element);

} // namespace formulize

#endif // FORMULIZE_VALUE_HPP
