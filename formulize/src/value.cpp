#include <formulize/value.hpp>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace formulize {

Value Value::from_numbers(const std::vector<double>& numbers) {
    ElementList list;
    list.reserve(numbers.size());
    for (double n : numbers) {
        list.emplace_back(n);
    }
    return Value(std::move(list));
}

bool Value::is_numeric_list() const {
    if (!is_list()) return false;
    for (const auto& element : list()) {
        if (!std::holds_alternative<double>(element)) return false;
    }
    return true;
}

std::optional<std::vector<double>> Value::numbers() const {
    if (!is_numeric_list()) {
        return std::nullopt;
    }
    std::vector<double> out;
    out.reserve(list().size());
    for (const auto& element : list()) {
        out.push_back(std::get<double>(element));
    }
    return out;
}

bool Value::is_valid_result() const {
    if (is_number()) {
        return std::isfinite(number());
    }
    if (is_list()) {
        for (const auto& element : list()) {
            if (std::holds_alternative<double>(element) && !std::isfinite(std::get<double>(element))) {
                return false;
            }
        }
        return true;
    }
    return false;
}

std::string Value::to_string() const {
    if (is_undefined()) {
        return "undefined";
    }
    if (is_number()) {
        std::ostringstream oss;
        oss << number();
        return oss.str();
    }
    std::string out = "[";
    const auto& elements = list();
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) out += ", ";
        out += element_to_string(elements[i]);
    }
    out += "]";
    return out;
}

bool Value::operator==(const Value& other) const {
    if (is_number() && other.is_number()) {
        // NaN never compares equal, matching IEEE semantics
        return number() == other.number();
    }
    return data == other.data;
}

std::optional<std::size_t> index_of(const ElementList& set, const Value& value) {
    if (value.is_number()) {
        for (std::size_t i = 0; i < set.size(); ++i) {
            if (std::holds_alternative<double>(set[i]) && std::get<double>(set[i]) == value.number()) {
                return i;
            }
        }
    }
    return std::nullopt;
}

double element_to_number(const Element& element) {
    if (std::holds_alternative<double>(element)) {
        return std::get<double>(element);
    }
    const std::string& text = std::get<std::string>(element);
    const char* begin = text.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return parsed;
}

std::string element_to_string(const Element& element) {
    if (std::holds_alternative<std::string>(element)) {
        return "\"" + std::get<std::string>(element) + "\"";
    }
    std::ostringstream oss;
    oss << std::get<double>(element);
    return oss.str();
}

} // namespace formulize
