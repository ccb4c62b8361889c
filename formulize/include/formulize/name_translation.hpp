#ifndef FORMULIZE_NAME_TRANSLATION_HPP
#define FORMULIZE_NAME_TRANSLATION_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formulize {

/**
 * Bidirectional map between registry variable ids and tokens the expression
 * parser accepts as identifiers.
 *
 * Sanitizing replaces every character outside [A-Za-z0-9_$] with '_', prefixes
 * '_' when the result does not start with a letter, '_' or '$', and prefixes
 * "var_" when the result is a reserved word of the math grammar.
 *
 * The map depends only on the name set: ids that are already safe keep their
 * spelling, the remaining ids are assigned in sorted order and a sanitized
 * form that is already taken gets a numeric suffix ("a_b", "a_b_2", ...).
 */
class NameTranslator {
public:
    NameTranslator() = default;
    explicit NameTranslator(const std::vector<std::string>& names);

    // Stateless sanitizing of a single name
    static std::string sanitize(std::string_view name);

    // Safe token for a registered id; unregistered ids are sanitized on the fly
    std::string to_safe(const std::string& original) const;

    // Original id for a safe token, nullopt when the token was never issued
    std::optional<std::string> to_original(const std::string& safe) const;

    bool contains(const std::string& original) const { return forward_.count(original) > 0; }

    /**
     * Rewrite brace-delimited references: "{x.1} + 2" becomes "x_1 + 2".
     * Text outside braces is left untouched.
     */
    std::string preprocess(std::string_view expression) const;

    const std::map<std::string, std::string>& mapping() const { return forward_; }

private:
    std::map<std::string, std::string> forward_;
    std::map<std::string, std::string> reverse_;

    void assign(const std::string& original, const std::string& base);
};

// Names referenced as {name} in an expression, in order of appearance
std::vector<std::string> extract_variable_names(std::string_view expression);

} // namespace formulize

#endif // FORMULIZE_NAME_TRANSLATION_HPP
