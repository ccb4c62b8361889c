#include <formulize/external_function_adapter.hpp>
#include <formulize/errors.hpp>
#include <formulize/log.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace formulize {

const char* const GENERATION_SYSTEM_INSTRUCTION =
    "You generate JavaScript that evaluates mathematical formulas. "
    "Reply with a single function named evaluate that takes one object parameter "
    "holding the input values and returns an object with one entry per computed variable. "
    "Reply with the function only, without explanation or markdown.";

namespace {

std::string join(const std::vector<std::string>& items, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += items[i];
    }
    return out;
}

std::string trim(std::string_view text) {
    const char* whitespace = " \t\r\n";
    std::size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return "";
    }
    std::size_t end = text.find_last_not_of(whitespace);
    return std::string(text.substr(begin, end - begin + 1));
}

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

// "name:" or "'name':" as an object key, name matched without case
bool has_key_binding(const std::string& text, const std::string& name) {
    if (name.empty()) {
        return false;
    }
    auto same_letter = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    };

    for (auto it = text.begin();; ++it) {
        it = std::search(it, text.end(), name.begin(), name.end(), same_letter);
        if (it == text.end()) {
            return false;
        }
        std::size_t start = static_cast<std::size_t>(it - text.begin());
        if (start > 0 && is_key_char(text[start - 1])) {
            continue;
        }
        std::size_t after = start + name.size();
        if (after < text.size() && is_quote(text[after])) {
            ++after;
        }
        after = text.find_first_not_of(" \t\r\n\f\v", after);
        if (after != std::string::npos && text[after] == ':') {
            return true;
        }
    }
}

} // namespace

GenerationRequest build_generation_request(const std::string& formula_text,
                                           const std::vector<std::string>& input_names,
                                           const std::vector<std::string>& target_names) {
    if (trim(formula_text).empty()) {
        throw ConfigurationError("cannot generate a function from an empty formula");
    }
    if (target_names.empty()) {
        throw ConfigurationError("cannot generate a function without computed variables");
    }

    GenerationRequest request;
    request.formula_text = formula_text;
    request.input_variable_names = input_names;
    request.target_variable_names = target_names;
    request.system_instruction = GENERATION_SYSTEM_INSTRUCTION;
    request.prompt = build_generation_prompt(formula_text, input_names, target_names);
    return request;
}

std::string build_generation_prompt(const std::string& formula_text,
                                    const std::vector<std::string>& input_names,
                                    const std::vector<std::string>& target_names) {
    std::ostringstream prompt;
    prompt << "Write a JavaScript function that evaluates this formula: " << formula_text << "\n"
           << "Input variables: " << join(input_names, ", ") << "\n"
           << "Computed variables: " << join(target_names, ", ") << "\n"
           << "\n"
           << "Rules:\n"
           << "1. The function is named evaluate\n"
           << "2. It takes one parameter named variables holding the input values as numbers\n"
           << "3. It reads only the listed input variables\n"
           << "4. It returns an object keyed by the computed variable names\n"
           << "5. It guards against division by zero and invalid operations\n"
           << "6. It uses only arithmetic, comparisons and Math functions\n"
           << "\n"
           << "Shape of the answer (not this formula):\n"
           << "function evaluate(variables) {\n"
           << "  try {\n"
           << "    return { result: variables.a * variables.b };\n"
           << "  } catch (error) {\n"
           << "    return { result: NaN };\n"
           << "  }\n"
           << "}";
    return prompt.str();
}

std::string strip_code_fences(std::string_view text) {
    std::size_t open = text.find("```");
    if (open == std::string_view::npos) {
        return trim(text);
    }

    // Skip the language tag on the opening fence line
    std::size_t body = text.find('\n', open);
    if (body == std::string_view::npos) {
        return "";
    }
    ++body;

    std::size_t close = text.find("```", body);
    if (close == std::string_view::npos) {
        close = text.size();
    }
    return trim(text.substr(body, close - body));
}

std::optional<std::string> formula_head(std::string_view formula_text) {
    static const std::regex head(R"(^\s*\{?([A-Za-z])\}?\s*=(?!=))");
    std::string text(formula_text);
    std::smatch match;
    if (std::regex_search(text, match, head)) {
        return match[1].str();
    }
    return std::nullopt;
}

GeneratedFunction validate_generated(const GenerationRequest& request, const GenerationResponse& response) {
    std::string text = strip_code_fences(response.generated_function_text);

    if (find_evaluate_function(text) == std::string::npos) {
        throw GeneratedCodeInvalid("response does not contain a function named evaluate");
    }

    std::vector<std::string> missing;
    for (const auto& target : request.target_variable_names) {
        if (!has_key_binding(text, target)) {
            missing.push_back(target);
        }
    }
    if (!missing.empty()) {
        auto head = formula_head(request.formula_text);
        if (!head || !has_key_binding(text, *head)) {
            throw GeneratedCodeInvalid("response is missing computed variables: " + join(missing, ", "));
        }
    }

    GeneratedFunction function = GeneratedFunction::parse(text);

    for (const auto& input : request.input_variable_names) {
        if (function.referenced_inputs().count(input) == 0) {
            FORMULIZE_LOG_WARN("Generated code does not use input variable '%s'", input.c_str());
        }
    }
    return function;
}

} // namespace formulize
