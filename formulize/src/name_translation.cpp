#include <formulize/name_translation.hpp>
#include <formulize/expression_parser.hpp>
#include <formulize/log.hpp>
#include <algorithm>
#include <cctype>
#include <set>

namespace formulize {

namespace {

bool is_safe_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

NameTranslator::NameTranslator(const std::vector<std::string>& names) {
    std::set<std::string> sorted(names.begin(), names.end());

    // Already-safe names claim their own spelling first
    for (const auto& name : sorted) {
        if (sanitize(name) == name) {
            assign(name, name);
        }
    }
    for (const auto& name : sorted) {
        if (forward_.count(name) == 0) {
            assign(name, sanitize(name));
        }
    }
}

std::string NameTranslator::sanitize(std::string_view name) {
    std::string translated;
    translated.reserve(name.size() + 4);
    for (char c : name) {
        translated.push_back(is_safe_char(c) ? c : '_');
    }

    if (translated.empty() || std::isdigit(static_cast<unsigned char>(translated[0]))) {
        translated.insert(translated.begin(), '_');
    }

    if (is_reserved_word(to_lower(translated))) {
        translated = "var_" + translated;
    }
    return translated;
}

void NameTranslator::assign(const std::string& original, const std::string& base) {
    std::string candidate = base;
    for (int suffix = 2; reverse_.count(candidate) > 0; ++suffix) {
        candidate = base + "_" + std::to_string(suffix);
    }
    if (candidate != base) {
        FORMULIZE_LOG_DEBUG("Name '%s' collides after sanitizing, using '%s'", original.c_str(), candidate.c_str());
    }
    forward_.emplace(original, candidate);
    reverse_.emplace(candidate, original);
}

std::string NameTranslator::to_safe(const std::string& original) const {
    auto it = forward_.find(original);
    if (it != forward_.end()) {
        return it->second;
    }
    return sanitize(original);
}

std::optional<std::string> NameTranslator::to_original(const std::string& safe) const {
    auto it = reverse_.find(safe);
    if (it == reverse_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string NameTranslator::preprocess(std::string_view expression) const {
    std::string out;
    out.reserve(expression.size());

    std::size_t i = 0;
    while (i < expression.size()) {
        if (expression[i] == '{') {
            std::size_t close = expression.find('}', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                std::string name(expression.substr(i + 1, close - i - 1));
                out += to_safe(name);
                i = close + 1;
                continue;
            }
        }
        out.push_back(expression[i]);
        ++i;
    }
    return out;
}

std::vector<std::string> extract_variable_names(std::string_view expression) {
    std::vector<std::string> names;
    std::size_t i = 0;
    while ((i = expression.find('{', i)) != std::string_view::npos) {
        std::size_t close = expression.find('}', i + 1);
        if (close == std::string_view::npos) {
            break;
        }
        if (close > i + 1) {
            names.emplace_back(expression.substr(i + 1, close - i - 1));
        }
        i = close + 1;
    }
    return names;
}

} // namespace formulize
