#ifndef FORMULIZE_EXTERNAL_FUNCTION_ADAPTER_HPP
#define FORMULIZE_EXTERNAL_FUNCTION_ADAPTER_HPP

#include <formulize/generated_function.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formulize {

struct GenerationRequest {
    std::string formula_text;
    std::vector<std::string> input_variable_names;
    std::vector<std::string> target_variable_names;

    std::string system_instruction;
    std::string prompt;
};

struct GenerationResponse {
    std::string generated_function_text;
};

/**
 * Transport to a remote code-generation service.
 * Implementations throw GenerationTransportError on transport or non-2xx failures.
 */
class GenerationClient {
public:
    virtual ~GenerationClient() = default;
    virtual GenerationResponse generate(const GenerationRequest& request) = 0;
};

// Fixed instruction sent with every request
extern const char* const GENERATION_SYSTEM_INSTRUCTION;

/**
 * Build a request for `formula_text`.
 * Throws ConfigurationError for an empty formula or an empty target list.
 */
GenerationRequest build_generation_request(const std::string& formula_text,
                                           const std::vector<std::string>& input_names,
                                           const std::vector<std::string>& target_names);

std::string build_generation_prompt(const std::string& formula_text,
                                    const std::vector<std::string>& input_names,
                                    const std::vector<std::string>& target_names);

// Remove a surrounding ```lang ... ``` fence if present
std::string strip_code_fences(std::string_view text);

// Single-letter head of an "X = ..." formula ("{X} = ..." also accepted)
std::optional<std::string> formula_head(std::string_view formula_text);

/**
 * Validate a generated response against its request and parse it.
 *
 * The text must contain a function named `evaluate`, and every target must
 * appear as an object key ("name:" optionally quoted); a key for the
 * formula's single-letter head satisfies the target requirement as well.
 * Inputs the function never reads produce a warning only.
 *
 * Throws GeneratedCodeInvalid on failure.
 */
GeneratedFunction validate_generated(const GenerationRequest& request, const GenerationResponse& response);

} // namespace formulize

#endif // FORMULIZE_EXTERNAL_FUNCTION_ADAPTER_HPP
