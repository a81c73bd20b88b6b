#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace shinglescan {

// Numeric inputs of a single comparison run.
struct Parameters {
    int n = 4;                           // shingle length in words
    double threshold = 0.1;              // keep pairs with similarity > threshold
    std::optional<long long> maxResults; // cap applied after sorting

    // Throws InvalidParameterError naming the first bad parameter.
    void validate() const;

    // Overrides from a request body ("n", "threshold", "max_results").
    // Non-integer or out-of-range values throw InvalidParameterError.
    static Parameters fromJson(const nlohmann::json& body, Parameters base);

    nlohmann::json toJson() const;
};

struct Config {
    Parameters params;
    std::string directory = ".";
    bool recursive = false;
    bool verbose = false;
    std::size_t threads = 0; // 0 lets TBB decide
    std::string format = "text";

    // HTTP mode
    std::string host = "0.0.0.0";
    int port = 0;

    // Defaults overridden by SHINGLESCAN_* environment variables.
    static Config fromEnvironment();

    nlohmann::json toJson() const;
};

} // namespace shinglescan
