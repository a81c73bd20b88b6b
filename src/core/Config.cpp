#include "shinglescan/Config.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include "shinglescan/Errors.hpp"

using json = nlohmann::json;

namespace shinglescan {

namespace {
// Whole-string integer parse; rejects trailing garbage and, if !allowNegative, a sign.
bool parseInteger(const char* value, bool allowNegative, long long& out) {
    if (!allowNegative && std::strchr(value, '-')) return false;
    try {
        size_t pos = 0;
        out = std::stoll(value, &pos);
        return pos == std::strlen(value);
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDouble(const char* value, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(value, &pos);
        return pos == std::strlen(value);
    } catch (const std::exception&) {
        return false;
    }
}

long long integerField(const json& body, const char* name) {
    const auto& v = body.at(name);
    if (!v.is_number_integer()) {
        throw InvalidParameterError(name, "must be an integer, got " + v.dump(-1, ' ', false, json::error_handler_t::replace));
    }
    if (v.is_number_unsigned() && v.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        throw InvalidParameterError(name, "out of range");
    }
    return v.get<long long>();
}
} // namespace

void Parameters::validate() const {
    if (n < 1) {
        throw InvalidParameterError("n", "shingle length must be at least 1, got " + std::to_string(n));
    }
    if (std::isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
        throw InvalidParameterError("threshold", "similarity threshold must lie in [0, 1], got " + std::to_string(threshold));
    }
    if (maxResults && *maxResults < 0) {
        throw InvalidParameterError("max_results", "must not be negative, got " + std::to_string(*maxResults));
    }
}

Parameters Parameters::fromJson(const json& body, Parameters base) {
    if (body.contains("n")) {
        long long n = integerField(body, "n");
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            throw InvalidParameterError("n", "out of range, got " + std::to_string(n));
        }
        base.n = static_cast<int>(n);
    }
    if (body.contains("threshold")) {
        const auto& t = body["threshold"];
        if (!t.is_number()) {
            throw InvalidParameterError("threshold", "must be a number");
        }
        base.threshold = t.get<double>();
    }
    if (body.contains("max_results")) {
        if (body["max_results"].is_null()) {
            base.maxResults.reset();
        } else {
            base.maxResults = integerField(body, "max_results");
        }
    }
    base.validate();
    return base;
}

json Parameters::toJson() const {
    json j{
        {"n", n},
        {"threshold", threshold},
        {"max_results", nullptr}
    };
    if (maxResults) {
        j["max_results"] = *maxResults;
    }
    return j;
}

Config Config::fromEnvironment() {
    Config cfg;

    auto warn = [](const char* name, const char* value) {
        std::cerr << "Config: ignoring malformed " << name << "=" << value << "\n";
    };

    long long parsed = 0;
    if (const char* envN = std::getenv("SHINGLESCAN_N")) {
        if (parseInteger(envN, true, parsed) && parsed >= std::numeric_limits<int>::min() && parsed <= std::numeric_limits<int>::max()) {
            cfg.params.n = static_cast<int>(parsed);
        } else {
            warn("SHINGLESCAN_N", envN);
        }
    }
    if (const char* envThreshold = std::getenv("SHINGLESCAN_THRESHOLD")) {
        double t = 0.0;
        if (parseDouble(envThreshold, t)) cfg.params.threshold = t;
        else warn("SHINGLESCAN_THRESHOLD", envThreshold);
    }
    if (const char* envMax = std::getenv("SHINGLESCAN_MAX_RESULTS")) {
        if (parseInteger(envMax, true, parsed)) cfg.params.maxResults = parsed;
        else warn("SHINGLESCAN_MAX_RESULTS", envMax);
    }
    if (const char* envThreads = std::getenv("SHINGLESCAN_THREADS")) {
        if (parseInteger(envThreads, false, parsed)) cfg.threads = static_cast<std::size_t>(parsed);
        else warn("SHINGLESCAN_THREADS", envThreads);
    }
    if (const char* envVerbose = std::getenv("SHINGLESCAN_VERBOSE")) {
        std::string v(envVerbose);
        cfg.verbose = !(v.empty() || v == "0" || v == "false" || v == "off");
    }

    return cfg;
}

json Config::toJson() const {
    json j{
        {"params", params.toJson()},
        {"directory", directory},
        {"recursive", recursive},
        {"verbose", verbose},
        {"threads", threads},
        {"format", format}
    };
    return j;
}

} // namespace shinglescan
