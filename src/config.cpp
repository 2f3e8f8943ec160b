// =============================================================================
// config.cpp - ProtocolConfig JSON loading
// =============================================================================

#include "isolend/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace isolend {

using json = nlohmann::json;

namespace {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Off: return "off";
    }
    return "info";
}

// Decimal string or JSON number to X18
I128 read_fraction(const json& j, const char* key) {
    const json& v = j.at(key);
    if (v.is_string()) return x18::from_string(v.get<std::string>());
    if (v.is_number_integer()) return x18::from_int(v.get<int64_t>());
    if (v.is_number_float()) {
        // Fixed 15 digits keeps values like 0.1 exact
        std::ostringstream out;
        out << std::fixed;
        out.precision(15);
        out << v.get<double>();
        return x18::from_string(out.str());
    }
    throw Error(errors::INVALID_PARAMETER, std::string(key) + " must be a decimal");
}

// Integer number or decimal integer string to a raw amount
I128 read_amount(const json& j, const char* key) {
    const json& v = j.at(key);
    if (v.is_number_unsigned()) return static_cast<I128>(v.get<uint64_t>());
    if (v.is_number_integer()) return static_cast<I128>(v.get<int64_t>());
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        I128 scaled = x18::from_string(s);
        if (scaled % X18_ONE != 0) {
            throw Error(errors::INVALID_PARAMETER, std::string(key) + " must be an integer");
        }
        return scaled / X18_ONE;
    }
    throw Error(errors::INVALID_PARAMETER, std::string(key) + " must be an integer");
}

uint64_t read_seconds(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw Error(errors::INVALID_PARAMETER, std::string(key) + " must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

} // namespace

ProtocolConfig ProtocolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

ProtocolConfig ProtocolConfig::from_json(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw Error(errors::INVALID_PARAMETER, std::string("config: ") + e.what());
    }
    if (!j.is_object()) {
        throw Error(errors::INVALID_PARAMETER, "config must be a JSON object");
    }

    ProtocolConfig config;
    try {
        if (j.contains("owner")) config.owner = addresses::parse(j.at("owner").get<std::string>());
        if (j.contains("fee_recipient")) {
            config.fee_recipient = addresses::parse(j.at("fee_recipient").get<std::string>());
        }

        if (j.contains("min_ltv")) config.min_ltv_x18 = read_fraction(j, "min_ltv");
        if (j.contains("max_ltv")) config.max_ltv_x18 = read_fraction(j, "max_ltv");
        if (j.contains("close_factor")) config.close_factor_x18 = read_fraction(j, "close_factor");
        if (j.contains("liquidation_discount")) {
            config.liquidation_discount_x18 = read_fraction(j, "liquidation_discount");
        }
        if (j.contains("liquidation_fee")) config.liquidation_fee_x18 = read_fraction(j, "liquidation_fee");
        if (j.contains("interest_fee")) config.interest_fee_x18 = read_fraction(j, "interest_fee");
        if (j.contains("origination_fee")) config.origination_fee_x18 = read_fraction(j, "origination_fee");

        if (j.contains("min_borrow")) config.min_borrow = read_amount(j, "min_borrow");
        if (j.contains("min_debt")) config.min_debt = read_amount(j, "min_debt");
        if (j.contains("min_burned_shares")) config.min_burned_shares = read_amount(j, "min_burned_shares");

        if (j.contains("timelock_duration")) config.timelock_duration = read_seconds(j, "timelock_duration");
        if (j.contains("timelock_deadline")) config.timelock_deadline = read_seconds(j, "timelock_deadline");

        if (j.contains("log_level")) config.log_level = parse_log_level(j.at("log_level").get<std::string>());
    } catch (const json::type_error& e) {
        throw Error(errors::INVALID_PARAMETER, std::string("config: ") + e.what());
    }

    config.validate();
    return config;
}

std::string ProtocolConfig::to_json() const {
    json j = {
        {"owner", addresses::to_hex(owner)},
        {"fee_recipient", addresses::to_hex(fee_recipient)},
        {"min_ltv", x18::to_string(min_ltv_x18)},
        {"max_ltv", x18::to_string(max_ltv_x18)},
        {"close_factor", x18::to_string(close_factor_x18)},
        {"liquidation_discount", x18::to_string(liquidation_discount_x18)},
        {"liquidation_fee", x18::to_string(liquidation_fee_x18)},
        {"interest_fee", x18::to_string(interest_fee_x18)},
        {"origination_fee", x18::to_string(origination_fee_x18)},
        {"min_borrow", isolend::to_string(min_borrow)},
        {"min_debt", isolend::to_string(min_debt)},
        {"min_burned_shares", isolend::to_string(min_burned_shares)},
        {"timelock_duration", timelock_duration},
        {"timelock_deadline", timelock_deadline},
        {"log_level", level_name(log_level)}
    };
    return j.dump(2);
}

void ProtocolConfig::validate() const {
    auto fraction = [](I128 v, const char* name) {
        if (v < 0 || v > X18_ONE) {
            throw Error(errors::INVALID_PARAMETER, std::string(name) + " outside [0, 1]");
        }
    };

    if (min_ltv_x18 <= 0 || min_ltv_x18 > max_ltv_x18 || max_ltv_x18 >= X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "ltv bounds must satisfy 0 < min <= max < 1");
    }
    if (close_factor_x18 <= 0 || close_factor_x18 > X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "close_factor outside (0, 1]");
    }
    if (liquidation_discount_x18 < 0 || liquidation_discount_x18 >= X18_ONE) {
        throw Error(errors::INVALID_PARAMETER, "liquidation_discount outside [0, 1)");
    }
    fraction(liquidation_fee_x18, "liquidation_fee");
    fraction(interest_fee_x18, "interest_fee");
    fraction(origination_fee_x18, "origination_fee");

    if (min_borrow < 0 || min_debt < 0 || min_burned_shares < 0) {
        throw Error(errors::INVALID_PARAMETER, "negative minimum");
    }
}

} // namespace isolend
