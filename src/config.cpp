// Zap configuration - JSON loading

#include "zap/config.hpp"
#include "zap/math.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace zap {

math::SwapRounding parse_swap_rounding(std::string_view name) {
    if (name == "down") return math::SwapRounding::Down;
    if (name == "up") return math::SwapRounding::Up;
    throw std::invalid_argument("unknown swap_rounding: " + std::string(name));
}

Amount amount_from_json(const nlohmann::json& j) {
    if (j.is_string()) {
        return amount_from_string(j.get<std::string>());
    }
    if (j.is_number_unsigned()) {
        return Amount(j.get<uint64_t>());
    }
    if (j.is_number_integer() && j.get<int64_t>() >= 0) {
        return Amount(static_cast<uint64_t>(j.get<int64_t>()));
    }
    throw std::invalid_argument("expected non-negative integer amount, got: " + j.dump());
}

ZapConfig ZapConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

ZapConfig ZapConfig::from_json_string(std::string_view content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    return from_json(j);
}

ZapConfig ZapConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    ZapConfig config;
    if (j.contains("log_level")) {
        config.log_level = log::parse_level(j.at("log_level").get<std::string>());
    }
    if (j.contains("factory")) {
        config.factory = address_from_hex(j.at("factory").get<std::string>());
    }
    if (j.contains("init_code_hash")) {
        config.init_code_hash = hash_from_hex(j.at("init_code_hash").get<std::string>());
    }
    if (j.contains("default_slippage_bps")) {
        config.default_slippage_bps = j.at("default_slippage_bps").get<uint32_t>();
        math::check_slippage(config.default_slippage_bps);
    }
    if (j.contains("deadline_window_s")) {
        config.deadline_window_s = j.at("deadline_window_s").get<uint64_t>();
    }

    if (j.contains("zap")) {
        const auto& z = j.at("zap");
        if (z.contains("swap_rounding")) {
            config.zap.swap_rounding = parse_swap_rounding(z.at("swap_rounding").get<std::string>());
        }
        if (z.contains("refund_dust")) {
            config.zap.refund_dust = z.at("refund_dust").get<bool>();
        }
        if (z.contains("verify_pair_address")) {
            config.zap.verify_pair_address = z.at("verify_pair_address").get<bool>();
        }
    }

    return config;
}

nlohmann::json ZapConfig::to_json() const {
    return nlohmann::json{
        {"log_level", log::level_name(log_level)},
        {"factory", to_hex(factory)},
        {"init_code_hash", to_hex(init_code_hash)},
        {"default_slippage_bps", default_slippage_bps},
        {"deadline_window_s", deadline_window_s},
        {"zap", {
            {"swap_rounding", zap.swap_rounding == math::SwapRounding::Up ? "up" : "down"},
            {"refund_dust", zap.refund_dust},
            {"verify_pair_address", zap.verify_pair_address},
        }},
    };
}

} // namespace zap
