// Zap configuration
// JSON loading plus builder-style setters

#ifndef ZAP_CONFIG_HPP
#define ZAP_CONFIG_HPP

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "zap/log.hpp"
#include "zap/pair_address.hpp"
#include "zap/types.hpp"
#include "zap/zapper.hpp"

namespace zap {

class ZapConfig {
public:
    log::Level log_level = log::Level::INFO;
    Address factory{};
    Hash init_code_hash = DEFAULT_INIT_CODE_HASH;
    uint32_t default_slippage_bps = 50;   // 0.5%
    uint64_t deadline_window_s = 1200;    // 20 minutes
    ZapOptions zap;

    ZapConfig() = default;

    // Load from a JSON file
    static ZapConfig from_file(std::string_view path);

    // Load from a JSON string
    static ZapConfig from_json_string(std::string_view content);

    // Load from a parsed JSON object; missing keys keep their defaults
    static ZapConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    // Deadline for a request submitted at `now`
    Timestamp deadline_from(Timestamp now) const { return now + deadline_window_s; }

    // Builder methods
    ZapConfig& with_factory(const Address& addr, const Hash& code_hash = DEFAULT_INIT_CODE_HASH) {
        factory = addr;
        init_code_hash = code_hash;
        return *this;
    }

    ZapConfig& with_log_level(log::Level level) {
        log_level = level;
        return *this;
    }

    ZapConfig& set_default_slippage(uint32_t bps_value) {
        default_slippage_bps = bps_value;
        return *this;
    }

    ZapConfig& set_deadline_window(uint64_t seconds) {
        deadline_window_s = seconds;
        return *this;
    }

    ZapConfig& set_swap_rounding(math::SwapRounding rounding) {
        zap.swap_rounding = rounding;
        return *this;
    }

    ZapConfig& enable_dust_refund(bool enabled = true) {
        zap.refund_dust = enabled;
        return *this;
    }
};

// Accepts a JSON string ("123", "0x7b") or a non-negative integer
Amount amount_from_json(const nlohmann::json& j);

math::SwapRounding parse_swap_rounding(std::string_view name);

} // namespace zap

#endif // ZAP_CONFIG_HPP
