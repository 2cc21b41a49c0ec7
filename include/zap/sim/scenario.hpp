// Scenario runner for the reference market
// Builds tokens, accounts and pools from JSON, then replays zap actions

#ifndef ZAP_SIM_SCENARIO_HPP
#define ZAP_SIM_SCENARIO_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "zap/config.hpp"
#include "zap/sim/chain.hpp"
#include "zap/sim/factory.hpp"
#include "zap/sim/router.hpp"
#include "zap/sim/token.hpp"
#include "zap/zapper.hpp"

namespace zap {
namespace sim {

// Scenario document:
//   {
//     "config":   { ...ZapConfig... },
//     "tokens":   [ {"symbol": "USDC", "fee_bps": 0}, ... ],
//     "accounts": { "alice": {"USDC": "1000000"}, ... },
//     "pools":    [ {"provider": "lp", "assets": ["USDC", "WETH"],
//                    "amounts": ["1000000", "1000000"]}, ... ],
//     "actions":  [ {"type": "zap_in", ...}, {"type": "zap_out", ...},
//                   {"type": "advance_time", "seconds": 60}, ... ]
//   }
class Scenario {
public:
    explicit Scenario(const nlohmann::json& doc);
    ~Scenario() = default;

    Scenario(const Scenario&) = delete;
    Scenario& operator=(const Scenario&) = delete;

    static std::unique_ptr<Scenario> from_file(std::string_view path);
    static std::unique_ptr<Scenario> from_json_string(std::string_view content);

    // Execute every action, each as its own transaction. A failing action
    // is reported and rolled back; later actions still run.
    // Returns: {"results": [...], "balances": {...}, "stats": {...}}
    nlohmann::json run();

    // Execute a single action object
    nlohmann::json run_action(const nlohmann::json& action);

    // Every account's balance of every token and pool LP unit
    nlohmann::json balances();

    const ZapConfig& config() const { return config_; }
    Chain& chain() { return chain_; }
    Router& router() { return *router_; }
    Factory& factory() { return *factory_; }
    Zapper& zapper() { return *zapper_; }

    Token& token(const std::string& symbol);
    Address account(const std::string& name) const;

private:
    // Keeps the latest committed zap notifications for reporting
    struct Recorder : IZapObserver {
        ZapInEvent last_in;
        ZapOutEvent last_out;
        void on_zap_in(const ZapInEvent& event) override { last_in = event; }
        void on_zap_out(const ZapOutEvent& event) override { last_out = event; }
    };

    ZapConfig config_;
    Recorder recorder_;
    Chain chain_;
    Factory* factory_ = nullptr;
    Router* router_ = nullptr;
    std::unique_ptr<PairAddressResolver> resolver_;
    std::unique_ptr<Zapper> zapper_;

    std::map<std::string, Token*> tokens_;          // by symbol
    std::map<std::string, Address> accounts_;       // by name
    std::map<std::string, Address> pools_;          // "A/B" -> pair
    nlohmann::json actions_;

    void deploy_tokens(const nlohmann::json& tokens);
    void fund_accounts(const nlohmann::json& accounts);
    void seed_pools(const nlohmann::json& pools);

    Timestamp deadline_for(const nlohmann::json& action) const;
    nlohmann::json zap_in(const nlohmann::json& action);
    nlohmann::json zap_out(const nlohmann::json& action);
};

} // namespace sim
} // namespace zap

#endif // ZAP_SIM_SCENARIO_HPP
