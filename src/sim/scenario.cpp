// Scenario runner for the reference market

#include "zap/sim/scenario.hpp"
#include "zap/errors.hpp"
#include "zap/log.hpp"
#include "zap/sim/pair.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace zap {
namespace sim {

namespace {

const nlohmann::json& require_key(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        throw std::invalid_argument(std::string("scenario: missing '") + key + "' in " + j.dump());
    }
    return j.at(key);
}

const nlohmann::json& require_object(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("scenario must be a JSON object");
    }
    return doc;
}

ZapConfig config_of(const nlohmann::json& doc) {
    const nlohmann::json& obj = require_object(doc);
    return obj.contains("config") ? ZapConfig::from_json(obj.at("config")) : ZapConfig{};
}

std::string pool_key(const std::string& a, const std::string& b) {
    return a < b ? a + "/" + b : b + "/" + a;
}

} // namespace

Scenario::Scenario(const nlohmann::json& doc)
    : config_(config_of(doc)),
      chain_(doc.value("genesis_time", Timestamp{1700000000})) {
    const Address factory_addr = addresses::is_null(config_.factory) ? chain_.allocate_address()
                                                                     : config_.factory;
    factory_ = &chain_.deploy<Factory>(factory_addr, chain_, config_.init_code_hash);
    config_.factory = factory_addr;
    router_ = &chain_.deploy_new<Router>(chain_, *factory_);
    resolver_ = std::make_unique<PairAddressResolver>(*factory_, factory_addr,
                                                      config_.init_code_hash);
    zapper_ = std::make_unique<Zapper>(*router_, *resolver_, chain_,
                                       chain_.allocate_address(), config_.zap, &recorder_);

    if (doc.contains("tokens")) deploy_tokens(doc.at("tokens"));
    if (doc.contains("accounts")) fund_accounts(doc.at("accounts"));
    if (doc.contains("pools")) seed_pools(doc.at("pools"));
    actions_ = doc.value("actions", nlohmann::json::array());
}

std::unique_ptr<Scenario> Scenario::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

std::unique_ptr<Scenario> Scenario::from_json_string(std::string_view content) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid scenario JSON: ") + e.what());
    }
    return std::make_unique<Scenario>(doc);
}

// =============================================================================
// Setup
// =============================================================================

void Scenario::deploy_tokens(const nlohmann::json& tokens) {
    for (const auto& t : tokens) {
        const std::string symbol = require_key(t, "symbol").get<std::string>();
        if (tokens_.count(symbol) != 0) {
            throw std::invalid_argument("scenario: duplicate token " + symbol);
        }
        Token& token = chain_.deploy_new<Token>(symbol, t.value("fee_bps", uint32_t{0}));
        tokens_[symbol] = &token;
        log::debug("token " + symbol + " at " + to_hex(token.address()));
    }
}

void Scenario::fund_accounts(const nlohmann::json& accounts) {
    for (const auto& [name, holdings] : accounts.items()) {
        const Address addr = chain_.allocate_address();
        accounts_[name] = addr;
        for (const auto& [symbol, amount] : holdings.items()) {
            token(symbol).mint(addr, amount_from_json(amount));
        }
    }
}

void Scenario::seed_pools(const nlohmann::json& pools) {
    for (const auto& p : pools) {
        const Address provider = account(require_key(p, "provider").get<std::string>());
        const auto& assets = require_key(p, "assets");
        const auto& amounts = require_key(p, "amounts");
        if (assets.size() != 2 || amounts.size() != 2) {
            throw std::invalid_argument("scenario: pool needs two assets and two amounts");
        }

        const std::string sym_a = assets[0].get<std::string>();
        const std::string sym_b = assets[1].get<std::string>();
        Token& a = token(sym_a);
        Token& b = token(sym_b);

        a.approve(provider, router_->address(), MAX_AMOUNT);
        b.approve(provider, router_->address(), MAX_AMOUNT);
        const AddLiquidityResult added = router_->add_liquidity(
            provider, a.address(), b.address(),
            amount_from_json(amounts[0]), amount_from_json(amounts[1]), 0, 0,
            provider, chain_.timestamp());

        pools_[pool_key(sym_a, sym_b)] = factory_->get_pool(a.address(), b.address());
        log::debug("pool " + pool_key(sym_a, sym_b) + " seeded, " +
                   to_string(added.liquidity) + " LP to provider");
    }
}

Token& Scenario::token(const std::string& symbol) {
    auto it = tokens_.find(symbol);
    if (it == tokens_.end()) {
        throw std::invalid_argument("scenario: unknown token " + symbol);
    }
    return *it->second;
}

Address Scenario::account(const std::string& name) const {
    auto it = accounts_.find(name);
    if (it == accounts_.end()) {
        throw std::invalid_argument("scenario: unknown account " + name);
    }
    return it->second;
}

// =============================================================================
// Actions
// =============================================================================

nlohmann::json Scenario::run() {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& action : actions_) {
        results.push_back(run_action(action));
    }

    const Chain::Stats stats = chain_.get_stats();
    return nlohmann::json{
        {"results", results},
        {"balances", balances()},
        {"stats", {
            {"contracts", stats.contracts},
            {"transactions", stats.transactions},
            {"reverted", stats.reverted},
        }},
    };
}

nlohmann::json Scenario::run_action(const nlohmann::json& action) {
    const std::string type = require_key(action, "type").get<std::string>();
    nlohmann::json result{{"type", type}};

    try {
        if (type == "zap_in") {
            result.update(chain_.transact([&] { return zap_in(action); }));
        } else if (type == "zap_out") {
            result.update(chain_.transact([&] { return zap_out(action); }));
        } else if (type == "advance_time") {
            chain_.advance_time(require_key(action, "seconds").get<uint64_t>());
            result["timestamp"] = chain_.timestamp();
        } else {
            throw std::invalid_argument("scenario: unknown action type " + type);
        }
        result["ok"] = true;
    } catch (const ZapError& e) {
        log::warn(type + " reverted: " + e.what());
        result["ok"] = false;
        result["error"] = to_string(e.code());
        result["code"] = static_cast<int32_t>(e.code());
        result["message"] = e.what();
    } catch (const std::exception& e) {
        log::warn(type + " failed: " + e.what());
        result["ok"] = false;
        result["error"] = "Exception";
        result["message"] = e.what();
    }
    return result;
}

Timestamp Scenario::deadline_for(const nlohmann::json& action) const {
    if (action.contains("deadline")) {
        return action.at("deadline").get<Timestamp>();
    }
    return config_.deadline_from(chain_.timestamp());
}

nlohmann::json Scenario::zap_in(const nlohmann::json& action) {
    const Address caller = account(require_key(action, "account").get<std::string>());
    const auto& pair = require_key(action, "pair");

    ZapInRequest request;
    request.input_asset = token(require_key(action, "input").get<std::string>()).address();
    request.pair_asset_a = token(pair.at(0).get<std::string>()).address();
    request.pair_asset_b = token(pair.at(1).get<std::string>()).address();
    request.input_amount = amount_from_json(require_key(action, "amount"));
    request.max_slippage_bps = action.value("slippage_bps", config_.default_slippage_bps);
    request.minimum_liquidity_out = action.contains("min_liquidity")
                                        ? amount_from_json(action.at("min_liquidity"))
                                        : Amount(0);
    request.deadline = deadline_for(action);
    request.fee_on_transfer = action.value("fee_on_transfer", false);

    IFungibleAsset& input = chain_.asset(request.input_asset);
    input.approve(caller, zapper_->address(), request.input_amount);

    const Amount minted = zapper_->zap_in_single_token(caller, request);
    const ZapInEvent& event = recorder_.last_in;
    return nlohmann::json{
        {"liquidity_minted", to_string(minted)},
        {"amount_swapped", to_string(event.amount_swapped)},
        {"amount_received", to_string(event.amount_received)},
        {"refund_input", to_string(event.refund_input)},
        {"refund_other", to_string(event.refund_other)},
    };
}

nlohmann::json Scenario::zap_out(const nlohmann::json& action) {
    const Address caller = account(require_key(action, "account").get<std::string>());
    const auto& pair = require_key(action, "pair");

    ZapOutRequest request;
    request.output_asset = token(require_key(action, "output").get<std::string>()).address();
    request.pair_asset_a = token(pair.at(0).get<std::string>()).address();
    request.pair_asset_b = token(pair.at(1).get<std::string>()).address();
    request.max_slippage_bps = action.value("slippage_bps", config_.default_slippage_bps);
    request.minimum_output_amount = action.contains("min_out")
                                        ? amount_from_json(action.at("min_out"))
                                        : Amount(0);
    request.deadline = deadline_for(action);
    request.fee_on_transfer = action.value("fee_on_transfer", false);

    // "all" withdraws the caller's whole position
    const auto& liquidity = require_key(action, "liquidity");
    const Address pool = zapper_->resolve_pool(request.pair_asset_a, request.pair_asset_b);
    if (liquidity.is_string() && liquidity.get<std::string>() == "all") {
        request.liquidity_in = addresses::is_null(pool) ? Amount(0)
                                                        : chain_.asset(pool).balance_of(caller);
    } else {
        request.liquidity_in = amount_from_json(liquidity);
    }
    if (!addresses::is_null(pool)) {
        chain_.asset(pool).approve(caller, zapper_->address(), request.liquidity_in);
    }

    const Amount out = zapper_->zap_out_single_token(caller, request);
    return nlohmann::json{{"amount_out", to_string(out)}};
}

// =============================================================================
// Reporting
// =============================================================================

nlohmann::json Scenario::balances() {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, addr] : accounts_) {
        nlohmann::json holdings = nlohmann::json::object();
        for (const auto& [symbol, ledger] : tokens_) {
            holdings[symbol] = to_string(ledger->balance_of(addr));
        }
        for (const auto& [key, pool] : pools_) {
            if (!chain_.has_contract(pool)) continue;
            holdings["LP:" + key] = to_string(chain_.asset(pool).balance_of(addr));
        }
        out[name] = holdings;
    }
    return out;
}

} // namespace sim
} // namespace zap
