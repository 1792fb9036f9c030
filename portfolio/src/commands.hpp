#pragma once

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

class TransactionLedger;
class HoldingsCalculator;
class ValuationFacade;
class SnapshotReconstructor;
class BackfillQueue;

using AuditSink = std::function<void(const nlohmann::json& event)>;

// Maps command messages {corr_id, cmd, from: {user_id}, args} onto engine
// operations. Replies are {corr_id, ok, message, data, ts}; failures add
// an "error" kind instead of data.
class CommandRouter {
public:
    CommandRouter(std::shared_ptr<TransactionLedger> ledger,
                  std::shared_ptr<HoldingsCalculator> holdings,
                  std::shared_ptr<ValuationFacade> valuation,
                  std::shared_ptr<SnapshotReconstructor> snapshots,
                  std::shared_ptr<BackfillQueue> queue);

    nlohmann::json handle(const nlohmann::json& cmd);

    void set_audit_sink(AuditSink sink) { audit_ = std::move(sink); }

private:
    struct Outcome {
        std::string message;
        nlohmann::json data;
    };

    std::shared_ptr<TransactionLedger> ledger_;
    std::shared_ptr<HoldingsCalculator> holdings_;
    std::shared_ptr<ValuationFacade> valuation_;
    std::shared_ptr<SnapshotReconstructor> snapshots_;
    std::shared_ptr<BackfillQueue> queue_;
    AuditSink audit_;

    Outcome dispatch(const std::string& name, int64_t user_id, const nlohmann::json& args);
    void audit(const std::string& event, int64_t user_id, const std::string& detail);
};
