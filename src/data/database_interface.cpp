// src/data/database_interface.cpp

#include "tcrimer/data/database_interface.hpp"
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

std::string backend_kind_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::PRIMARY:
            return "primary";
        case BackendKind::FALLBACK:
            return "fallback";
    }
    return "unknown";
}

Result<std::unique_ptr<ScopedTransaction>> ScopedTransaction::begin(DatabaseInterface& db) {
    auto result = db.begin_transaction();
    if (result.is_error()) {
        return forward_error<std::unique_ptr<ScopedTransaction>>(result.error());
    }
    return std::unique_ptr<ScopedTransaction>(new ScopedTransaction(db));
}

ScopedTransaction::~ScopedTransaction() {
    if (!active_) {
        return;
    }
    auto result = db_.rollback();
    if (result.is_error()) {
        WARN("Rollback on " << db_.backend_name()
                            << " failed: " << result.error()->what());
    }
}

Result<void> ScopedTransaction::commit() {
    if (!active_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Transaction is no longer active",
                                "ScopedTransaction");
    }
    auto result = db_.commit();
    if (result.is_error()) {
        // Destructor still attempts the rollback
        return result;
    }
    active_ = false;
    return Result<void>();
}

}  // namespace tcrimer
