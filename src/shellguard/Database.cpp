#include "Database.hpp"

#include "easylogging++.h"

TransactionScope::~TransactionScope() {
    if (committed_ || !transaction_) {
        return;
    }

    try {
        transaction_->Rollback();
    } catch (const DatabaseException& e) {
        LOG(ERROR) << "Rollback failed: " << e.what();
    }
}
