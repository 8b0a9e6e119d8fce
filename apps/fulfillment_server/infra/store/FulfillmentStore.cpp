#include "infra/store/FulfillmentStore.h"

std::string ToString(StoreStatus status) {
    switch (status) {
        case StoreStatus::kOk:           return "ok";
        case StoreStatus::kNotFound:     return "not_found";
        case StoreStatus::kDuplicateKey: return "duplicate_key";
        case StoreStatus::kConflict:     return "conflict";
        case StoreStatus::kGuardFailed:  return "guard_failed";
        case StoreStatus::kUnavailable:  return "unavailable";
    }
    return "unavailable";
}
