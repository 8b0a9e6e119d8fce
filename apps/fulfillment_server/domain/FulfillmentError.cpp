#include "domain/FulfillmentError.h"

#include <format>

std::string ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNone:                return "none";
        case ErrorCode::kValidation:          return "validation";
        case ErrorCode::kInsufficientStock:   return "insufficient_stock";
        case ErrorCode::kInsufficientBalance: return "insufficient_balance";
        case ErrorCode::kNotFound:            return "not_found";
        case ErrorCode::kLockContention:      return "lock_contention";
        case ErrorCode::kConflict:            return "conflict";
        case ErrorCode::kStorage:             return "storage";
    }
    return "storage";
}

FulfillmentError FulfillmentError::Validation(std::string message) {
    return FulfillmentError{ErrorCode::kValidation, std::move(message), std::nullopt};
}

FulfillmentError FulfillmentError::NotFound(const std::string& what, const std::string& id) {
    return FulfillmentError{ErrorCode::kNotFound, std::format("{} not found: {}", what, id), std::nullopt};
}

FulfillmentError FulfillmentError::InsufficientStock(StockShortage shortage) {
    std::string message = std::format("Insufficient stock for {}: available {}, requested {}", shortage.productName.empty() ? shortage.productId : shortage.productName,
                                      shortage.available, shortage.requested);
    return FulfillmentError{ErrorCode::kInsufficientStock, std::move(message), std::move(shortage)};
}

FulfillmentError FulfillmentError::InsufficientBalance(std::string message) {
    return FulfillmentError{ErrorCode::kInsufficientBalance, std::move(message), std::nullopt};
}

FulfillmentError FulfillmentError::LockContention(const std::string& orderId) {
    return FulfillmentError{ErrorCode::kLockContention, std::format("Order {} is being modified by another operation, retry shortly", orderId), std::nullopt};
}

FulfillmentError FulfillmentError::Conflict(std::string message) {
    return FulfillmentError{ErrorCode::kConflict, std::move(message), std::nullopt};
}

FulfillmentError FulfillmentError::Storage(std::string message) {
    return FulfillmentError{ErrorCode::kStorage, std::move(message), std::nullopt};
}
