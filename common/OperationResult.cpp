#include "OperationResult.h"

namespace RailCdl {

OperationResult::OperationResult(Status status, const QString& reason)
    : m_status(status), m_reason(reason) {}

OperationResult OperationResult::success(const QString& reason) {
    return OperationResult(Status::SUCCESS, reason);
}

OperationResult OperationResult::failure(const QString& reason, const QString& errorCode) {
    auto result = OperationResult(Status::FAILURE, reason);
    if (!errorCode.isEmpty()) result.setErrorCode(errorCode);
    return result;
}

QVariantMap OperationResult::toVariantMap() const {
    QVariantMap map;
    map["success"] = isSuccess();
    map["reason"] = m_reason;
    map["errorCode"] = m_errorCode;
    map["affectedEntities"] = m_affectedEntities;
    return map;
}

} // namespace RailCdl
