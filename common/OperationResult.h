#pragma once
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace RailCdl {

class OperationResult {
public:
    enum class Status { SUCCESS, FAILURE };

private:
    Status m_status = Status::FAILURE;
    QString m_reason;
    QString m_errorCode;
    QStringList m_affectedEntities;

public:
    OperationResult(Status status = Status::FAILURE, const QString& reason = "Unknown");

    // Status checking
    bool isSuccess() const { return m_status == Status::SUCCESS; }
    bool isFailure() const { return m_status == Status::FAILURE; }

    // Getters
    QString getReason() const { return m_reason; }
    QString getErrorCode() const { return m_errorCode; }
    QStringList getAffectedEntities() const { return m_affectedEntities; }

    // Builder pattern
    OperationResult& setErrorCode(const QString& errorCode) { m_errorCode = errorCode; return *this; }
    OperationResult& addAffectedEntity(const QString& entityId) { m_affectedEntities.append(entityId); return *this; }

    // Factory methods
    static OperationResult success(const QString& reason = "Operation completed");
    static OperationResult failure(const QString& reason, const QString& errorCode = "");

    QVariantMap toVariantMap() const;
};

// Error codes reported through OperationResult
namespace ErrorCode {
inline const QString REFERENTIAL_INTEGRITY = QStringLiteral("REFERENTIAL_INTEGRITY");
inline const QString UNKNOWN_NODE_ROLE = QStringLiteral("UNKNOWN_NODE_ROLE");
inline const QString INVALID_SETTING = QStringLiteral("INVALID_SETTING");
inline const QString SETTINGS_FILE_UNREADABLE = QStringLiteral("SETTINGS_FILE_UNREADABLE");
inline const QString SETTINGS_PARSE_ERROR = QStringLiteral("SETTINGS_PARSE_ERROR");
inline const QString STATION_FILE_UNREADABLE = QStringLiteral("STATION_FILE_UNREADABLE");
inline const QString STATION_PARSE_ERROR = QStringLiteral("STATION_PARSE_ERROR");
inline const QString STATION_INVALID_ENTRY = QStringLiteral("STATION_INVALID_ENTRY");
}

} // namespace RailCdl
