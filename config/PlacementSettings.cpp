#include "PlacementSettings.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace RailCdl::Config {

OperationResult PlacementSettings::validate() const {
    if (!(signalDistanceMeters > 0.0)) {
        return OperationResult::failure(
            QString("Signal distance must be positive, got %1").arg(signalDistanceMeters),
            ErrorCode::INVALID_SETTING).addAffectedEntity("signal_distance_m");
    }

    if (maxPathEdges < 1) {
        return OperationResult::failure(
            QString("Path edge limit must be at least 1, got %1").arg(maxPathEdges),
            ErrorCode::INVALID_SETTING).addAffectedEntity("max_path_edges");
    }

    return OperationResult::success("Placement settings valid");
}

OperationResult PlacementSettings::loadFromFile(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical() << "[PlacementSettings > loadFromFile] Cannot open settings file:" << filePath;
        return OperationResult::failure(
            QString("Cannot open settings file: %1").arg(filePath),
            ErrorCode::SETTINGS_FILE_UNREADABLE);
    }

    return loadFromJson(file.readAll());
}

OperationResult PlacementSettings::loadFromJson(const QByteArray& json) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        qCritical() << "[PlacementSettings > loadFromJson] Invalid JSON in settings:" << parseError.errorString();
        return OperationResult::failure(
            QString("Invalid JSON in settings: %1").arg(parseError.errorString()),
            ErrorCode::SETTINGS_PARSE_ERROR);
    }

    if (!doc.isObject()) {
        return OperationResult::failure("Settings document must be a JSON object",
                                        ErrorCode::SETTINGS_PARSE_ERROR);
    }

    return applyJsonObject(doc.object()["signal_placement"].toObject());
}

OperationResult PlacementSettings::applyJsonObject(const QJsonObject& placementObject) {
    PlacementSettings candidate = *this;

    if (placementObject.contains("signal_distance_m")) {
        const QJsonValue value = placementObject["signal_distance_m"];
        if (!value.isDouble()) {
            return OperationResult::failure("signal_distance_m must be a number",
                                            ErrorCode::INVALID_SETTING).addAffectedEntity("signal_distance_m");
        }
        candidate.signalDistanceMeters = value.toDouble();
    }

    if (placementObject.contains("max_path_edges")) {
        const QJsonValue value = placementObject["max_path_edges"];
        if (!value.isDouble()) {
            return OperationResult::failure("max_path_edges must be a number",
                                            ErrorCode::INVALID_SETTING).addAffectedEntity("max_path_edges");
        }
        candidate.maxPathEdges = value.toInt();
    }

    OperationResult validation = candidate.validate();
    if (validation.isFailure()) {
        qWarning() << "[PlacementSettings > applyJsonObject] Rejected settings:" << validation.getReason();
        return validation;
    }

    *this = candidate;
    qDebug() << "[PlacementSettings > applyJsonObject] Signal distance:" << signalDistanceMeters
             << "m, path edge limit:" << maxPathEdges;
    return OperationResult::success("Placement settings loaded");
}

QJsonObject PlacementSettings::toJson() const {
    QJsonObject placementObject;
    placementObject["signal_distance_m"] = signalDistanceMeters;
    placementObject["max_path_edges"] = maxPathEdges;

    QJsonObject root;
    root["signal_placement"] = placementObject;
    return root;
}

} // namespace RailCdl::Config
