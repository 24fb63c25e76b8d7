#include "StationDescriptionLoader.h"
#include "../network/StationNetwork.h"
#include "../config/PlacementSettings.h"
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonParseError>
#include <QDebug>
#include <utility>

namespace RailCdl::Io {

using Network::NodeRole;
using Network::StationNode;
using Network::TrackEdge;

OperationResult StationDescriptionLoader::loadFromFile(const QString& filePath, Network::StationNetwork& network) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical() << "[StationDescriptionLoader > loadFromFile] Cannot open station file:" << filePath;
        return OperationResult::failure(
            QString("Station file not found or unreadable: %1").arg(filePath),
            ErrorCode::STATION_FILE_UNREADABLE);
    }

    qDebug() << "[StationDescriptionLoader > loadFromFile] Importing" << QFileInfo(filePath).fileName();
    return loadFromJson(file.readAll(), network);
}

OperationResult StationDescriptionLoader::loadFromJson(const QByteArray& json, Network::StationNetwork& network) {
    m_requestedSignalDistance.reset();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        qCritical() << "[StationDescriptionLoader > loadFromJson] Invalid JSON in station description:"
                    << parseError.errorString();
        return OperationResult::failure(
            QString("Invalid JSON in station description: %1").arg(parseError.errorString()),
            ErrorCode::STATION_PARSE_ERROR);
    }

    if (!doc.isObject()) {
        return OperationResult::failure("Station description must be a JSON object",
                                        ErrorCode::STATION_PARSE_ERROR);
    }

    const QJsonObject root = doc.object();

    std::optional<double> requestedDistance;
    if (root.contains("signal_distance")) {
        const QJsonValue distanceValue = root.value("signal_distance");
        if (!distanceValue.isDouble()) {
            qWarning() << "[StationDescriptionLoader > loadFromJson] signal_distance is not a number";
            return OperationResult::failure("signal_distance must be a number",
                                            ErrorCode::INVALID_SETTING).addAffectedEntity("signal_distance");
        }

        Config::PlacementSettings requested;
        requested.signalDistanceMeters = distanceValue.toDouble();
        OperationResult validation = requested.validate();
        if (validation.isFailure()) {
            qWarning() << "[StationDescriptionLoader > loadFromJson] Rejected signal_distance:" << validation.getReason();
            return OperationResult::failure(validation.getReason(), ErrorCode::INVALID_SETTING)
                .addAffectedEntity("signal_distance");
        }
        requestedDistance = requested.signalDistanceMeters;
    }

    // Caller's network is only replaced by a complete import
    Network::StationNetwork staged(root.value("name").toString("Manual Station"));

    OperationResult nodesResult = importNodes(root, staged);
    if (nodesResult.isFailure()) {
        return nodesResult;
    }

    OperationResult edgesResult = importEdges(root, staged);
    if (edgesResult.isFailure()) {
        return edgesResult;
    }

    network = std::move(staged);
    m_requestedSignalDistance = requestedDistance;

    qDebug() << "[StationDescriptionLoader > loadFromJson] Import complete:" << network.name()
             << "nodes:" << network.nodeCount() << "edges:" << network.edgeCount();

    return OperationResult::success(
        QString("Imported %1 nodes and %2 edges").arg(network.nodeCount()).arg(network.edgeCount()));
}

OperationResult StationDescriptionLoader::importNodes(const QJsonObject& root, Network::StationNetwork& network) {
    const QJsonArray nodesArray = root.value("nodes").toArray();

    for (const QJsonValue& value : nodesArray) {
        const QJsonObject nodeObject = value.toObject();
        const QString nodeId = nodeObject.value("id").toString();

        if (nodeId.isEmpty()) {
            qWarning() << "[StationDescriptionLoader > importNodes] Node entry without id";
            return OperationResult::failure("Node entry without id", ErrorCode::STATION_INVALID_ENTRY);
        }

        if (!nodeObject.value("type").isString()) {
            qWarning() << "[StationDescriptionLoader > importNodes] Node entry without type:" << nodeId;
            return OperationResult::failure(
                QString("Node %1 has no type").arg(nodeId),
                ErrorCode::STATION_INVALID_ENTRY).addAffectedEntity(nodeId);
        }

        const QString roleStr = nodeObject.value("type").toString();
        bool roleOk = false;
        const NodeRole role = Network::nodeRoleFromString(roleStr, &roleOk);
        if (!roleOk) {
            qWarning() << "[StationDescriptionLoader > importNodes] Unknown node type" << roleStr << "for" << nodeId;
            return OperationResult::failure(
                QString("Unknown node type '%1' for node %2").arg(roleStr, nodeId),
                ErrorCode::UNKNOWN_NODE_ROLE).addAffectedEntity(nodeId);
        }

        const QPointF position(nodeObject.value("x").toDouble(), nodeObject.value("y").toDouble());
        network.addNode(StationNode(nodeId, role, position));
    }

    return OperationResult::success();
}

OperationResult StationDescriptionLoader::importEdges(const QJsonObject& root, Network::StationNetwork& network) {
    const QJsonArray edgesArray = root.value("edges").toArray();

    for (const QJsonValue& value : edgesArray) {
        const QJsonObject edgeObject = value.toObject();

        TrackEdge edge;
        edge.fromNodeId = edgeObject.value("from").toString();
        edge.toNodeId = edgeObject.value("to").toString();
        edge.lengthMeters = edgeObject.value("length").toDouble();

        if (!edgeObject.value("length").isDouble()) {
            qWarning() << "[StationDescriptionLoader > importEdges] Edge without numeric length:"
                       << edge.fromNodeId << "->" << edge.toNodeId;
            return OperationResult::failure(
                QString("Edge %1 -> %2 has no numeric length").arg(edge.fromNodeId, edge.toNodeId),
                ErrorCode::STATION_INVALID_ENTRY);
        }

        OperationResult result = network.addEdge(edge);
        if (result.isFailure()) {
            return result;
        }
    }

    return OperationResult::success();
}

} // namespace RailCdl::Io
