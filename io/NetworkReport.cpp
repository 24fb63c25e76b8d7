#include "NetworkReport.h"
#include "../network/StationNetwork.h"
#include "../analysis/NetworkStatistics.h"
#include <QJsonArray>
#include <QTextStream>
#include <algorithm>

namespace RailCdl::Io {

using Network::StationNode;
using Network::TrackEdge;

QString NetworkReport::exportSummary(const Network::StationNetwork& network) {
    const Analysis::NetworkStatistics stats = Analysis::NetworkStatistics::collect(network);
    const QString rule(RULE_WIDTH, '=');

    QString summary;
    QTextStream out(&summary);

    out << "\n" << rule << "\n";
    out << "RAILWAY NETWORK SUMMARY: " << network.name() << "\n";
    out << rule << "\n\n";

    out << "NETWORK STATISTICS:\n";
    out << "  - Total Nodes: " << stats.totalNodes << "\n";
    out << "  - Total Edges: " << stats.totalEdges << "\n";
    out << "  - Track Nodes: " << stats.countOf(Network::NodeRole::TRACK) << "\n";
    out << "  - Switches: " << stats.countOf(Network::NodeRole::SWITCH) << "\n";
    out << "  - Signals: " << stats.signalCount << "\n";
    out << "  - CDL Zones: " << stats.conflictZones << "\n";
    out << "  - Platforms: " << stats.countOf(Network::NodeRole::PLATFORM) << "\n";
    out << "  - Total Track Length: " << QString::number(stats.totalTrackLengthMeters, 'f', 2) << " meters\n\n";

    out << "CDL ZONES (Conflict/Merge Points):\n";
    QStringList zoneIds = network.conflictZoneIds();
    std::sort(zoneIds.begin(), zoneIds.end());
    for (const QString& zoneId : zoneIds) {
        out << "  - " << zoneId << "\n";
        out << "    Incoming tracks: " << network.predecessors(zoneId).join(", ") << "\n";
    }

    out << "\nSIGNALS:\n";
    QStringList signalIds = network.signalIds();
    std::sort(signalIds.begin(), signalIds.end());
    for (const QString& signalId : signalIds) {
        out << "  - " << signalId << "\n";

        const StationNode* signalNode = network.node(signalId);
        if (signalNode && signalNode->signalInfo()) {
            const auto& info = *signalNode->signalInfo();
            out << "    Protects CDL Zone: " << info.protectedZoneId << "\n";
            out << "    Approach from: " << info.approachNodeId << "\n";
            out << "    Distance to CDL: " << info.distanceToCdl << "m\n";
        }
    }

    out << "\n" << rule << "\n";
    out.flush();
    return summary;
}

QJsonObject NetworkReport::toJson(const Network::StationNetwork& network) {
    QJsonArray nodesArray;
    for (const StationNode& node : network.nodes()) {
        QJsonObject nodeObject;
        nodeObject["id"] = node.id();
        nodeObject["type"] = Network::nodeRoleToString(node.role());
        nodeObject["x"] = node.position().x();
        nodeObject["y"] = node.position().y();

        if (node.conflictZoneInfo()) {
            nodeObject["cdl_incoming_tracks"] = QJsonArray::fromStringList(node.conflictZoneInfo()->incomingTrackIds);
        }

        if (node.signalInfo()) {
            const auto& info = *node.signalInfo();
            nodeObject["protects_cdl_zone"] = info.protectedZoneId;
            nodeObject["approach_from"] = info.approachNodeId;
            nodeObject["placement_node"] = info.placementNodeId;
            nodeObject["distance_to_cdl"] = info.distanceToCdl;
            nodeObject["offset_from_placement"] = info.offsetFromPlacement;
        }

        nodesArray.append(nodeObject);
    }

    QJsonArray edgesArray;
    for (const TrackEdge& edge : network.edges()) {
        edgesArray.append(QJsonObject{
            {"from", edge.fromNodeId},
            {"to", edge.toNodeId},
            {"length", edge.lengthMeters}
        });
    }

    QJsonArray zonesArray;
    for (const QString& zoneId : network.conflictZoneIds()) {
        zonesArray.append(QJsonObject{
            {"id", zoneId},
            {"incoming", QJsonArray::fromStringList(network.predecessors(zoneId))}
        });
    }

    QJsonObject root;
    root["name"] = network.name();
    root["nodes"] = nodesArray;
    root["edges"] = edgesArray;
    root["cdl_zones"] = zonesArray;
    root["signals"] = QJsonArray::fromStringList(network.signalIds());
    root["stats"] = QJsonObject::fromVariantMap(Analysis::NetworkStatistics::collect(network).toVariantMap());
    return root;
}

} // namespace RailCdl::Io
