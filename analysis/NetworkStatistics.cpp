#include "NetworkStatistics.h"
#include "../network/StationNetwork.h"

namespace RailCdl::Analysis {

using Network::NodeRole;

NetworkStatistics NetworkStatistics::collect(const Network::StationNetwork& network) {
    NetworkStatistics stats;
    stats.totalNodes = network.nodeCount();
    stats.totalEdges = network.edgeCount();

    for (const Network::StationNode& node : network.nodes()) {
        stats.nodesByRole[node.role()]++;
    }

    for (const Network::TrackEdge& edge : network.edges()) {
        stats.totalTrackLengthMeters += edge.lengthMeters;
    }

    stats.conflictZones = stats.countOf(NodeRole::CDL_ZONE);
    stats.signalCount = stats.countOf(NodeRole::SIGNAL);
    return stats;
}

QVariantMap NetworkStatistics::toVariantMap() const {
    return QVariantMap{
        {"total_nodes", totalNodes},
        {"total_edges", totalEdges},
        {"tracks", countOf(NodeRole::TRACK)},
        {"switches", countOf(NodeRole::SWITCH)},
        {"signals", signalCount},
        {"cdl_zones", conflictZones},
        {"platforms", countOf(NodeRole::PLATFORM)},
        {"entries", countOf(NodeRole::ENTRY_POINT)},
        {"exits", countOf(NodeRole::EXIT_POINT)},
        {"total_track_length", totalTrackLengthMeters}
    };
}

} // namespace RailCdl::Analysis
