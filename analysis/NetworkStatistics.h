#pragma once
#include <QHash>
#include <QVariantMap>
#include "../network/StationTypes.h"

namespace RailCdl::Network {
class StationNetwork;
}

namespace RailCdl::Analysis {

struct NetworkStatistics {
    int totalNodes = 0;
    int totalEdges = 0;
    QHash<Network::NodeRole, int> nodesByRole;
    double totalTrackLengthMeters = 0.0;
    int conflictZones = 0;
    int signalCount = 0;

    int countOf(Network::NodeRole role) const { return nodesByRole.value(role, 0); }

    static NetworkStatistics collect(const Network::StationNetwork& network);

    QVariantMap toVariantMap() const;
};

} // namespace RailCdl::Analysis
