#pragma once
#include <QStringList>

namespace RailCdl::Network {
class StationNetwork;
}

namespace RailCdl::Analysis {

// Marks every node with two or more incoming tracks as a CDL zone.
// The only component allowed to rewrite a node role.
class ConflictZoneClassifier {
public:
    static constexpr int MIN_CONVERGING_TRACKS = 2;

    explicit ConflictZoneClassifier(Network::StationNetwork& network);

    // Zone ids in node insertion order. Idempotent on an unchanged graph.
    QStringList identifyConflictZones();

    // Nodes promoted by the last identifyConflictZones() call
    int lastPromotionCount() const { return m_lastPromotionCount; }

private:
    Network::StationNetwork& m_network;
    int m_lastPromotionCount = 0;
};

} // namespace RailCdl::Analysis
