#pragma once
#include <QString>
#include <QStringList>
#include <QSet>
#include <QList>
#include <optional>
#include "../config/PlacementSettings.h"

namespace RailCdl::Network {
class StationNetwork;
}

namespace RailCdl::Analysis {

struct SignalPlacement {
    QString placementNodeId;
    double offsetFromPlacement = 0.0;   // Along the edge from placement node toward the zone
    QStringList path;                   // Chosen approach path, origin first, zone last
    double pathLengthMeters = 0.0;
    bool atPathOrigin = false;          // Path shorter than the requested distance
};

class PathDistanceEngine {
public:
    explicit PathDistanceEngine(const Network::StationNetwork& network,
                                int maxPathEdges = Config::PlacementSettings::DEFAULT_MAX_PATH_EDGES);

    int maxPathEdges() const { return m_maxPathEdges; }

    // Sum of consecutive edge lengths. A missing edge adds nothing.
    double pathLength(const QStringList& path) const;

    // All simple paths from -> to with at most maxEdges edges, depth first
    // over successors in edge insertion order.
    QList<QStringList> findSimplePaths(const QString& fromNodeId,
                                       const QString& toNodeId,
                                       int maxEdges) const;

    std::optional<SignalPlacement> findBackwardPlacement(const QString& zoneId,
                                                         const QString& approachNodeId,
                                                         double signalDistance) const;

private:
    void collectSimplePaths(const QString& currentId,
                            const QString& targetId,
                            int remainingEdges,
                            QStringList& currentPath,
                            QSet<QString>& visited,
                            QList<QStringList>& paths) const;

    const Network::StationNetwork& m_network;
    int m_maxPathEdges;
};

} // namespace RailCdl::Analysis
