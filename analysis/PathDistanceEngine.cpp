#include "PathDistanceEngine.h"
#include "../network/StationNetwork.h"
#include <QDebug>

namespace RailCdl::Analysis {

PathDistanceEngine::PathDistanceEngine(const Network::StationNetwork& network, int maxPathEdges)
    : m_network(network)
    , m_maxPathEdges(maxPathEdges)
{
}

double PathDistanceEngine::pathLength(const QStringList& path) const {
    if (path.size() < 2) {
        return 0.0;
    }

    double totalLength = 0.0;

    for (int i = 0; i < path.size() - 1; ++i) {
        std::optional<double> segmentLength = m_network.edgeLength(path[i], path[i + 1]);
        if (!segmentLength) {
            qWarning() << "[PathDistanceEngine > pathLength] No edge" << path[i] << "->" << path[i + 1]
                       << "- counted as 0 m";
            continue;
        }
        totalLength += *segmentLength;
    }

    return totalLength;
}

QList<QStringList> PathDistanceEngine::findSimplePaths(const QString& fromNodeId,
                                                       const QString& toNodeId,
                                                       int maxEdges) const {
    QList<QStringList> paths;

    if (fromNodeId == toNodeId || maxEdges < 1 ||
        !m_network.hasNode(fromNodeId) || !m_network.hasNode(toNodeId)) {
        return paths;
    }

    QStringList currentPath{fromNodeId};
    QSet<QString> visited{fromNodeId};
    collectSimplePaths(fromNodeId, toNodeId, maxEdges, currentPath, visited, paths);

    return paths;
}

void PathDistanceEngine::collectSimplePaths(const QString& currentId,
                                            const QString& targetId,
                                            int remainingEdges,
                                            QStringList& currentPath,
                                            QSet<QString>& visited,
                                            QList<QStringList>& paths) const {
    if (remainingEdges == 0) {
        return;
    }

    for (const QString& next : m_network.successors(currentId)) {
        if (visited.contains(next)) {
            continue;
        }

        currentPath.append(next);

        if (next == targetId) {
            paths.append(currentPath);
        } else {
            visited.insert(next);
            collectSimplePaths(next, targetId, remainingEdges - 1, currentPath, visited, paths);
            visited.remove(next);
        }

        currentPath.removeLast();
    }
}

std::optional<SignalPlacement> PathDistanceEngine::findBackwardPlacement(const QString& zoneId,
                                                                         const QString& approachNodeId,
                                                                         double signalDistance) const {
    const QList<QStringList> paths = findSimplePaths(approachNodeId, zoneId, m_maxPathEdges);

    if (paths.isEmpty()) {
        return std::nullopt;
    }

    // Shortest by length, first enumerated wins a tie
    int bestIndex = 0;
    double bestLength = pathLength(paths.first());
    for (int i = 1; i < paths.size(); ++i) {
        const double candidateLength = pathLength(paths[i]);
        if (candidateLength < bestLength) {
            bestLength = candidateLength;
            bestIndex = i;
        }
    }

    SignalPlacement placement;
    placement.path = paths[bestIndex];
    placement.pathLengthMeters = bestLength;

    const QStringList& path = placement.path;
    double accumulated = 0.0;

    for (int i = path.size() - 1; i > 0; --i) {
        const QString& currentNode = path[i];
        const QString& previousNode = path[i - 1];
        const double segmentLength = m_network.edgeLength(previousNode, currentNode).value_or(0.0);

        if (accumulated + segmentLength >= signalDistance) {
            placement.placementNodeId = previousNode;
            placement.offsetFromPlacement = signalDistance - accumulated;
            return placement;
        }

        accumulated += segmentLength;
    }

    // Approach shorter than the sighting distance: as far back as the track goes
    placement.placementNodeId = path.first();
    placement.offsetFromPlacement = 0.0;
    placement.atPathOrigin = true;
    return placement;
}

} // namespace RailCdl::Analysis
