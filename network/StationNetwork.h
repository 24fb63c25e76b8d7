#pragma once

#include <QString>
#include <QStringList>
#include <QHash>
#include <QList>
#include <optional>
#include "StationTypes.h"
#include "../common/OperationResult.h"

namespace RailCdl::Analysis {
class ConflictZoneClassifier;
}

namespace RailCdl::Network {

// In-memory directed graph of one station. Owns every node and edge for the
// duration of an analysis run; consumers work with ids and query back.
class StationNetwork {
public:
    explicit StationNetwork(const QString& name = "Railway Station");

    QString name() const { return m_name; }
    void setName(const QString& name) { m_name = name; }

    // Graph management
    void addNode(const StationNode& node);
    OperationResult addEdge(const TrackEdge& edge);
    void clear();

    // Lookups
    bool hasNode(const QString& nodeId) const { return m_nodes.contains(nodeId); }
    bool hasEdge(const QString& fromNodeId, const QString& toNodeId) const;

    // Pointers stay valid until the next addNode() or clear()
    const StationNode* node(const QString& nodeId) const;
    const TrackEdge* edge(const QString& fromNodeId, const QString& toNodeId) const;
    std::optional<double> edgeLength(const QString& fromNodeId, const QString& toNodeId) const;

    QStringList nodeIds() const { return m_nodeOrder; }
    QList<StationNode> nodes() const;
    QList<TrackEdge> edges() const;
    int nodeCount() const { return m_nodes.size(); }
    int edgeCount() const { return m_edges.size(); }

    // Adjacency queries, in edge insertion order
    QStringList predecessors(const QString& nodeId) const { return m_incoming.value(nodeId); }
    QStringList successors(const QString& nodeId) const { return m_outgoing.value(nodeId); }
    int inDegree(const QString& nodeId) const { return m_incoming.value(nodeId).size(); }
    int outDegree(const QString& nodeId) const { return m_outgoing.value(nodeId).size(); }

    // Derived from node roles, in node insertion order
    QStringList conflictZoneIds() const { return idsWithRole(NodeRole::CDL_ZONE); }
    QStringList signalIds() const { return idsWithRole(NodeRole::SIGNAL); }
    QStringList idsWithRole(NodeRole role) const;

private:
    friend class RailCdl::Analysis::ConflictZoneClassifier;

    bool promoteToConflictZone(const QString& nodeId);

    QString m_name;

    QHash<QString, StationNode> m_nodes;
    QStringList m_nodeOrder;

    QHash<EdgeKey, TrackEdge> m_edges;
    QList<EdgeKey> m_edgeOrder;

    QHash<QString, QStringList> m_incoming;   // nodeId -> predecessor ids
    QHash<QString, QStringList> m_outgoing;   // nodeId -> successor ids
};

} // namespace RailCdl::Network
