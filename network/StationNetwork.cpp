#include "StationNetwork.h"
#include <QDebug>

namespace RailCdl::Network {

StationNetwork::StationNetwork(const QString& name)
    : m_name(name)
{
}

void StationNetwork::addNode(const StationNode& node) {
    if (!m_nodes.contains(node.id())) {
        m_nodeOrder.append(node.id());
    }

    // Overwrite drops whatever payload the previous node carried
    m_nodes.insert(node.id(), node);
}

OperationResult StationNetwork::addEdge(const TrackEdge& edge) {
    const bool hasFrom = m_nodes.contains(edge.fromNodeId);
    const bool hasTo = m_nodes.contains(edge.toNodeId);

    if (!hasFrom || !hasTo) {
        qWarning() << "[StationNetwork > addEdge] Both nodes must exist before adding edge:"
                   << edge.fromNodeId << "->" << edge.toNodeId;

        auto result = OperationResult::failure(
            QString("Both nodes must exist before adding edge: %1 -> %2")
                .arg(edge.fromNodeId, edge.toNodeId),
            ErrorCode::REFERENTIAL_INTEGRITY);
        if (!hasFrom) result.addAffectedEntity(edge.fromNodeId);
        if (!hasTo) result.addAffectedEntity(edge.toNodeId);
        return result;
    }

    const EdgeKey key = edge.key();
    if (!m_edges.contains(key)) {
        m_edgeOrder.append(key);
        m_outgoing[edge.fromNodeId].append(edge.toNodeId);
        m_incoming[edge.toNodeId].append(edge.fromNodeId);
    }
    m_edges.insert(key, edge);

    return OperationResult::success(
        QString("Edge added: %1 -> %2").arg(edge.fromNodeId, edge.toNodeId));
}

void StationNetwork::clear() {
    m_nodes.clear();
    m_nodeOrder.clear();
    m_edges.clear();
    m_edgeOrder.clear();
    m_incoming.clear();
    m_outgoing.clear();
}

bool StationNetwork::hasEdge(const QString& fromNodeId, const QString& toNodeId) const {
    return m_edges.contains(qMakePair(fromNodeId, toNodeId));
}

const StationNode* StationNetwork::node(const QString& nodeId) const {
    auto it = m_nodes.constFind(nodeId);
    if (it == m_nodes.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

const TrackEdge* StationNetwork::edge(const QString& fromNodeId, const QString& toNodeId) const {
    auto it = m_edges.constFind(qMakePair(fromNodeId, toNodeId));
    if (it == m_edges.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

std::optional<double> StationNetwork::edgeLength(const QString& fromNodeId, const QString& toNodeId) const {
    const TrackEdge* found = edge(fromNodeId, toNodeId);
    if (!found) {
        return std::nullopt;
    }
    return found->lengthMeters;
}

QList<StationNode> StationNetwork::nodes() const {
    QList<StationNode> ordered;
    ordered.reserve(m_nodeOrder.size());
    for (const QString& nodeId : m_nodeOrder) {
        ordered.append(m_nodes.value(nodeId));
    }
    return ordered;
}

QList<TrackEdge> StationNetwork::edges() const {
    QList<TrackEdge> ordered;
    ordered.reserve(m_edgeOrder.size());
    for (const EdgeKey& key : m_edgeOrder) {
        ordered.append(m_edges.value(key));
    }
    return ordered;
}

QStringList StationNetwork::idsWithRole(NodeRole role) const {
    QStringList ids;
    for (const QString& nodeId : m_nodeOrder) {
        if (m_nodes.value(nodeId).role() == role) {
            ids.append(nodeId);
        }
    }
    return ids;
}

bool StationNetwork::promoteToConflictZone(const QString& nodeId) {
    auto it = m_nodes.find(nodeId);
    if (it == m_nodes.end()) {
        return false;
    }
    return it.value().promoteToConflictZone(predecessors(nodeId));
}

} // namespace RailCdl::Network
