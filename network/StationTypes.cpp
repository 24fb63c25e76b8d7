#include "StationTypes.h"

namespace RailCdl::Network {

QString nodeRoleToString(NodeRole role) {
    switch (role) {
        case NodeRole::TRACK: return "track";
        case NodeRole::SWITCH: return "switch";
        case NodeRole::SIGNAL: return "signal";
        case NodeRole::CDL_ZONE: return "cdl_zone";
        case NodeRole::PLATFORM: return "platform";
        case NodeRole::ENTRY_POINT: return "entry";
        case NodeRole::EXIT_POINT: return "exit";
        default: return "track";
    }
}

NodeRole nodeRoleFromString(const QString& roleStr, bool* ok) {
    const QString normalized = roleStr.trimmed().toLower();
    if (ok) *ok = true;

    if (normalized == "track") return NodeRole::TRACK;
    if (normalized == "switch") return NodeRole::SWITCH;
    if (normalized == "signal") return NodeRole::SIGNAL;
    if (normalized == "cdl_zone") return NodeRole::CDL_ZONE;
    if (normalized == "platform") return NodeRole::PLATFORM;
    if (normalized == "entry") return NodeRole::ENTRY_POINT;
    if (normalized == "exit") return NodeRole::EXIT_POINT;

    if (ok) *ok = false;
    return NodeRole::TRACK;
}

StationNode::StationNode(const QString& id, NodeRole role, const QPointF& position)
    : m_id(id), m_role(role), m_position(position) {}

StationNode StationNode::createSignal(const QString& id,
                                      const QPointF& position,
                                      const SignalPlacementInfo& info) {
    StationNode node(id, NodeRole::SIGNAL, position);
    node.m_signalInfo = info;
    return node;
}

bool StationNode::promoteToConflictZone(const QStringList& incomingTrackIds) {
    if (m_role == NodeRole::CDL_ZONE) {
        return false;
    }

    m_role = NodeRole::CDL_ZONE;
    m_conflictZoneInfo = ConflictZoneInfo{incomingTrackIds};
    return true;
}

} // namespace RailCdl::Network
