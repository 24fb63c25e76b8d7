#pragma once
#include <QString>
#include <QStringList>
#include <QPointF>
#include <QPair>
#include <QHash>
#include <optional>

namespace RailCdl::Network {

class StationNetwork;

enum class NodeRole {
    TRACK,
    SWITCH,
    SIGNAL,
    CDL_ZONE,      // Converging tracks, needs signal protection
    PLATFORM,
    ENTRY_POINT,
    EXIT_POINT
};

inline size_t qHash(NodeRole role, size_t seed = 0) noexcept {
    return ::qHash(static_cast<int>(role), seed);
}

QString nodeRoleToString(NodeRole role);
NodeRole nodeRoleFromString(const QString& roleStr, bool* ok = nullptr);

// Snapshot taken when the classifier promotes a node. Not refreshed afterwards.
struct ConflictZoneInfo {
    QStringList incomingTrackIds;
};

struct SignalPlacementInfo {
    QString protectedZoneId;
    QString approachNodeId;
    QString placementNodeId;
    double distanceToCdl = 0.0;          // Requested sighting distance
    double offsetFromPlacement = 0.0;    // From placement node toward the zone
};

class StationNode {
public:
    StationNode() = default;
    StationNode(const QString& id, NodeRole role, const QPointF& position = QPointF());

    static StationNode createSignal(const QString& id,
                                    const QPointF& position,
                                    const SignalPlacementInfo& info);

    const QString& id() const { return m_id; }
    NodeRole role() const { return m_role; }
    QPointF position() const { return m_position; }

    bool isConflictZone() const { return m_role == NodeRole::CDL_ZONE; }
    bool isSignal() const { return m_role == NodeRole::SIGNAL; }

    const std::optional<ConflictZoneInfo>& conflictZoneInfo() const { return m_conflictZoneInfo; }
    const std::optional<SignalPlacementInfo>& signalInfo() const { return m_signalInfo; }

private:
    friend class StationNetwork;

    // Returns false when the node already is a conflict zone (no mutation)
    bool promoteToConflictZone(const QStringList& incomingTrackIds);

    QString m_id;
    NodeRole m_role = NodeRole::TRACK;
    QPointF m_position;
    std::optional<ConflictZoneInfo> m_conflictZoneInfo;
    std::optional<SignalPlacementInfo> m_signalInfo;
};

struct TrackEdge {
    QString fromNodeId;
    QString toNodeId;
    double lengthMeters = 0.0;

    QPair<QString, QString> key() const { return qMakePair(fromNodeId, toNodeId); }
};

using EdgeKey = QPair<QString, QString>;

} // namespace RailCdl::Network
