#include "ConflictZoneClassifier.h"
#include "../network/StationNetwork.h"
#include <QDebug>

namespace RailCdl::Analysis {

ConflictZoneClassifier::ConflictZoneClassifier(Network::StationNetwork& network)
    : m_network(network)
{
}

QStringList ConflictZoneClassifier::identifyConflictZones() {
    QStringList conflictZones;
    m_lastPromotionCount = 0;

    for (const QString& nodeId : m_network.nodeIds()) {
        if (m_network.inDegree(nodeId) < MIN_CONVERGING_TRACKS) {
            continue;
        }

        if (m_network.promoteToConflictZone(nodeId)) {
            m_lastPromotionCount++;
            qDebug() << "[ConflictZoneClassifier > identifyConflictZones] CDL zone" << nodeId
                     << "incoming:" << m_network.predecessors(nodeId).join(", ");
        }

        conflictZones.append(nodeId);
    }

    return conflictZones;
}

} // namespace RailCdl::Analysis
