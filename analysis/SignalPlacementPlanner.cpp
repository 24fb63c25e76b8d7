#include "SignalPlacementPlanner.h"
#include "PathDistanceEngine.h"
#include "../network/StationNetwork.h"
#include <QElapsedTimer>
#include <QVariantList>
#include <QDebug>

namespace RailCdl::Analysis {

using Network::SignalPlacementInfo;
using Network::StationNode;

SignalPlacementPlanner::SignalPlacementPlanner(Network::StationNetwork& network,
                                               const Config::PlacementSettings& settings,
                                               QObject* parent)
    : QObject(parent)
    , m_network(network)
    , m_settings(settings)
    , m_classifier(network)
{
    OperationResult validation = m_settings.validate();
    if (validation.isFailure()) {
        qWarning() << "[SignalPlacementPlanner > SignalPlacementPlanner] Invalid settings, using defaults:"
                   << validation.getReason();
        m_settings = Config::PlacementSettings();
    }
}

SignalPlacementPlanner::~SignalPlacementPlanner() = default;

OperationResult SignalPlacementPlanner::setSettings(const Config::PlacementSettings& settings) {
    OperationResult validation = settings.validate();
    if (validation.isFailure()) {
        qWarning() << "[SignalPlacementPlanner > setSettings] Keeping previous settings:" << validation.getReason();
        return validation;
    }

    m_settings = settings;
    return OperationResult::success("Placement settings updated");
}

QString SignalPlacementPlanner::signalIdFor(const QString& approachNodeId, const QString& zoneId) {
    return QString("SIG_%1_%2").arg(approachNodeId, zoneId);
}

QStringList SignalPlacementPlanner::placeSignals(double signalDistance) {
    QElapsedTimer timer;
    timer.start();

    m_lastSkipped.clear();
    m_lastZones = m_classifier.identifyConflictZones();

    PathDistanceEngine engine(m_network, m_settings.maxPathEdges);
    QStringList newSignals;

    for (const QString& zoneId : m_lastZones) {
        for (const QString& approachNodeId : m_network.predecessors(zoneId)) {
            std::optional<SignalPlacement> placement =
                engine.findBackwardPlacement(zoneId, approachNodeId, signalDistance);

            if (!placement) {
                qWarning() << "[SignalPlacementPlanner > placeSignals] No path within"
                           << engine.maxPathEdges() << "edges from" << approachNodeId
                           << "to CDL zone" << zoneId << "- approach left unprotected";
                m_lastSkipped.append(SkippedApproach{zoneId, approachNodeId});
                emit approachSkipped(zoneId, approachNodeId);
                continue;
            }

            const QString signalId = signalIdFor(approachNodeId, zoneId);
            if (m_network.hasNode(signalId)) {
                continue;
            }

            const StationNode* placementNode = m_network.node(placement->placementNodeId);
            const QPointF position = placementNode ? placementNode->position() : QPointF();

            SignalPlacementInfo info;
            info.protectedZoneId = zoneId;
            info.approachNodeId = approachNodeId;
            info.placementNodeId = placement->placementNodeId;
            info.distanceToCdl = signalDistance;
            info.offsetFromPlacement = placement->offsetFromPlacement;

            m_network.addNode(StationNode::createSignal(signalId, position, info));
            newSignals.append(signalId);

            qDebug() << "[SignalPlacementPlanner > placeSignals] Placed signal" << signalId
                     << "at node" << placement->placementNodeId
                     << "offset" << placement->offsetFromPlacement << "m"
                     << "protecting CDL zone" << zoneId;
            emit signalPlaced(signalId, zoneId, approachNodeId, placement->placementNodeId);
        }
    }

    const double timeMs = timer.elapsed();
    if (timeMs > PLACEMENT_WARNING_THRESHOLD_MS) {
        qWarning() << "[SignalPlacementPlanner > placeSignals] Slow placement run:" << timeMs << "ms for"
                   << m_lastZones.size() << "CDL zones";
    }

    emit placementCompleted(newSignals.size(), timeMs);
    return newSignals;
}

AnalysisOutcome SignalPlacementPlanner::runAnalysis() {
    QElapsedTimer timer;
    timer.start();

    AnalysisOutcome outcome;
    outcome.newSignals = placeSignals(m_settings.signalDistanceMeters);
    outcome.conflictZones = m_lastZones;
    outcome.skippedApproaches = m_lastSkipped;
    outcome.statistics = NetworkStatistics::collect(m_network);
    outcome.elapsedMs = timer.elapsed();

    qDebug() << "[SignalPlacementPlanner > runAnalysis]" << m_network.name() << ":"
             << outcome.conflictZones.size() << "CDL zones,"
             << outcome.newSignals.size() << "new signals,"
             << outcome.skippedApproaches.size() << "skipped approaches";

    return outcome;
}

QVariantMap AnalysisOutcome::toVariantMap() const {
    QVariantList skipped;
    for (const SkippedApproach& approach : skippedApproaches) {
        skipped.append(QVariantMap{
            {"zone", approach.zoneId},
            {"approach", approach.approachNodeId}
        });
    }

    return QVariantMap{
        {"cdl_zones", conflictZones},
        {"signals", newSignals},
        {"skipped_approaches", skipped},
        {"stats", statistics.toVariantMap()},
        {"timeMs", elapsedMs}
    };
}

} // namespace RailCdl::Analysis
