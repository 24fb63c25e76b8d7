#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QVariantMap>
#include "ConflictZoneClassifier.h"
#include "NetworkStatistics.h"
#include "../config/PlacementSettings.h"

namespace RailCdl::Network {
class StationNetwork;
}

namespace RailCdl::Analysis {

struct SkippedApproach {
    QString zoneId;
    QString approachNodeId;
};

struct AnalysisOutcome {
    QStringList conflictZones;
    QStringList newSignals;
    QList<SkippedApproach> skippedApproaches;
    NetworkStatistics statistics;
    double elapsedMs = 0.0;

    QVariantMap toVariantMap() const;
};

class SignalPlacementPlanner : public QObject {
    Q_OBJECT

public:
    explicit SignalPlacementPlanner(Network::StationNetwork& network,
                                    const Config::PlacementSettings& settings = Config::PlacementSettings(),
                                    QObject* parent = nullptr);
    ~SignalPlacementPlanner();

    const Config::PlacementSettings& settings() const { return m_settings; }

    // Rejected settings leave the current ones in place
    OperationResult setSettings(const Config::PlacementSettings& settings);

    static QString signalIdFor(const QString& approachNodeId, const QString& zoneId);

    // Classifies first, then places one signal per reachable approach of every
    // zone. Returns only the ids created by this call.
    QStringList placeSignals(double signalDistance);

    // Classification + placement with the configured distance
    AnalysisOutcome runAnalysis();

    // Approaches left without a signal by the last placeSignals() call
    const QList<SkippedApproach>& lastSkippedApproaches() const { return m_lastSkipped; }

signals:
    void signalPlaced(const QString& signalId, const QString& zoneId,
                      const QString& approachNodeId, const QString& placementNodeId);
    void approachSkipped(const QString& zoneId, const QString& approachNodeId);
    void placementCompleted(int createdSignals, double timeMs);

private:
    Network::StationNetwork& m_network;
    Config::PlacementSettings m_settings;
    ConflictZoneClassifier m_classifier;

    QStringList m_lastZones;
    QList<SkippedApproach> m_lastSkipped;

    static constexpr double PLACEMENT_WARNING_THRESHOLD_MS = 100.0;
};

} // namespace RailCdl::Analysis
