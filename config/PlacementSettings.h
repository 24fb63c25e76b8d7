#pragma once
#include <QString>
#include <QByteArray>
#include <QJsonObject>
#include "../common/OperationResult.h"

namespace RailCdl::Config {

// Tunables for one signal placement run.
struct PlacementSettings {
    static constexpr double DEFAULT_SIGNAL_DISTANCE_M = 500.0;
    // Cutoff for simple path enumeration. Approaches beyond it get no signal.
    static constexpr int DEFAULT_MAX_PATH_EDGES = 10;

    double signalDistanceMeters = DEFAULT_SIGNAL_DISTANCE_M;
    int maxPathEdges = DEFAULT_MAX_PATH_EDGES;

    OperationResult validate() const;

    // Reads {"signal_placement": {"signal_distance_m": .., "max_path_edges": ..}}.
    // Missing keys keep their current value. On failure the settings are untouched.
    OperationResult loadFromFile(const QString& filePath);
    OperationResult loadFromJson(const QByteArray& json);

    QJsonObject toJson() const;

private:
    OperationResult applyJsonObject(const QJsonObject& placementObject);
};

} // namespace RailCdl::Config
