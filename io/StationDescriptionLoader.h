#pragma once
#include <QString>
#include <QByteArray>
#include <QJsonObject>
#include <optional>
#include "../common/OperationResult.h"

namespace RailCdl::Network {
class StationNetwork;
}

namespace RailCdl::Io {

// Builds a network from a JSON station description:
// {"name": .., "signal_distance": .., "nodes": [{"id","type","x","y"}],
//  "edges": [{"from","to","length"}]}
// Nodes are added before edges. Every node needs an id and a type, every
// edge a numeric length, and signal_distance must be a positive number.
// The first failing entry aborts the load and leaves the target network
// untouched; a successful load replaces its whole content.
class StationDescriptionLoader {
public:
    OperationResult loadFromFile(const QString& filePath, Network::StationNetwork& network);
    OperationResult loadFromJson(const QByteArray& json, Network::StationNetwork& network);

    // Value of "signal_distance" in the last successfully loaded document, if any
    std::optional<double> requestedSignalDistance() const { return m_requestedSignalDistance; }

private:
    OperationResult importNodes(const QJsonObject& root, Network::StationNetwork& network);
    OperationResult importEdges(const QJsonObject& root, Network::StationNetwork& network);

    std::optional<double> m_requestedSignalDistance;
};

} // namespace RailCdl::Io
