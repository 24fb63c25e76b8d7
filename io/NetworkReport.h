#pragma once
#include <QString>
#include <QJsonObject>

namespace RailCdl::Network {
class StationNetwork;
}

namespace RailCdl::Io {

class NetworkReport {
public:
    // Plain text summary: statistics, CDL zones with incoming tracks, signals
    static QString exportSummary(const Network::StationNetwork& network);

    // Nodes, edges, zones, signals and statistics for rendering collaborators
    static QJsonObject toJson(const Network::StationNetwork& network);

private:
    static constexpr int RULE_WIDTH = 70;
};

} // namespace RailCdl::Io
