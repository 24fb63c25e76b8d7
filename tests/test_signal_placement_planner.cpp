#include "TestStations.h"
#include "../analysis/SignalPlacementPlanner.h"

#include <gtest/gtest.h>

namespace {

using namespace RailCdl::Testing;
using RailCdl::Analysis::AnalysisOutcome;
using RailCdl::Analysis::SignalPlacementPlanner;
using RailCdl::Config::PlacementSettings;

int signalsProtecting(const StationNetwork& network, const QString& zoneId) {
    int count = 0;
    for (const QString& signalId : network.signalIds()) {
        const auto& info = network.node(signalId)->signalInfo();
        if (info && info->protectedZoneId == zoneId) {
            count++;
        }
    }
    return count;
}

TEST(SignalPlacementPlanner, SignalIdNamesApproachAndZone) {
    EXPECT_EQ(SignalPlacementPlanner::signalIdFor("A", "M"), "SIG_A_M");
}

TEST(SignalPlacementPlanner, SimpleMergeGetsOneSignalPerApproach) {
    StationNetwork network;
    buildSimpleMerge(network);
    SignalPlacementPlanner planner(network);

    const QStringList signalIds = planner.placeSignals(500);

    EXPECT_EQ(signalIds, (QStringList{"SIG_A_M", "SIG_B_M"}));
    EXPECT_EQ(network.node("M")->role(), NodeRole::CDL_ZONE);

    for (const QString& signalId : signalIds) {
        const StationNode* signal = network.node(signalId);
        ASSERT_NE(signal, nullptr);
        EXPECT_EQ(signal->role(), NodeRole::SIGNAL);
        ASSERT_TRUE(signal->signalInfo().has_value());
        EXPECT_EQ(signal->signalInfo()->protectedZoneId, "M");
        EXPECT_DOUBLE_EQ(signal->signalInfo()->distanceToCdl, 500.0);
        EXPECT_DOUBLE_EQ(signal->signalInfo()->offsetFromPlacement, 500.0);
        EXPECT_EQ(network.node(signal->signalInfo()->protectedZoneId)->role(), NodeRole::CDL_ZONE);
    }

    const StationNode* signalA = network.node("SIG_A_M");
    EXPECT_EQ(signalA->signalInfo()->approachNodeId, "A");
    EXPECT_EQ(signalA->signalInfo()->placementNodeId, "A");
    EXPECT_EQ(signalA->position(), QPointF(0, 100));
}

TEST(SignalPlacementPlanner, LinearTrackGetsNoSignals) {
    StationNetwork network;
    buildLinear(network);
    SignalPlacementPlanner planner(network);

    EXPECT_TRUE(planner.placeSignals(500).isEmpty());
    EXPECT_TRUE(network.signalIds().isEmpty());
}

TEST(SignalPlacementPlanner, ChainedMergesGetTwoSignalsPerZone) {
    StationNetwork network;
    buildChainedMerges(network);
    SignalPlacementPlanner planner(network);

    const QStringList signalIds = planner.placeSignals(500);

    EXPECT_EQ(signalIds.size(), 4);
    for (const QString& zoneId : network.conflictZoneIds()) {
        EXPECT_EQ(signalsProtecting(network, zoneId), network.inDegree(zoneId)) << zoneId.toStdString();
    }
    EXPECT_EQ(signalsProtecting(network, "M1"), 2);
    EXPECT_EQ(signalsProtecting(network, "M2"), 2);
}

TEST(SignalPlacementPlanner, ShortApproachStaysInsideSegments) {
    StationNetwork network;
    buildShortApproach(network);
    SignalPlacementPlanner planner(network);

    const QStringList signalIds = planner.placeSignals(500);

    ASSERT_EQ(signalIds, (QStringList{"SIG_MID_CDL", "SIG_OTHER_CDL"}));

    const auto& viaMid = network.node("SIG_MID_CDL")->signalInfo();
    EXPECT_EQ(viaMid->placementNodeId, "MID");
    EXPECT_DOUBLE_EQ(viaMid->offsetFromPlacement, 500.0);

    const auto& viaOther = network.node("SIG_OTHER_CDL")->signalInfo();
    EXPECT_EQ(viaOther->placementNodeId, "OTHER");
    EXPECT_DOUBLE_EQ(viaOther->offsetFromPlacement, 500.0);

    for (const QString& signalId : signalIds) {
        EXPECT_DOUBLE_EQ(network.node(signalId)->signalInfo()->distanceToCdl, 500.0);
    }
}

TEST(SignalPlacementPlanner, ApproachShorterThanDistanceUsesOriginWithZeroOffset) {
    StationNetwork network;
    buildSimpleMerge(network);
    SignalPlacementPlanner planner(network);

    planner.placeSignals(800);

    const auto& info = network.node("SIG_A_M")->signalInfo();
    EXPECT_EQ(info->placementNodeId, "A");
    EXPECT_DOUBLE_EQ(info->offsetFromPlacement, 0.0);
    EXPECT_DOUBLE_EQ(info->distanceToCdl, 800.0);
}

TEST(SignalPlacementPlanner, RerunCreatesNoNewSignals) {
    StationNetwork network;
    buildChainedMerges(network);
    SignalPlacementPlanner planner(network);

    EXPECT_EQ(planner.placeSignals(500).size(), 4);
    EXPECT_TRUE(planner.placeSignals(500).isEmpty());
    EXPECT_EQ(network.signalIds().size(), 4);
}

TEST(SignalPlacementPlanner, UnreachableApproachIsSkipped) {
    StationNetwork network;
    addNode(network, "A", NodeRole::TRACK);
    addNode(network, "Z", NodeRole::SWITCH);
    addEdge(network, "A", "Z", 600);
    addEdge(network, "Z", "Z", 100);

    SignalPlacementPlanner planner(network);
    QStringList skipped;
    int placedCount = 0;
    QObject::connect(&planner, &SignalPlacementPlanner::approachSkipped,
                     [&skipped](const QString& zoneId, const QString& approachNodeId) {
                         skipped.append(approachNodeId + "->" + zoneId);
                     });
    QObject::connect(&planner, &SignalPlacementPlanner::signalPlaced,
                     [&placedCount](const QString&, const QString&, const QString&, const QString&) {
                         placedCount++;
                     });

    const QStringList signalIds = planner.placeSignals(500);

    EXPECT_EQ(signalIds, QStringList{"SIG_A_Z"});
    EXPECT_EQ(placedCount, 1);
    EXPECT_EQ(skipped, QStringList{"Z->Z"});
    ASSERT_EQ(planner.lastSkippedApproaches().size(), 1);
    EXPECT_EQ(planner.lastSkippedApproaches().first().zoneId, "Z");
    EXPECT_LT(signalsProtecting(network, "Z"), network.inDegree("Z"));
}

TEST(SignalPlacementPlanner, ExistingNodeWithSignalIdIsLeftAlone) {
    StationNetwork network;
    buildSimpleMerge(network);
    addNode(network, "SIG_A_M", NodeRole::PLATFORM, 7, 7);
    SignalPlacementPlanner planner(network);

    EXPECT_EQ(planner.placeSignals(500), QStringList{"SIG_B_M"});
    EXPECT_EQ(network.node("SIG_A_M")->role(), NodeRole::PLATFORM);
}

TEST(SignalPlacementPlanner, RejectedSettingsKeepPreviousOnes) {
    StationNetwork network;
    buildSimpleMerge(network);
    SignalPlacementPlanner planner(network);

    PlacementSettings noPaths;
    noPaths.maxPathEdges = 0;
    const auto result = planner.setSettings(noPaths);

    EXPECT_TRUE(result.isFailure());
    EXPECT_EQ(result.getErrorCode(), RailCdl::ErrorCode::INVALID_SETTING);
    EXPECT_EQ(planner.settings().maxPathEdges, PlacementSettings::DEFAULT_MAX_PATH_EDGES);
    EXPECT_EQ(planner.placeSignals(500), (QStringList{"SIG_A_M", "SIG_B_M"}));
    EXPECT_TRUE(planner.lastSkippedApproaches().isEmpty());
}

TEST(SignalPlacementPlanner, AcceptedSettingsAreApplied) {
    StationNetwork network;
    buildSimpleMerge(network);
    SignalPlacementPlanner planner(network);

    PlacementSettings settings;
    settings.signalDistanceMeters = 250;
    settings.maxPathEdges = 3;

    EXPECT_TRUE(planner.setSettings(settings).isSuccess());
    EXPECT_DOUBLE_EQ(planner.settings().signalDistanceMeters, 250.0);
    EXPECT_EQ(planner.settings().maxPathEdges, 3);
}

TEST(SignalPlacementPlanner, InvalidConstructorSettingsFallBackToDefaults) {
    StationNetwork network;
    buildSimpleMerge(network);

    PlacementSettings settings;
    settings.signalDistanceMeters = -1;
    SignalPlacementPlanner planner(network, settings);

    EXPECT_DOUBLE_EQ(planner.settings().signalDistanceMeters, PlacementSettings::DEFAULT_SIGNAL_DISTANCE_M);
    EXPECT_EQ(planner.runAnalysis().newSignals.size(), 2);
}

TEST(SignalPlacementPlanner, RunAnalysisUsesConfiguredDistance) {
    StationNetwork network("Test: Analysis");
    buildSimpleMerge(network);

    PlacementSettings settings;
    settings.signalDistanceMeters = 300;
    SignalPlacementPlanner planner(network, settings);

    const AnalysisOutcome outcome = planner.runAnalysis();

    EXPECT_EQ(outcome.conflictZones, QStringList{"M"});
    EXPECT_EQ(outcome.newSignals.size(), 2);
    EXPECT_TRUE(outcome.skippedApproaches.isEmpty());
    EXPECT_EQ(outcome.statistics.signalCount, 2);
    EXPECT_DOUBLE_EQ(network.node("SIG_B_M")->signalInfo()->distanceToCdl, 300.0);
    EXPECT_DOUBLE_EQ(network.node("SIG_B_M")->signalInfo()->offsetFromPlacement, 300.0);

    const QVariantMap map = outcome.toVariantMap();
    EXPECT_EQ(map["cdl_zones"].toStringList(), QStringList{"M"});
    EXPECT_EQ(map["stats"].toMap()["signals"].toInt(), 2);
}

}  // namespace
