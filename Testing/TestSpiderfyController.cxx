/*=========================================================================

  Program:   Visualization Toolkit
  Module:    TestSpiderfyController.cxx

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkMapLabelFeature.h"
#include "vtkPointClusterIndex.h"
#include "vtkPointClusterLayer.h"
#include "vtkPointMap.h"
#include "vtkPointMapTestUtilities.h"
#include "vtkPointMarkerFeature.h"
#include "vtkSpiderfyController.h"
#include "vtkViewportLifecycleManager.h"

#include <vtkCallbackCommand.h>
#include <vtkNew.h>
#include <vtkRenderer.h>

#include <cmath>

using namespace vtkPointMapTesting;
using vtkPointMapType::SpiderState;

namespace
{
//----------------------------------------------------------------------------
void RecordState(vtkObject* vtkNotUsed(caller), unsigned long vtkNotUsed(eventId),
  void* clientData, void* callData)
{
  std::vector<SpiderState>* states = static_cast<std::vector<SpiderState>*>(clientData);
  states->push_back(*static_cast<const SpiderState*>(callData));
}

//----------------------------------------------------------------------------
bool Near(const std::array<double, 2>& point, double x, double y)
{
  return std::abs(point[0] - x) < 1e-9 && std::abs(point[1] - y) < 1e-9;
}

//----------------------------------------------------------------------------
vtkIdType SingleClusterId(vtkPointClusterIndex* index, int zoom)
{
  std::vector<vtkPointMapType::ClusterInfo> clusters;
  index->GetClusters(zoom, clusters);
  return clusters.size() == 1 ? clusters[0].ClusterId : -1;
}
}

//----------------------------------------------------------------------------
int TestSpiderfyController(int vtkNotUsed(argc), char* vtkNotUsed(argv)[])
{
  // Layout
  vtkPointMapType::SpiderLayout layout;
  const double origin[2] = { 100.0, 100.0 };
  vtkSpiderfyController::ComputeLayout(origin, 2, layout);
  vtkPointMapTestAssert(layout.MemberPoints.size() == 2 &&
      Near(layout.MemberPoints[0], 60.0, 100.0) &&
      Near(layout.MemberPoints[1], 140.0, 100.0),
    "two members must be placed left and right");
  vtkSpiderfyController::ComputeLayout(origin, 4, layout);
  vtkPointMapTestAssert(Near(layout.MemberPoints[0], 100.0, 150.0) &&
      Near(layout.MemberPoints[1], 150.0, 100.0) &&
      Near(layout.MemberPoints[2], 100.0, 50.0) &&
      Near(layout.MemberPoints[3], 50.0, 100.0),
    "members must start at the top and run clockwise");
  vtkPointMapTestAssert(vtkSpiderfyController::ComputeRadius(1) == 35.0 &&
      vtkSpiderfyController::ComputeRadius(10) == 80.0 &&
      vtkSpiderfyController::ComputeRadius(120) == 80.0,
    "radius must be min(30 + 5n, 80)");

  // Map with a renderer but no render window: nothing is ever rendered
  vtkNew<vtkPointMap> map;
  vtkNew<vtkRenderer> renderer;
  map->SetRenderer(renderer.GetPointer());
  map->SetCenter(0.0, 0.0);
  map->SetZoom(16);
  map->SetAnimationDuration(0);

  vtkNew<vtkViewportLifecycleManager> manager;
  vtkNew<vtkPointClusterLayer> clusterLayer;
  manager->RegisterCategory("clusters", clusterLayer.GetPointer());
  manager->Attach(map.GetPointer());

  vtkNew<vtkSpiderfyController> controller;
  controller->SetLifecycleManager(manager.GetPointer());
  controller->SetClusterLayer(clusterLayer.GetPointer());

  std::vector<SpiderState> states;
  vtkNew<vtkCallbackCommand> stateCallback;
  stateCallback->SetCallback(RecordState);
  stateCallback->SetClientData(&states);
  controller->AddObserver(
    vtkSpiderfyController::StateChangedEvent, stateCallback.GetPointer());

  map->Update();
  vtkPointMapTestAssert(manager->IsReady(), "map must be ready after the first update");

  vtkPointClusterIndex* index = clusterLayer->GetIndex();
  index->SetMaxUnclusteredPoints(0);

  // 120 members at MaxClusterZoom: 20 spidered plus "+100 more"
  index->Build(MakeGrid(0.0, 0.0, 12, 10, 0.00001));
  vtkIdType clusterId = SingleClusterId(index, 16);
  vtkPointMapTestAssert(clusterId >= 0, "expected one cluster at zoom 16");

  controller->ActivateCluster(clusterId);
  vtkPointMapTestAssert(controller->GetState() == SpiderState::Idle &&
      clusterLayer->GetNumberOfPendingRequests() == 1,
    "expansion zoom must be queried asynchronously");
  map->PollingCallback();
  vtkPointMapTestAssert(controller->GetState() == SpiderState::Idle &&
      clusterLayer->GetNumberOfPendingRequests() == 1,
    "leaves must be queried after the expansion zoom");
  map->PollingCallback();
  vtkPointMapTestAssert(controller->GetState() == SpiderState::Spidered,
    "cluster must be spidered");
  vtkPointMapTestAssert(controller->GetLayout().MemberPoints.size() == 20 &&
      controller->GetLayout().OverflowCount == 100,
    "expected 20 members and 100 overflow");
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("spider") == 22,
    "expected legs, 20 markers and an overflow label, got "
      << manager->GetNumberOfFeatures("spider"));

  vtkMapLabelFeature* overflow =
    vtkMapLabelFeature::SafeDownCast(manager->FindFeature("spider-overflow"));
  vtkPointMapTestAssert(overflow && overflow->GetText() == "+100 more",
    "bad overflow label");

  vtkPointMarkerFeature* marker =
    vtkPointMarkerFeature::SafeDownCast(manager->FindFeature("spider-marker-0"));
  vtkPointMapTestAssert(marker, "missing spider marker");
  double* offset = marker->GetDisplayOffset();
  vtkPointMapTestAssert(std::abs(offset[0]) < 1e-9 && std::abs(offset[1] - 80.0) < 1e-9,
    "first spider marker must sit above the cluster");
  vtkPointMapTestAssert(marker->GetFillColor() == "#b45309" && !marker->GetOutline(),
    "bad spider marker style");
  vtkPointMapTestAssert(manager->FindFeature("spider-legs"), "missing spider legs");

  controller->Invalidate();
  vtkPointMapTestAssert(controller->GetState() == SpiderState::Idle &&
      manager->GetNumberOfFeatures("spider") == 0 &&
      controller->GetLayout().MemberPoints.empty(),
    "invalidate must remove the spider");

  // Two members
  index->Build(MakeGrid(0.0, 0.0, 1, 2, 0.00001));
  controller->ActivateCluster(SingleClusterId(index, 16));
  map->PollingCallback();
  map->PollingCallback();
  vtkPointMapTestAssert(controller->GetState() == SpiderState::Spidered &&
      manager->GetNumberOfFeatures("spider") == 3 &&
      !manager->FindFeature("spider-overflow"),
    "two members need no overflow label");
  marker = vtkPointMarkerFeature::SafeDownCast(manager->FindFeature("spider-marker-0"));
  offset = marker->GetDisplayOffset();
  vtkPointMapTestAssert(std::abs(offset[0] + 40.0) < 1e-9 && std::abs(offset[1]) < 1e-9,
    "first of two members must be on the left");

  // A new activation replaces the spider before anything is queried
  index->Build(MakeGrid(0.0, 0.0, 1, 5, 0.00001));
  clusterId = SingleClusterId(index, 16);
  controller->ActivateCluster(clusterId);
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("spider") == 0,
    "previous spider must be torn down first");
  controller->ActivateCluster(clusterId);
  map->PollingCallback();
  map->PollingCallback();
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("spider") == 6,
    "superseded activation must not add content, got "
      << manager->GetNumberOfFeatures("spider"));

  // Stale generation
  controller->ActivateCluster(clusterId);
  controller->Invalidate();
  map->PollingCallback();
  vtkPointMapTestAssert(clusterLayer->GetNumberOfPendingRequests() == 0,
    "stale expansion zoom must not query leaves");
  vtkPointMapTestAssert(controller->GetState() == SpiderState::Idle &&
      manager->GetNumberOfFeatures("spider") == 0,
    "stale results must be discarded");

  // Async failure: the index was rebuilt while the query was pending
  controller->ActivateCluster(clusterId);
  index->Build(MakeGrid(0.0, 0.0, 1, 5, 0.00001));
  vtkObject::GlobalWarningDisplayOff();
  map->PollingCallback();
  map->PollingCallback();
  vtkObject::GlobalWarningDisplayOn();
  vtkPointMapTestAssert(controller->GetState() == SpiderState::Idle &&
      manager->GetNumberOfFeatures("spider") == 0,
    "failed query must leave the controller idle without a spider");

  // Unknown ids are ignored
  controller->ActivateCluster(clusterId);
  vtkPointMapTestAssert(clusterLayer->GetNumberOfPendingRequests() == 0 &&
      controller->GetState() == SpiderState::Idle,
    "unknown cluster must be ignored");

  // Zoom to expand
  map->SetZoom(10);
  index->Build(MakeGrid(0.0, 0.0, 1, 10, 0.001));
  clusterId = SingleClusterId(index, 10);
  vtkPointMapTestAssert(clusterId >= 0, "expected one cluster at zoom 10");
  const int expansion = index->GetExpansionZoom(clusterId);
  vtkPointMapTestAssert(expansion > 10, "cluster must expand beyond zoom 10");

  states.clear();
  controller->ActivateCluster(clusterId);
  map->PollingCallback();
  vtkPointMapTestAssert(states.size() == 2 && states[0] == SpiderState::Zooming &&
      states[1] == SpiderState::Idle,
    "expected Zooming then Idle");
  vtkPointMapTestAssert(map->GetZoom() == expansion,
    "map must zoom to " << expansion << ", zoom is " << map->GetZoom());
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("spider") == 0,
    "zooming must not spider");

  // An animation superseded by invalidation returns to Idle
  map->SetZoom(10);
  map->SetAnimationDuration(10000);
  index->Build(MakeGrid(0.0, 0.0, 1, 10, 0.001));
  controller->ActivateCluster(SingleClusterId(index, 10));
  map->PollingCallback();
  vtkPointMapTestAssert(
    controller->GetState() == SpiderState::Zooming && map->IsAnimating(),
    "expected an animation in progress");
  controller->Invalidate();
  vtkPointMapTestAssert(
    controller->GetState() == SpiderState::Idle && !map->IsAnimating(),
    "invalidate must supersede the animation");

  return EXIT_SUCCESS;
}
