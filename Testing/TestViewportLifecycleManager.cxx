/*=========================================================================

  Program:   Visualization Toolkit
  Module:    TestViewportLifecycleManager.cxx

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkFeatureLayer.h"
#include "vtkInteractorStylePointMap.h"
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

using namespace vtkPointMapTesting;
using vtkPointMapType::Interaction;
using vtkPointMapType::PickResult;

namespace
{
//----------------------------------------------------------------------------
void CountEvent(vtkObject* vtkNotUsed(caller), unsigned long vtkNotUsed(eventId),
  void* clientData, void* vtkNotUsed(callData))
{
  ++(*static_cast<int*>(clientData));
}

//----------------------------------------------------------------------------
void InvalidateSpider(vtkObject* vtkNotUsed(caller),
  unsigned long vtkNotUsed(eventId), void* clientData, void* vtkNotUsed(callData))
{
  static_cast<vtkSpiderfyController*>(clientData)->Invalidate();
}

struct RenderPassRecord
{
  vtkViewportLifecycleManager* Manager;
  std::vector<std::size_t> SpiderCounts;
};

//----------------------------------------------------------------------------
void RecordRenderPass(vtkObject* vtkNotUsed(caller),
  unsigned long vtkNotUsed(eventId), void* clientData, void* vtkNotUsed(callData))
{
  RenderPassRecord* record = static_cast<RenderPassRecord*>(clientData);
  record->SpiderCounts.push_back(record->Manager->GetNumberOfFeatures("spider"));
}

//----------------------------------------------------------------------------
vtkSmartPointer<vtkPointMarkerFeature> MakeMarker(double lon, double lat)
{
  vtkSmartPointer<vtkPointMarkerFeature> marker =
    vtkSmartPointer<vtkPointMarkerFeature>::New();
  marker->SetPointFeature(MakePoint("marker", lon, lat));
  return marker;
}
}

//----------------------------------------------------------------------------
int TestViewportLifecycleManager(int vtkNotUsed(argc), char* vtkNotUsed(argv)[])
{
  vtkNew<vtkViewportLifecycleManager> manager;
  manager->RegisterCategory("routes");
  manager->RegisterCategory("markers");
  manager->RegisterCategory("markers");
  manager->SetMaxReadyRetries(3);

  // Safe while detached
  manager->Detach();
  vtkPointMapTestAssert(!manager->IsAttached() && !manager->IsReady(),
    "manager starts detached");
  vtkPointMapTestAssert(manager->GetZoom() == 0, "detached zoom");
  const double latLng[2] = { 0.0, 0.0 };
  double display[2];
  vtkPointMapTestAssert(!manager->ComputeDisplayCoords(latLng, display),
    "no transformation while detached");

  int notReadyEvents = 0;
  vtkNew<vtkCallbackCommand> notReadyCallback;
  notReadyCallback->SetCallback(CountEvent);
  notReadyCallback->SetClientData(&notReadyEvents);
  manager->AddObserver(vtkViewportLifecycleManager::RendererNotReadyEvent,
    notReadyCallback.GetPointer());

  // Map without a renderer is never ready
  vtkNew<vtkPointMap> map;
  manager->Attach(map.GetPointer());
  manager->Attach(map.GetPointer());
  vtkPointMapTestAssert(manager->IsAttached() && !manager->IsReady(),
    "map without renderer must not be ready");

  std::vector<std::string> log;
  manager->RunWhenReady("first", [&log]() { log.push_back("first-stale"); });
  manager->RunWhenReady("first", [&log]() { log.push_back("first"); });
  vtkPointMapTestAssert(log.empty() && manager->GetNumberOfPendingOperations() == 1,
    "operations must be queued and coalesced by name");

  vtkObject::GlobalWarningDisplayOff();
  manager->RunWhenReady("second", [&log]() { log.push_back("second"); });
  for (int i = 0; i < 5; ++i)
  {
    map->PollingCallback();
  }
  vtkPointMapTestAssert(notReadyEvents == 1,
    "not-ready diagnostic must be raised exactly once, got " << notReadyEvents);
  vtkSmartPointer<vtkPointMarkerFeature> early = MakeMarker(0.0, 0.0);
  const bool earlyAdded = manager->AddFeature("markers", "marker-early", early);
  vtkObject::GlobalWarningDisplayOn();
  vtkPointMapTestAssert(!earlyAdded, "features cannot be added before ready");
  vtkPointMapTestAssert(log.empty() && manager->GetNumberOfPendingOperations() == 2,
    "queued operations must stay queued");

  // Becoming ready flushes the queue in order
  vtkNew<vtkRenderer> renderer;
  map->SetRenderer(renderer.GetPointer());
  map->SetCenter(0.0, 0.0);
  map->SetZoom(16);
  map->Update();
  vtkPointMapTestAssert(manager->IsReady(), "map must be ready");
  vtkPointMapTestAssert(log.size() == 2 && log[0] == "first" && log[1] == "second",
    "queued operations must run in order once ready");
  vtkPointMapTestAssert(manager->GetNumberOfPendingOperations() == 0, "queue must be empty");
  vtkPointMapTestAssert(map->GetNumberOfLayers() == 2, "one layer per category");

  manager->RunWhenReady("third", [&log]() { log.push_back("third"); });
  vtkPointMapTestAssert(log.size() == 3, "operations run immediately when ready");

  // Remove before add
  vtkSmartPointer<vtkPointMarkerFeature> first = MakeMarker(0.0, 0.0);
  vtkSmartPointer<vtkPointMarkerFeature> second = MakeMarker(0.0, 0.0);
  vtkPointMapTestAssert(manager->AddFeature("markers", "marker-1", first),
    "add must succeed when ready");
  vtkPointMapTestAssert(manager->AddFeature("markers", "marker-1", second),
    "re-adding a key must succeed");
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("markers") == 1 &&
      manager->FindFeature("marker-1") == second.GetPointer() &&
      first->GetLayer() == nullptr,
    "previous resource must be removed first");
  vtkObject::GlobalWarningDisplayOff();
  const bool unknownAdded = manager->AddFeature("nowhere", "marker-2", first);
  vtkObject::GlobalWarningDisplayOn();
  vtkPointMapTestAssert(!unknownAdded, "unknown category must be rejected");
  vtkPointMapTestAssert(!manager->RemoveFeature("marker-2"), "unknown key");

  manager->AddFeature("markers", "marker-2", MakeMarker(10.0, 10.0));
  vtkPointMapTestAssert(manager->GetNumberOfFeatures() == 2, "two resources expected");
  manager->ClearCategory("markers");
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("markers") == 0 &&
      !manager->FindFeature("marker-1"),
    "clear must remove all resources of the category");

  // Subscription table
  manager->AddFeature("markers", "marker-1", MakeMarker(0.0, 0.0));
  std::vector<PickResult> clicks;
  int backgroundClicks = 0;
  int backgroundHovers = 0;
  std::vector<vtkViewportLifecycleManager::Subscription> subscriptions;
  subscriptions.push_back({ "markers", Interaction::Click,
    [&clicks](const PickResult& result) { clicks.push_back(result); } });
  subscriptions.push_back({ "background", Interaction::Click,
    [&backgroundClicks](const PickResult&) { ++backgroundClicks; } });
  subscriptions.push_back({ "background", Interaction::Hover,
    [&backgroundHovers](const PickResult&) { ++backgroundHovers; } });
  manager->SetSubscriptions(subscriptions);

  int size[2];
  map->GetViewportSize(size);
  double center[2] = { 0.5 * size[0], 0.5 * size[1] };
  map->InvokeEvent(vtkPointMap::DisplayClickEvent, center);
  vtkPointMapTestAssert(clicks.size() == 1 && clicks[0].Category == "markers" &&
      clicks[0].FeatureKey == "marker-1",
    "click on a marker must reach the markers handler");
  vtkPointMapTestAssert(backgroundClicks == 0, "marker click is not a background click");

  manager->DispatchInteraction(Interaction::Hover, center);
  vtkPointMapTestAssert(backgroundHovers == 0, "hit content consumes the hover");

  double corner[2] = { 5.0, 5.0 };
  map->InvokeEvent(vtkPointMap::DisplayClickEvent, corner);
  vtkPointMapTestAssert(backgroundClicks == 1 && clicks.size() == 1,
    "click on empty space must reach the background handler");

  manager->ClearSubscriptions();
  vtkPointMapTestAssert(!manager->DispatchInteraction(Interaction::Click, center),
    "no handler without subscriptions");

  // Panning while spidered removes the spider before the new render pass
  vtkNew<vtkPointClusterLayer> clusterLayer;
  manager->RegisterCategory("clusters", clusterLayer.GetPointer());
  vtkNew<vtkSpiderfyController> controller;
  controller->SetLifecycleManager(manager.GetPointer());
  controller->SetClusterLayer(clusterLayer.GetPointer());
  vtkPointMapTestAssert(clusterLayer->GetMap() == map.GetPointer(),
    "late categories must be attached to the map");

  vtkNew<vtkCallbackCommand> invalidateCallback;
  invalidateCallback->SetCallback(InvalidateSpider);
  invalidateCallback->SetClientData(controller.GetPointer());
  manager->AddObserver(
    vtkPointMap::UserInteractionEvent, invalidateCallback.GetPointer());

  vtkPointClusterIndex* index = clusterLayer->GetIndex();
  index->SetMaxUnclusteredPoints(0);
  index->Build(MakeGrid(0.0, 0.0, 1, 8, 0.00001));
  std::vector<vtkPointMapType::ClusterInfo> clusters;
  index->GetClusters(16, clusters);
  vtkPointMapTestAssert(clusters.size() == 1, "expected one cluster");
  controller->ActivateCluster(clusters[0].ClusterId);
  map->PollingCallback();
  map->PollingCallback();
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("spider") == 9,
    "expected legs and 8 spider markers");

  RenderPassRecord record;
  record.Manager = manager.GetPointer();
  vtkNew<vtkCallbackCommand> renderPassCallback;
  renderPassCallback->SetCallback(RecordRenderPass);
  renderPassCallback->SetClientData(&record);
  map->AddObserver(vtkCommand::UpdateEvent, renderPassCallback.GetPointer());

  map->GetInteractorStyle()->PanMap(25.0, 0.0);
  vtkPointMapTestAssert(!record.SpiderCounts.empty(), "pan must redraw the map");
  vtkPointMapTestAssert(record.SpiderCounts[0] == 0,
    "spider must be gone before the pan is drawn");
  vtkPointMapTestAssert(
    controller->GetState() == vtkPointMapType::SpiderState::Idle, "controller idle");

  // Detach releases everything, attach is idempotent
  const std::size_t layersBefore = map->GetNumberOfLayers();
  manager->Attach(map.GetPointer());
  vtkPointMapTestAssert(map->GetNumberOfLayers() == layersBefore,
    "attaching twice must not duplicate layers");
  manager->Detach();
  manager->Detach();
  vtkPointMapTestAssert(!manager->IsAttached() && map->GetNumberOfLayers() == 0 &&
      manager->GetNumberOfFeatures() == 0 && manager->GetNumberOfSubscriptions() == 0,
    "detach must release all resources");

  // Reattaching restores every category
  manager->Attach(map.GetPointer());
  vtkPointMapTestAssert(manager->IsReady() && map->GetNumberOfLayers() == 4,
    "reattached categories expected");

  return EXIT_SUCCESS;
}
