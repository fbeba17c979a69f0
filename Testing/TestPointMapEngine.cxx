/*=========================================================================

  Program:   Visualization Toolkit
  Module:    TestPointMapEngine.cxx

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkMapLabelFeature.h"
#include "vtkPointMap.h"
#include "vtkPointMapEngine.h"
#include "vtkPointMapSettings.h"
#include "vtkPointMapTestUtilities.h"
#include "vtkPointMarkerFeature.h"
#include "vtkSpiderfyController.h"
#include "vtkViewportLifecycleManager.h"

#include <vtkCallbackCommand.h>
#include <vtkNew.h>
#include <vtkRenderer.h>

using namespace vtkPointMapTesting;
using vtkPointMapType::Interaction;

namespace
{
struct EngineEvents
{
  int RenderPlanChanges = 0;
  vtkPointMapType::RenderPlanCounts Counts;
  std::vector<std::string> ActivatedIds;
  std::vector<vtkPointMapType::ClusterPreview> Previews;
};

//----------------------------------------------------------------------------
void RecordEngineEvent(vtkObject* vtkNotUsed(caller), unsigned long eventId,
  void* clientData, void* callData)
{
  EngineEvents* events = static_cast<EngineEvents*>(clientData);
  switch (eventId)
  {
    case vtkPointMapEngine::RenderPlanChangedEvent:
      ++events->RenderPlanChanges;
      events->Counts = *static_cast<const vtkPointMapType::RenderPlanCounts*>(callData);
      break;
    case vtkPointMapEngine::PointActivatedEvent:
      events->ActivatedIds.push_back(
        static_cast<const vtkPointMapType::PointFeature*>(callData)->Id);
      break;
    case vtkPointMapEngine::ClusterActivatedEvent:
      events->Previews.push_back(
        *static_cast<const vtkPointMapType::ClusterPreview*>(callData));
      break;
    default:
      break;
  }
}
}

//----------------------------------------------------------------------------
int TestPointMapEngine(int vtkNotUsed(argc), char* vtkNotUsed(argv)[])
{
  // 600 bulk locations on one coordinate, one malformed record
  std::vector<vtkPointMapType::BulkLocation> locations;
  for (int i = 0; i < 600; ++i)
  {
    std::ostringstream id;
    id << i;
    locations.push_back(MakeLocation(id.str(), 20.0, 0.0));
  }
  vtkPointMapType::BulkLocation malformed = MakeLocation("broken", 20.0, 0.0);
  malformed.Coordinates.pop_back();
  locations.push_back(malformed);

  std::vector<vtkPointMapType::FeaturedFactoid> factoids;
  factoids.push_back(MakeFactoid("f1", 20.2, 0.1,
    vtkPointMapType::EvidenceLayer::Documented, 5.0));
  factoids.push_back(MakeFactoid("f2", 19.8, -0.1));
  factoids.push_back(MakeFactoid("f3", 20.0, 0.2,
    vtkPointMapType::EvidenceLayer::Attested, 50.0));

  std::vector<vtkPointMapType::JourneyRoute> routes(2);
  routes[0].Id = "campaign";
  routes[0].Coordinates.push_back({ { 19.8, -0.1 } });
  routes[0].Coordinates.push_back({ { 20.2, 0.1 } });
  routes[1].Id = "degenerate";
  routes[1].Coordinates.push_back({ { 20.0, 0.0 } });

  vtkNew<vtkPointMapEngine> engine;
  engine->GetSettings()->SetMaxUnclusteredPoints(100);
  engine->GetSettings()->SetAnimationDuration(0);
  engine->SetBulkLocations(locations);
  engine->SetFeaturedFactoids(factoids);
  engine->SetJourneyRoutes(routes);

  EngineEvents events;
  vtkNew<vtkCallbackCommand> eventCallback;
  eventCallback->SetCallback(RecordEngineEvent);
  eventCallback->SetClientData(&events);
  engine->AddObserver(vtkPointMapEngine::RenderPlanChangedEvent, eventCallback.GetPointer());
  engine->AddObserver(vtkPointMapEngine::PointActivatedEvent, eventCallback.GetPointer());
  engine->AddObserver(vtkPointMapEngine::ClusterActivatedEvent, eventCallback.GetPointer());

  // Rebuild happens without a map, resources wait for it
  engine->Update();
  vtkPointMapTestAssert(events.RenderPlanChanges == 1, "expected one rebuild");
  vtkPointMapTestAssert(events.Counts.Locations == 600 && events.Counts.Events == 3 &&
      events.Counts.Markers == 3 && events.Counts.Clustered == 600 &&
      events.Counts.Dropped == 1,
    "bad counts: " << events.Counts.Locations << " locations, "
                   << events.Counts.Events << " events, " << events.Counts.Markers
                   << " markers, " << events.Counts.Clustered << " clustered, "
                   << events.Counts.Dropped << " dropped");
  vtkPointMapTestAssert(engine->GetRenderPlan().ClusteringEnabled, "clustering expected");

  engine->Update();
  vtkPointMapTestAssert(events.RenderPlanChanges == 1, "unchanged inputs must not rebuild");

  vtkViewportLifecycleManager* manager = engine->GetLifecycleManager();
  vtkPointMapTestAssert(manager->GetNumberOfFeatures() == 0 &&
      manager->GetNumberOfPendingOperations() == 1,
    "resources must be deferred until a map is ready");

  vtkNew<vtkPointMap> map;
  vtkNew<vtkRenderer> renderer;
  map->SetRenderer(renderer.GetPointer());
  map->SetCenter(0.0, 20.0);
  map->SetZoom(10);
  engine->Attach(map.GetPointer());
  map->Update();

  vtkPointMapTestAssert(manager->IsReady(), "map must be ready");
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("markers") == 3,
    "one marker per featured factoid, got " << manager->GetNumberOfFeatures("markers"));
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("uncertainty") == 2 &&
      manager->FindFeature("uncertainty-factoid-f1") &&
      !manager->FindFeature("uncertainty-factoid-f2"),
    "uncertainty circles for factoids with a radius");
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("routes") == 1 &&
      manager->FindFeature("route-campaign"),
    "routes need two coordinates");
  vtkPointMapTestAssert(manager->FindFeature("clusters"), "missing cluster glyphs");

  // Hovering the cluster shows a preview
  int size[2];
  map->GetViewportSize(size);
  const double center[2] = { 0.5 * size[0], 0.5 * size[1] };
  manager->DispatchInteraction(Interaction::Hover, center);
  vtkPointMapTestAssert(events.Previews.empty(), "preview leaves are fetched asynchronously");
  map->PollingCallback();
  vtkPointMapTestAssert(events.Previews.size() == 1, "expected a cluster preview");
  const vtkPointMapType::ClusterPreview& preview = events.Previews[0];
  vtkPointMapTestAssert(preview.MemberCount == 600 && preview.SampleNames.size() == 5 &&
      preview.SampleNames[0] == "Location 0",
    "bad preview: " << preview.MemberCount << " members");
  vtkMapLabelFeature* previewLabel =
    vtkMapLabelFeature::SafeDownCast(manager->FindFeature("hover-preview"));
  vtkPointMapTestAssert(previewLabel &&
      previewLabel->GetText().find("600 locations") == 0 &&
      previewLabel->GetText().find("+ 595 more (click to zoom)") != std::string::npos,
    "bad preview label");

  manager->DispatchInteraction(Interaction::Hover, center);
  map->PollingCallback();
  vtkPointMapTestAssert(events.Previews.size() == 1, "same cluster must not be fetched twice");

  // Clicking a marker activates its point
  const double f1[2] = { 0.1, 20.2 };
  double f1Display[2];
  vtkPointMapTestAssert(manager->ComputeDisplayCoords(f1, f1Display), "transform");
  vtkPointMapTestAssert(manager->DispatchInteraction(Interaction::Click, f1Display),
    "marker click must be handled");
  vtkPointMapTestAssert(events.ActivatedIds.size() == 1 &&
      events.ActivatedIds[0] == "factoid-f1",
    "expected factoid-f1 to be activated");
  vtkMapLabelFeature* popup =
    vtkMapLabelFeature::SafeDownCast(manager->FindFeature("popup"));
  vtkPointMapTestAssert(popup && popup->GetText().find("Factoid f1") == 0, "bad popup");

  vtkPointMapTestAssert(engine->ActivateFeature("location-7"), "known feature");
  vtkPointMapTestAssert(events.ActivatedIds.size() == 2 &&
      events.ActivatedIds[1] == "location-7",
    "expected location-7 to be activated");
  vtkPointMapTestAssert(!engine->ActivateFeature("location-broken"), "dropped feature");

  // Background click dismisses popups
  const double corner[2] = { 5.0, 5.0 };
  manager->DispatchInteraction(Interaction::Click, corner);
  vtkPointMapTestAssert(!manager->FindFeature("popup") &&
      !manager->FindFeature("hover-preview"),
    "background click must dismiss popups");

  // Clicking the cluster zooms towards it
  manager->DispatchInteraction(Interaction::Click, center);
  map->PollingCallback();
  vtkPointMapTestAssert(map->GetZoom() > 10 && map->GetZoom() <= 16,
    "cluster click must zoom in, zoom is " << map->GetZoom());
  vtkPointMapTestAssert(engine->GetSpiderfyController()->GetState() ==
      vtkPointMapType::SpiderState::Idle,
    "zoom finished");

  // Settings changes rebuild
  engine->GetSettings()->SetShowUncertainty(false);
  engine->Update();
  vtkPointMapTestAssert(events.RenderPlanChanges == 2, "settings change must rebuild");
  vtkPointMapTestAssert(manager->GetNumberOfFeatures("uncertainty") == 0 &&
      manager->GetNumberOfFeatures("markers") == 3,
    "resources must be reinstalled");

  engine->Detach();
  vtkPointMapTestAssert(!manager->IsAttached() && map->GetNumberOfLayers() == 0,
    "detach must release the map");

  // A point activated before the map is ready gets its popup later
  vtkNew<vtkPointMapEngine> earlyEngine;
  earlyEngine->SetFeaturedFactoids(factoids);
  vtkNew<vtkPointMap> earlyMap;
  earlyEngine->Attach(earlyMap.GetPointer());
  earlyEngine->Update();
  vtkViewportLifecycleManager* earlyManager = earlyEngine->GetLifecycleManager();
  vtkPointMapTestAssert(earlyEngine->ActivateFeature("factoid-f1"), "known feature");
  vtkPointMapTestAssert(!earlyManager->FindFeature("popup") &&
      earlyManager->GetNumberOfPendingOperations() == 2,
    "popup must be queued with the resources");

  vtkNew<vtkRenderer> earlyRenderer;
  earlyMap->SetRenderer(earlyRenderer.GetPointer());
  earlyMap->Update();
  popup = vtkMapLabelFeature::SafeDownCast(earlyManager->FindFeature("popup"));
  vtkPointMapTestAssert(popup && popup->GetText().find("Factoid f1") == 0,
    "queued popup must be shown once the map is ready");
  vtkPointMapTestAssert(earlyManager->GetNumberOfPendingOperations() == 0 &&
      earlyManager->GetNumberOfFeatures("markers") == 3,
    "queue must be flushed in order");
  earlyEngine->Detach();

  // Eight nearly coincident locations spider at the deepest cluster zoom
  std::vector<vtkPointMapType::BulkLocation> crowd;
  for (int i = 0; i < 8; ++i)
  {
    std::ostringstream id;
    id << "crowd-" << i;
    crowd.push_back(MakeLocation(id.str(), i * 0.00001, 0.0));
  }

  vtkNew<vtkPointMapEngine> spiderEngine;
  spiderEngine->GetSettings()->SetClusterThresholdCount(0);
  spiderEngine->GetSettings()->SetMaxUnclusteredPoints(0);
  spiderEngine->GetSettings()->SetAnimationDuration(0);
  spiderEngine->SetBulkLocations(crowd);

  vtkNew<vtkPointMap> spiderMap;
  vtkNew<vtkRenderer> spiderRenderer;
  spiderMap->SetRenderer(spiderRenderer.GetPointer());
  spiderMap->SetCenter(0.0, 0.0);
  spiderMap->SetZoom(16);
  spiderEngine->Attach(spiderMap.GetPointer());
  spiderEngine->Update();
  spiderMap->Update();

  vtkViewportLifecycleManager* spiderManager = spiderEngine->GetLifecycleManager();
  spiderMap->GetViewportSize(size);
  const double spiderCenter[2] = { 0.5 * size[0], 0.5 * size[1] };
  spiderManager->DispatchInteraction(Interaction::Click, spiderCenter);
  spiderMap->PollingCallback();
  spiderMap->PollingCallback();
  vtkPointMapTestAssert(spiderManager->GetNumberOfFeatures("spider") == 9 &&
      spiderEngine->GetSpiderfyController()->GetState() ==
        vtkPointMapType::SpiderState::Spidered,
    "expected legs and 8 spider markers, got "
      << spiderManager->GetNumberOfFeatures("spider"));

  // Hovering a spider marker hides the cluster preview
  spiderManager->DispatchInteraction(Interaction::Hover, spiderCenter);
  spiderMap->PollingCallback();
  vtkPointMapTestAssert(spiderManager->FindFeature("hover-preview"),
    "hovering the cluster must show a preview");

  vtkPointMarkerFeature* spiderMarker = vtkPointMarkerFeature::SafeDownCast(
    spiderManager->FindFeature("spider-marker-0"));
  double markerDisplay[2];
  vtkPointMapTestAssert(spiderMarker &&
      spiderMarker->ComputeDisplayPosition(markerDisplay),
    "missing spider marker");
  vtkPointMapTestAssert(
    spiderManager->DispatchInteraction(Interaction::Hover, markerDisplay),
    "spider hover must be handled");
  vtkPointMapTestAssert(!spiderManager->FindFeature("hover-preview"),
    "hovering a spider marker must hide the preview");
  vtkPointMapTestAssert(spiderManager->GetNumberOfFeatures("spider") == 9,
    "hovering must keep the spider");

  // Changing the view through the API removes the spider
  spiderMap->SetZoom(15);
  vtkPointMapTestAssert(spiderManager->GetNumberOfFeatures("spider") == 0 &&
      spiderEngine->GetSpiderfyController()->GetState() ==
        vtkPointMapType::SpiderState::Idle,
    "zoom change must remove the spider");
  spiderEngine->Detach();

  return EXIT_SUCCESS;
}
