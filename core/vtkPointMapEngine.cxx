/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointMapEngine.h"
#include "vtkClusterGlyphFeature.h"
#include "vtkCoincidenceJitterer.h"
#include "vtkJourneyRouteFeature.h"
#include "vtkMapLabelFeature.h"
#include "vtkPointClusterIndex.h"
#include "vtkPointClusterLayer.h"
#include "vtkPointFeatureNormalizer.h"
#include "vtkPointMap.h"
#include "vtkPointMapSettings.h"
#include "vtkPointMarkerFeature.h"
#include "vtkRenderPathSelector.h"
#include "vtkSpiderfyController.h"
#include "vtkUncertaintyCircleFeature.h"
#include "vtkViewportLifecycleManager.h"

#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkWeakPointer.h>

#include <algorithm>
#include <sstream>

namespace
{
const char* const RoutesCategory = "routes";
const char* const UncertaintyCategory = "uncertainty";
const char* const ClustersCategory = "clusters";
const char* const MarkersCategory = "markers";
const char* const PopupsCategory = "popups";
const char* const SpiderCategory = "spider";
const char* const BackgroundId = "background";

const char* const PopupKey = "popup";
const char* const HoverPreviewKey = "hover-preview";
}

vtkStandardNewMacro(vtkPointMapEngine);

//----------------------------------------------------------------------------
vtkPointMapEngine::vtkPointMapEngine()
  : Settings(vtkSmartPointer<vtkPointMapSettings>::New())
  , Normalizer(vtkSmartPointer<vtkPointFeatureNormalizer>::New())
  , Jitterer(vtkSmartPointer<vtkCoincidenceJitterer>::New())
  , Selector(vtkSmartPointer<vtkRenderPathSelector>::New())
  , ClusterLayer(vtkSmartPointer<vtkPointClusterLayer>::New())
  , LifecycleManager(vtkSmartPointer<vtkViewportLifecycleManager>::New())
  , SpiderfyController(vtkSmartPointer<vtkSpiderfyController>::New())
{
  this->HoverGeneration = 0;
  this->HoveredClusterId = -1;

  // Bottom to top
  this->LifecycleManager->RegisterCategory(RoutesCategory);
  this->LifecycleManager->RegisterCategory(UncertaintyCategory);
  this->LifecycleManager->RegisterCategory(ClustersCategory, this->ClusterLayer);
  this->LifecycleManager->RegisterCategory(MarkersCategory);
  this->SpiderfyController->SetLifecycleManager(this->LifecycleManager);
  this->SpiderfyController->SetClusterLayer(this->ClusterLayer);
  this->LifecycleManager->RegisterCategory(PopupsCategory);

  this->InteractionObserverTag =
    this->LifecycleManager->AddObserver(vtkPointMap::UserInteractionEvent, this,
      &vtkPointMapEngine::OnUserInteraction);
}

//----------------------------------------------------------------------------
vtkPointMapEngine::~vtkPointMapEngine()
{
  this->LifecycleManager->RemoveObserver(this->InteractionObserverTag);
  this->SpiderfyController->SetLifecycleManager(nullptr);
  this->LifecycleManager->Detach();
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Bulk Locations: " << this->BulkLocations.size() << "\n"
     << indent << "Featured Factoids: " << this->FeaturedFactoids.size() << "\n"
     << indent << "Journey Routes: " << this->JourneyRoutes.size() << "\n"
     << indent << "Features: " << this->Features.size() << "\n"
     << indent << "Markers: " << this->Counts.Markers << "\n"
     << indent << "Clustered: " << this->Counts.Clustered << "\n"
     << indent << "Dropped: " << this->Counts.Dropped << "\n"
     << indent << "Settings:\n";
  this->Settings->PrintSelf(os, indent.GetNextIndent());
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::SetBulkLocations(
  const std::vector<vtkPointMapType::BulkLocation>& locations)
{
  this->BulkLocations = locations;
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::SetFeaturedFactoids(
  const std::vector<vtkPointMapType::FeaturedFactoid>& factoids)
{
  this->FeaturedFactoids = factoids;
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::SetJourneyRoutes(
  const std::vector<vtkPointMapType::JourneyRoute>& routes)
{
  this->JourneyRoutes = routes;
  this->Modified();
}

//----------------------------------------------------------------------------
vtkPointMapSettings* vtkPointMapEngine::GetSettings()
{
  return this->Settings;
}

//----------------------------------------------------------------------------
vtkViewportLifecycleManager* vtkPointMapEngine::GetLifecycleManager()
{
  return this->LifecycleManager;
}

//----------------------------------------------------------------------------
vtkSpiderfyController* vtkPointMapEngine::GetSpiderfyController()
{
  return this->SpiderfyController;
}

//----------------------------------------------------------------------------
vtkPointClusterLayer* vtkPointMapEngine::GetClusterLayer()
{
  return this->ClusterLayer;
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::Attach(vtkPointMap* map)
{
  this->SpiderfyController->Invalidate();
  this->LifecycleManager->Attach(map);

  // Content of a previous map was released on detach
  if (map && this->BuildTime.GetMTime() > 0)
  {
    this->QueueResources();
  }
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::Detach()
{
  this->SpiderfyController->Invalidate();
  this->LifecycleManager->Detach();
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::Update()
{
  const vtkMTimeType modified =
    std::max(this->GetMTime(), this->Settings->GetMTime());
  if (modified > this->BuildTime.GetMTime())
  {
    this->Rebuild();
  }

  this->LifecycleManager->Update();
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::Rebuild()
{
  vtkPointMapSettings* settings = this->Settings;

  std::vector<vtkPointMapType::PointFeature> normalized;
  this->Normalizer->Normalize(
    this->BulkLocations, this->FeaturedFactoids, normalized);

  this->Jitterer->SetBaseRadius(settings->GetJitterBaseRadiusDegrees());
  this->Jitterer->SetCapFactor(settings->GetJitterCapFactor());
  this->Jitterer->SetCoordinatePrecision(settings->GetCoordinatePrecision());
  this->Jitterer->Jitter(normalized, this->Features);

  this->Selector->SetMaxFeaturedMarkers(settings->GetMaxFeaturedMarkers());
  this->Selector->SetMaxDomMarkers(settings->GetMaxDomMarkers());
  this->Selector->SetClusterThresholdCount(settings->GetClusterThresholdCount());
  this->Selector->SetMaxUnclusteredPoints(settings->GetMaxUnclusteredPoints());
  this->Selector->Select(this->Features, this->Plan);

  std::vector<vtkPointMapType::JitteredFeature> clustered;
  clustered.reserve(this->Plan.ClusteredSet.size());
  for (vtkIdType index : this->Plan.ClusteredSet)
  {
    clustered.push_back(this->Features[static_cast<size_t>(index)]);
  }

  // Results of queries against the previous index are meaningless
  this->SpiderfyController->Invalidate();
  this->ClusterLayer->CancelPendingRequests();
  ++this->HoverGeneration;
  this->HoveredClusterId = -1;

  vtkPointClusterIndex* index = this->ClusterLayer->GetIndex();
  index->SetClusterRadius(settings->GetClusterRadiusPixels());
  index->SetMaxClusterZoom(settings->GetMaxClusterZoom());
  index->SetMaxUnclusteredPoints(settings->GetMaxUnclusteredPoints());
  index->Build(clustered);

  this->SpiderfyController->SetMaxSpiderMarkers(settings->GetMaxSpiderMarkers());
  this->LifecycleManager->SetMaxReadyRetries(settings->GetMaxReadyRetries());

  this->Counts.Locations = this->Normalizer->GetNumberOfLocations();
  this->Counts.Events = this->Normalizer->GetNumberOfFactoids();
  this->Counts.Clustered = static_cast<vtkIdType>(this->Plan.ClusteredSet.size());
  this->Counts.Markers = static_cast<vtkIdType>(this->Plan.DomMarkerSet.size());
  this->Counts.Dropped = this->Normalizer->GetNumberOfDroppedRecords();

  this->BuildTime.Modified();
  this->QueueResources();

  vtkDebugMacro("Rebuilt " << this->Features.size() << " features: "
                           << this->Counts.Markers << " markers, "
                           << this->Counts.Clustered << " clustered");
  this->InvokeEvent(RenderPlanChangedEvent, &this->Counts);
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::QueueResources()
{
  vtkWeakPointer<vtkPointMapEngine> self(this);
  this->LifecycleManager->RunWhenReady("resources", [self]() {
    if (self)
    {
      self->InstallResources();
    }
  });
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::InstallResources()
{
  vtkViewportLifecycleManager* manager = this->LifecycleManager;
  vtkPointMapSettings* settings = this->Settings;

  manager->ClearSubscriptions();
  manager->ClearCategory(RoutesCategory);
  manager->ClearCategory(UncertaintyCategory);
  manager->ClearCategory(ClustersCategory);
  manager->ClearCategory(MarkersCategory);
  manager->ClearCategory(PopupsCategory);

  for (const auto& route : this->JourneyRoutes)
  {
    if (route.Coordinates.size() < 2)
    {
      vtkDebugMacro("Skipping route " << route.Id << " with less than 2 points");
      continue;
    }
    vtkNew<vtkJourneyRouteFeature> feature;
    feature->SetRoute(route);
    manager->AddFeature(RoutesCategory, "route-" + route.Id, feature.GetPointer());
  }

  for (vtkIdType index : this->Plan.DomMarkerSet)
  {
    const vtkPointMapType::JitteredFeature& point =
      this->Features[static_cast<size_t>(index)];

    vtkNew<vtkPointMarkerFeature> marker;
    marker->SetPointFeature(point);
    manager->AddFeature(MarkersCategory, "marker-" + point.Id, marker.GetPointer());

    if (settings->GetShowUncertainty() &&
      point.Kind == vtkPointMapType::FeatureKind::FeaturedFactoid &&
      point.UncertaintyRadiusKm > 0.0)
    {
      vtkNew<vtkUncertaintyCircleFeature> circle;
      circle->SetCenter(point.OriginalPosition[0], point.OriginalPosition[1]);
      circle->SetRadiusKm(point.UncertaintyRadiusKm);
      circle->SetColor(vtkPointMapType::EvidenceLayerColor(point.Layer));
      manager->AddFeature(
        UncertaintyCategory, "uncertainty-" + point.Id, circle.GetPointer());
    }
  }

  vtkNew<vtkClusterGlyphFeature> clusters;
  clusters->SetIndex(this->ClusterLayer->GetIndex());
  manager->AddFeature(ClustersCategory, "clusters", clusters.GetPointer());

  manager->SetAnimationDuration(settings->GetAnimationDuration());

  using vtkPointMapType::Interaction;
  using vtkPointMapType::PickResult;
  vtkWeakPointer<vtkPointMapEngine> self(this);
  std::vector<vtkViewportLifecycleManager::Subscription> subscriptions;
  subscriptions.push_back({ ClustersCategory, Interaction::Click,
    [self](const PickResult& result) {
      if (self)
      {
        self->OnClusterClick(result);
      }
    } });
  subscriptions.push_back({ ClustersCategory, Interaction::Hover,
    [self](const PickResult& result) {
      if (self)
      {
        self->OnClusterHover(result);
      }
    } });
  subscriptions.push_back({ MarkersCategory, Interaction::Click,
    [self](const PickResult& result) {
      if (self)
      {
        self->OnMarkerClick(result);
      }
    } });
  subscriptions.push_back({ MarkersCategory, Interaction::Hover,
    [self](const PickResult&) {
      if (self)
      {
        self->HideHoverPreview();
      }
    } });
  subscriptions.push_back({ SpiderCategory, Interaction::Click,
    [self](const PickResult& result) {
      if (self)
      {
        self->OnMarkerClick(result);
      }
    } });
  subscriptions.push_back({ SpiderCategory, Interaction::Hover,
    [self](const PickResult&) {
      if (self)
      {
        self->HideHoverPreview();
      }
    } });
  subscriptions.push_back({ BackgroundId, Interaction::Click,
    [self](const PickResult& result) {
      if (self)
      {
        self->OnBackgroundClick(result);
      }
    } });
  subscriptions.push_back({ BackgroundId, Interaction::Hover,
    [self](const PickResult&) {
      if (self)
      {
        self->HideHoverPreview();
      }
    } });
  manager->SetSubscriptions(subscriptions);

  vtkDebugMacro("Installed " << manager->GetNumberOfFeatures() << " resources");
}

//----------------------------------------------------------------------------
bool vtkPointMapEngine::ActivateFeature(const std::string& id)
{
  auto iter = std::find_if(this->Features.begin(), this->Features.end(),
    [&id](const vtkPointMapType::JitteredFeature& feature) {
      return feature.Id == id;
    });
  if (iter == this->Features.end())
  {
    return false;
  }

  this->ActivatePoint(*iter);
  return true;
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::ActivatePoint(const vtkPointMapType::PointFeature& feature)
{
  this->ActivePoint = feature;

  std::ostringstream text;
  text << (feature.Name.empty() ? feature.Id : feature.Name);
  if (!feature.Category.empty())
  {
    text << "\n" << feature.Category;
  }

  vtkSmartPointer<vtkMapLabelFeature> popup =
    vtkSmartPointer<vtkMapLabelFeature>::New();
  popup->SetText(text.str());
  popup->SetAnchor(feature.Position[0], feature.Position[1]);
  popup->SetDisplayOffset(0.0, 20.0);
  vtkWeakPointer<vtkPointMapEngine> self(this);
  this->LifecycleManager->RunWhenReady(PopupKey, [self, popup]() {
    if (self)
    {
      self->LifecycleManager->AddFeature(PopupsCategory, PopupKey, popup);
    }
  });

  vtkDebugMacro("Activated " << feature.Id);
  this->InvokeEvent(PointActivatedEvent, &this->ActivePoint);
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::DismissPopups()
{
  this->RemoveWhenReady(PopupKey);
  this->HideHoverPreview();
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::HideHoverPreview()
{
  ++this->HoverGeneration;
  this->HoveredClusterId = -1;
  this->RemoveWhenReady(HoverPreviewKey);
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::RemoveWhenReady(const std::string& key)
{
  // Replaces a queued add of the same key
  vtkWeakPointer<vtkPointMapEngine> self(this);
  this->LifecycleManager->RunWhenReady(key, [self, key]() {
    if (self)
    {
      self->LifecycleManager->RemoveFeature(key);
    }
  });
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::OnClusterClick(const vtkPointMapType::PickResult& result)
{
  vtkClusterGlyphFeature* clusters = vtkClusterGlyphFeature::SafeDownCast(
    this->LifecycleManager->FindFeature(result.FeatureKey));
  vtkPointMapType::ClusterInfo info;
  if (!clusters || !clusters->GetDisplayedCluster(result.ItemIndex, info))
  {
    return;
  }

  this->HideHoverPreview();
  if (info.MemberCount == 1)
  {
    const vtkPointMapType::JitteredFeature* feature =
      this->ClusterLayer->GetIndex()->GetFeature(info.FeatureIndex);
    if (feature)
    {
      this->ActivatePoint(*feature);
    }
    return;
  }

  this->SpiderfyController->ActivateCluster(info.ClusterId);
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::OnClusterHover(const vtkPointMapType::PickResult& result)
{
  vtkClusterGlyphFeature* clusters = vtkClusterGlyphFeature::SafeDownCast(
    this->LifecycleManager->FindFeature(result.FeatureKey));
  vtkPointMapType::ClusterInfo info;
  if (!clusters || !clusters->GetDisplayedCluster(result.ItemIndex, info) ||
    info.MemberCount < 2)
  {
    this->HideHoverPreview();
    return;
  }

  if (info.ClusterId == this->HoveredClusterId)
  {
    return;
  }

  this->HideHoverPreview();
  this->HoveredClusterId = info.ClusterId;
  const unsigned long generation = this->HoverGeneration;
  vtkWeakPointer<vtkPointMapEngine> self(this);
  this->ClusterLayer->RequestLeaves(info.ClusterId,
    this->Settings->GetHoverLeafLimit(), 0,
    [self, generation, info](bool success,
      const std::vector<vtkPointMapType::JitteredFeature>& leaves) {
      if (self)
      {
        self->OnHoverLeaves(generation, info, success, leaves);
      }
    });
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::OnHoverLeaves(unsigned long generation,
  const vtkPointMapType::ClusterInfo& info, bool success,
  const std::vector<vtkPointMapType::JitteredFeature>& leaves)
{
  if (generation != this->HoverGeneration)
  {
    return;
  }
  if (!success)
  {
    vtkDebugMacro("Hovered cluster " << info.ClusterId << " no longer exists");
    return;
  }

  this->Preview = vtkPointMapType::ClusterPreview();
  this->Preview.ClusterId = info.ClusterId;
  this->Preview.MemberCount = info.MemberCount;
  const size_t sampleCount = std::min(
    leaves.size(), static_cast<size_t>(this->Settings->GetHoverSampleNames()));
  for (size_t i = 0; i < sampleCount; ++i)
  {
    this->Preview.SampleNames.push_back(
      leaves[i].Name.empty() ? leaves[i].Id : leaves[i].Name);
  }

  std::ostringstream text;
  text << info.MemberCount << " locations";
  for (const auto& name : this->Preview.SampleNames)
  {
    text << "\n" << name;
  }
  const vtkIdType more =
    info.MemberCount - static_cast<vtkIdType>(this->Preview.SampleNames.size());
  if (more > 0)
  {
    text << "\n+ " << more << " more (click to zoom)";
  }

  unsigned char rgb[3];
  double radius = 0.0;
  vtkClusterGlyphFeature::GetClusterStyle(info.MemberCount, rgb, radius);

  vtkSmartPointer<vtkMapLabelFeature> preview =
    vtkSmartPointer<vtkMapLabelFeature>::New();
  preview->SetText(text.str());
  preview->SetAnchor(info.Centroid[0], info.Centroid[1]);
  preview->SetDisplayOffset(0.0, radius + 8.0);
  vtkWeakPointer<vtkPointMapEngine> self(this);
  this->LifecycleManager->RunWhenReady(HoverPreviewKey, [self, preview]() {
    if (self)
    {
      self->LifecycleManager->AddFeature(PopupsCategory, HoverPreviewKey, preview);
    }
  });

  this->InvokeEvent(ClusterActivatedEvent, &this->Preview);
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::OnMarkerClick(const vtkPointMapType::PickResult& result)
{
  vtkPointMarkerFeature* marker = vtkPointMarkerFeature::SafeDownCast(
    this->LifecycleManager->FindFeature(result.FeatureKey));
  if (marker)
  {
    this->ActivatePoint(marker->GetPointFeature());
  }
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::OnBackgroundClick(
  const vtkPointMapType::PickResult& vtkNotUsed(result))
{
  this->SpiderfyController->Invalidate();
  this->DismissPopups();
}

//----------------------------------------------------------------------------
void vtkPointMapEngine::OnUserInteraction(vtkObject* vtkNotUsed(caller),
  unsigned long vtkNotUsed(event), void* vtkNotUsed(data))
{
  this->SpiderfyController->Invalidate();
  this->HideHoverPreview();
}
