/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkSpiderfyController.h"
#include "vtkMapLabelFeature.h"
#include "vtkPointClusterIndex.h"
#include "vtkPointClusterLayer.h"
#include "vtkPointMap.h"
#include "vtkPointMarkerFeature.h"
#include "vtkSpiderLegFeature.h"
#include "vtkViewportLifecycleManager.h"

#include <vtkMath.h>
#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkWeakPointer.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>

namespace
{
const char* const SpiderCategory = "spider";
const char* const SpiderColor = "#b45309";
const double SpiderMarkerSize = 24.0;
}

vtkStandardNewMacro(vtkSpiderfyController);

//----------------------------------------------------------------------------
vtkSpiderfyController::vtkSpiderfyController()
{
  this->MaxSpiderMarkers = 20;
  this->State = vtkPointMapType::SpiderState::Idle;
  this->Generation = 0;
}

//----------------------------------------------------------------------------
vtkSpiderfyController::~vtkSpiderfyController()
{
  this->SetLifecycleManager(nullptr);
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "MaxSpiderMarkers: " << this->MaxSpiderMarkers << "\n"
     << indent << "State: " << static_cast<int>(this->State) << "\n"
     << indent << "Generation: " << this->Generation << "\n"
     << indent << "ActiveClusterId: " << this->ActiveCluster.ClusterId << "\n"
     << indent << "Spider Members: " << this->Layout.MemberPoints.size()
     << std::endl;
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::SetLifecycleManager(
  vtkViewportLifecycleManager* manager)
{
  if (this->LifecycleManager == manager)
  {
    return;
  }

  if (this->LifecycleManager)
  {
    this->Invalidate();
    for (unsigned long tag : this->ObserverTags)
    {
      this->LifecycleManager->RemoveObserver(tag);
    }
    this->ObserverTags.clear();
  }

  this->LifecycleManager = manager;
  if (manager)
  {
    manager->RegisterCategory(SpiderCategory);
    this->ObserverTags.push_back(manager->AddObserver(
      vtkPointMap::AnimationCompleteEvent, this,
      &vtkSpiderfyController::OnAnimationEnded));
    this->ObserverTags.push_back(manager->AddObserver(
      vtkPointMap::AnimationCancelledEvent, this,
      &vtkSpiderfyController::OnAnimationEnded));
  }
  this->Modified();
}

//----------------------------------------------------------------------------
vtkViewportLifecycleManager* vtkSpiderfyController::GetLifecycleManager()
{
  return this->LifecycleManager;
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::SetClusterLayer(vtkPointClusterLayer* layer)
{
  if (this->ClusterLayer == layer)
  {
    return;
  }
  this->Invalidate();
  this->ClusterLayer = layer;
  this->Modified();
}

//----------------------------------------------------------------------------
vtkPointClusterLayer* vtkSpiderfyController::GetClusterLayer()
{
  return this->ClusterLayer;
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::SetState(vtkPointMapType::SpiderState state)
{
  if (this->State == state)
  {
    return;
  }
  vtkDebugMacro("State " << static_cast<int>(this->State) << " -> "
                         << static_cast<int>(state));
  this->State = state;
  this->InvokeEvent(StateChangedEvent, &this->State);
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::ActivateCluster(vtkIdType clusterId)
{
  this->Invalidate();

  if (!this->LifecycleManager || !this->ClusterLayer)
  {
    vtkErrorMacro("Lifecycle manager and cluster layer must be set"
      << " before activating clusters");
    return;
  }

  vtkPointMapType::ClusterInfo info;
  if (!this->ClusterLayer->GetIndex()->GetClusterInfo(clusterId, info))
  {
    vtkDebugMacro("Ignoring unknown cluster " << clusterId);
    return;
  }
  this->ActiveCluster = info;

  const unsigned long generation = this->Generation;
  vtkWeakPointer<vtkSpiderfyController> self(this);
  this->ClusterLayer->RequestExpansionZoom(
    clusterId, [self, generation](bool success, int zoom) {
      if (self)
      {
        self->OnExpansionZoom(generation, success, zoom);
      }
    });
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::Invalidate()
{
  ++this->Generation;

  if (this->LifecycleManager)
  {
    this->LifecycleManager->StopAnimation();
    this->LifecycleManager->ClearCategory(SpiderCategory);
  }

  this->ActiveCluster = vtkPointMapType::ClusterInfo();
  this->Layout = vtkPointMapType::SpiderLayout();
  this->SetState(vtkPointMapType::SpiderState::Idle);
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::OnExpansionZoom(
  unsigned long generation, bool success, int zoom)
{
  if (generation != this->Generation)
  {
    vtkDebugMacro("Discarding stale expansion zoom");
    return;
  }

  if (!success || !this->LifecycleManager || !this->ClusterLayer)
  {
    vtkErrorMacro("Failed to resolve expansion zoom of cluster "
      << this->ActiveCluster.ClusterId);
    this->ActiveCluster = vtkPointMapType::ClusterInfo();
    this->SetState(vtkPointMapType::SpiderState::Idle);
    return;
  }

  const int currentZoom = this->LifecycleManager->GetZoom();
  const int maxClusterZoom = this->ClusterLayer->GetIndex()->GetMaxClusterZoom();
  if (zoom != vtkPointClusterIndex::NoExpansion && zoom > currentZoom &&
    currentZoom < maxClusterZoom)
  {
    this->SetState(vtkPointMapType::SpiderState::Zooming);
    this->LifecycleManager->EaseTo(this->ActiveCluster.Centroid[1],
      this->ActiveCluster.Centroid[0], zoom);
    return;
  }

  vtkWeakPointer<vtkSpiderfyController> self(this);
  this->ClusterLayer->RequestLeaves(this->ActiveCluster.ClusterId,
    this->MaxSpiderMarkers, 0,
    [self, generation](bool ok,
      const std::vector<vtkPointMapType::JitteredFeature>& leaves) {
      if (self)
      {
        self->OnLeaves(generation, ok, leaves);
      }
    });
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::OnLeaves(unsigned long generation, bool success,
  const std::vector<vtkPointMapType::JitteredFeature>& leaves)
{
  if (generation != this->Generation)
  {
    vtkDebugMacro("Discarding stale leaves");
    return;
  }

  if (!success || leaves.empty())
  {
    vtkErrorMacro("Failed to fetch members of cluster "
      << this->ActiveCluster.ClusterId);
    this->ActiveCluster = vtkPointMapType::ClusterInfo();
    this->SetState(vtkPointMapType::SpiderState::Idle);
    return;
  }

  if (!this->BuildSpider(leaves))
  {
    vtkErrorMacro("Failed to add spider of cluster "
      << this->ActiveCluster.ClusterId);
    this->LifecycleManager->ClearCategory(SpiderCategory);
    this->ActiveCluster = vtkPointMapType::ClusterInfo();
    this->Layout = vtkPointMapType::SpiderLayout();
    this->SetState(vtkPointMapType::SpiderState::Idle);
    return;
  }

  this->SetState(vtkPointMapType::SpiderState::Spidered);
}

//----------------------------------------------------------------------------
bool vtkSpiderfyController::BuildSpider(
  const std::vector<vtkPointMapType::JitteredFeature>& leaves)
{
  vtkViewportLifecycleManager* manager = this->LifecycleManager;
  const double latLng[2] = { this->ActiveCluster.Centroid[1],
    this->ActiveCluster.Centroid[0] };
  double origin[2];
  if (!manager->ComputeDisplayCoords(latLng, origin))
  {
    return false;
  }

  const vtkIdType count = static_cast<vtkIdType>(leaves.size());
  ComputeLayout(origin, count, this->Layout);
  this->Layout.OverflowCount =
    std::max<vtkIdType>(0, this->ActiveCluster.MemberCount - count);

  std::vector<std::array<double, 2> > offsets;
  offsets.reserve(leaves.size());
  for (const auto& point : this->Layout.MemberPoints)
  {
    std::array<double, 2> offset = { { point[0] - origin[0],
      point[1] - origin[1] } };
    offsets.push_back(offset);
  }

  // Legs first so that markers are hit-tested before them
  vtkNew<vtkSpiderLegFeature> legs;
  legs->SetAnchor(this->ActiveCluster.Centroid[0], this->ActiveCluster.Centroid[1]);
  legs->SetLegOffsets(offsets);
  if (!manager->AddFeature(SpiderCategory, "spider-legs", legs.GetPointer()))
  {
    return false;
  }

  for (vtkIdType i = 0; i < count; ++i)
  {
    vtkNew<vtkPointMarkerFeature> marker;
    marker->SetPointFeature(leaves[static_cast<size_t>(i)]);
    marker->SetAnchor(
      this->ActiveCluster.Centroid[0], this->ActiveCluster.Centroid[1]);
    marker->SetDisplayOffset(offsets[static_cast<size_t>(i)][0],
      offsets[static_cast<size_t>(i)][1]);
    marker->SetFillColor(SpiderColor);
    marker->SetMarkerSize(SpiderMarkerSize);
    marker->OutlineOff();

    std::ostringstream key;
    key << "spider-marker-" << i;
    if (!manager->AddFeature(SpiderCategory, key.str(), marker.GetPointer()))
    {
      return false;
    }
  }

  if (this->Layout.OverflowCount > 0)
  {
    std::ostringstream text;
    text << "+" << this->Layout.OverflowCount << " more";

    vtkNew<vtkMapLabelFeature> overflow;
    overflow->SetText(text.str());
    overflow->SetAnchor(
      this->ActiveCluster.Centroid[0], this->ActiveCluster.Centroid[1]);
    overflow->SetDisplayOffset(0.0, -(ComputeRadius(count) + SpiderMarkerSize));
    if (!manager->AddFeature(SpiderCategory, "spider-overflow", overflow.GetPointer()))
    {
      return false;
    }
  }

  vtkDebugMacro("Spidered " << count << " members of cluster "
                            << this->ActiveCluster.ClusterId);
  return true;
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::OnAnimationEnded(vtkObject* vtkNotUsed(caller),
  unsigned long vtkNotUsed(event), void* vtkNotUsed(data))
{
  if (this->State == vtkPointMapType::SpiderState::Zooming)
  {
    this->ActiveCluster = vtkPointMapType::ClusterInfo();
    this->SetState(vtkPointMapType::SpiderState::Idle);
  }
}

//----------------------------------------------------------------------------
double vtkSpiderfyController::ComputeRadius(vtkIdType count)
{
  return std::min(30.0 + 5.0 * static_cast<double>(count), 80.0);
}

//----------------------------------------------------------------------------
void vtkSpiderfyController::ComputeLayout(const double origin[2],
  vtkIdType count, vtkPointMapType::SpiderLayout& layout)
{
  layout.Origin[0] = origin[0];
  layout.Origin[1] = origin[1];
  layout.MemberPoints.clear();
  layout.OverflowCount = 0;
  if (count <= 0)
  {
    return;
  }

  const double radius = ComputeRadius(count);
  layout.MemberPoints.reserve(static_cast<size_t>(count));
  if (count == 2)
  {
    std::array<double, 2> left = { { origin[0] - radius, origin[1] } };
    std::array<double, 2> right = { { origin[0] + radius, origin[1] } };
    layout.MemberPoints.push_back(left);
    layout.MemberPoints.push_back(right);
    return;
  }

  // Display y points up
  const double step = 2.0 * vtkMath::Pi() / static_cast<double>(count);
  for (vtkIdType i = 0; i < count; ++i)
  {
    const double angle = 0.5 * vtkMath::Pi() - step * static_cast<double>(i);
    std::array<double, 2> point = { { origin[0] + radius * std::cos(angle),
      origin[1] + radius * std::sin(angle) } };
    layout.MemberPoints.push_back(point);
  }
}
