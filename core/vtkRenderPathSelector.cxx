/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkRenderPathSelector.h"

#include <vtkObjectFactory.h>

#include <algorithm>

vtkStandardNewMacro(vtkRenderPathSelector);

//----------------------------------------------------------------------------
vtkRenderPathSelector::vtkRenderPathSelector()
{
  this->MaxFeaturedMarkers = 200;
  this->MaxDomMarkers = 200;
  this->ClusterThresholdCount = 500;
  this->MaxUnclusteredPoints = 2000;
}

//----------------------------------------------------------------------------
vtkRenderPathSelector::~vtkRenderPathSelector() {}

//----------------------------------------------------------------------------
void vtkRenderPathSelector::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "MaxFeaturedMarkers: " << this->MaxFeaturedMarkers << "\n"
     << indent << "MaxDomMarkers: " << this->MaxDomMarkers << "\n"
     << indent << "ClusterThresholdCount: " << this->ClusterThresholdCount
     << "\n"
     << indent << "MaxUnclusteredPoints: " << this->MaxUnclusteredPoints
     << std::endl;
}

//----------------------------------------------------------------------------
void vtkRenderPathSelector::Select(
  const std::vector<vtkPointMapType::JitteredFeature>& features,
  vtkPointMapType::RenderPlan& plan)
{
  plan = vtkPointMapType::RenderPlan();

  vtkIdType bulkCount = 0;
  for (const auto& feature : features)
  {
    if (feature.Kind == vtkPointMapType::FeatureKind::BulkLocation)
    {
      ++bulkCount;
    }
  }

  const vtkIdType featuredBudget =
    std::min(this->MaxFeaturedMarkers, this->MaxDomMarkers);
  std::vector<bool> asMarker(features.size(), false);

  // Featured points first
  for (size_t i = 0; i < features.size(); ++i)
  {
    if (features[i].Kind == vtkPointMapType::FeatureKind::FeaturedFactoid &&
      plan.FeaturedDomCount < featuredBudget)
    {
      asMarker[i] = true;
      plan.DomMarkerSet.push_back(static_cast<vtkIdType>(i));
      ++plan.FeaturedDomCount;
    }
  }

  // Then the remaining budget, only for small bulk sets
  const vtkIdType remaining = this->MaxDomMarkers - plan.FeaturedDomCount;
  if (bulkCount <= this->ClusterThresholdCount)
  {
    for (size_t i = 0; i < features.size() && plan.BulkDomCount < remaining; ++i)
    {
      if (features[i].Kind == vtkPointMapType::FeatureKind::BulkLocation)
      {
        asMarker[i] = true;
        plan.DomMarkerSet.push_back(static_cast<vtkIdType>(i));
        ++plan.BulkDomCount;
      }
    }
  }

  for (size_t i = 0; i < features.size(); ++i)
  {
    if (!asMarker[i])
    {
      plan.ClusteredSet.push_back(static_cast<vtkIdType>(i));
    }
  }

  plan.ClusteringEnabled = static_cast<vtkIdType>(plan.ClusteredSet.size()) >
    this->MaxUnclusteredPoints;

  vtkDebugMacro("Render plan: " << plan.DomMarkerSet.size() << " markers ("
                                << plan.FeaturedDomCount << " featured), "
                                << plan.ClusteredSet.size() << " clustered");
}
