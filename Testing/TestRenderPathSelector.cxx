/*=========================================================================

  Program:   Visualization Toolkit
  Module:    TestRenderPathSelector.cxx

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointMapTestUtilities.h"
#include "vtkRenderPathSelector.h"

#include <vtkNew.h>

using namespace vtkPointMapTesting;

namespace
{
//----------------------------------------------------------------------------
void AddPoints(std::vector<vtkPointMapType::JitteredFeature>& features,
  int count, vtkPointMapType::FeatureKind kind)
{
  const bool featured = kind == vtkPointMapType::FeatureKind::FeaturedFactoid;
  for (int i = 0; i < count; ++i)
  {
    std::ostringstream id;
    id << (featured ? "factoid-" : "location-") << features.size();
    features.push_back(
      MakePoint(id.str(), 0.01 * (i % 1000), 0.01 * (i / 1000), kind));
  }
}

//----------------------------------------------------------------------------
bool IsPartition(const std::vector<vtkPointMapType::JitteredFeature>& features,
  const vtkPointMapType::RenderPlan& plan)
{
  std::vector<int> seen(features.size(), 0);
  for (vtkIdType index : plan.DomMarkerSet)
  {
    ++seen[static_cast<size_t>(index)];
  }
  for (vtkIdType index : plan.ClusteredSet)
  {
    ++seen[static_cast<size_t>(index)];
  }
  for (int count : seen)
  {
    if (count != 1)
    {
      return false;
    }
  }
  return true;
}
}

//----------------------------------------------------------------------------
int TestRenderPathSelector(int vtkNotUsed(argc), char* vtkNotUsed(argv)[])
{
  const vtkPointMapType::FeatureKind bulk =
    vtkPointMapType::FeatureKind::BulkLocation;
  const vtkPointMapType::FeatureKind featured =
    vtkPointMapType::FeatureKind::FeaturedFactoid;

  vtkNew<vtkRenderPathSelector> selector;
  vtkPointMapType::RenderPlan plan;
  std::vector<vtkPointMapType::JitteredFeature> features;

  // 45,000 bulk locations: everything is clustered
  AddPoints(features, 45000, bulk);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.DomMarkerSet.empty(), "no individual markers expected");
  vtkPointMapTestAssert(plan.ClusteredSet.size() == 45000, "all points clustered");
  vtkPointMapTestAssert(plan.ClusteringEnabled, "clustering must be enabled");
  vtkPointMapTestAssert(IsPartition(features, plan), "plan must partition the input");

  // 150 featured factoids on top: all of them get markers
  AddPoints(features, 150, featured);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.DomMarkerSet.size() == 150 &&
      plan.FeaturedDomCount == 150 && plan.BulkDomCount == 0,
    "all featured points must be markers, got " << plan.DomMarkerSet.size());
  vtkPointMapTestAssert(plan.ClusteredSet.size() == 45000, "bulk stays clustered");
  for (vtkIdType index : plan.DomMarkerSet)
  {
    vtkPointMapTestAssert(features[static_cast<size_t>(index)].Kind == featured,
      "only featured points expected");
  }
  vtkPointMapTestAssert(IsPartition(features, plan), "plan must partition the input");

  // 150 featured + 100 bulk: the remaining budget goes to bulk points
  features.clear();
  AddPoints(features, 100, bulk);
  AddPoints(features, 150, featured);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.DomMarkerSet.size() == 200, "marker budget must be used");
  vtkPointMapTestAssert(plan.FeaturedDomCount == 150 && plan.BulkDomCount == 50,
    "featured points come first");
  vtkPointMapTestAssert(features[static_cast<size_t>(plan.DomMarkerSet[0])].Kind ==
      featured,
    "featured points lead the marker set");
  vtkPointMapTestAssert(plan.ClusteredSet.size() == 50 && !plan.ClusteringEnabled,
    "small clustered sets are not clustered");
  vtkPointMapTestAssert(IsPartition(features, plan), "plan must partition the input");

  // Featured cap
  features.clear();
  AddPoints(features, 300, featured);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.FeaturedDomCount == 200 && plan.ClusteredSet.size() == 100,
    "featured markers are capped by MaxFeaturedMarkers");
  selector->SetMaxDomMarkers(120);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.DomMarkerSet.size() == 120,
    "featured markers are capped by MaxDomMarkers");
  selector->SetMaxDomMarkers(200);

  // Bulk threshold is inclusive
  features.clear();
  AddPoints(features, 500, bulk);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.BulkDomCount == 200 && plan.ClusteredSet.size() == 300,
    "bulk at the threshold may get markers");
  AddPoints(features, 1, bulk);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.DomMarkerSet.empty() && plan.ClusteredSet.size() == 501,
    "bulk above the threshold is clustered");

  // ClusteringEnabled follows MaxUnclusteredPoints
  selector->SetMaxUnclusteredPoints(500);
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.ClusteringEnabled, "501 > 500 must enable clustering");
  selector->SetMaxUnclusteredPoints(501);
  selector->Select(features, plan);
  vtkPointMapTestAssert(!plan.ClusteringEnabled, "501 <= 501 must disable clustering");

  // Empty input
  features.clear();
  selector->Select(features, plan);
  vtkPointMapTestAssert(plan.DomMarkerSet.empty() && plan.ClusteredSet.empty() &&
      !plan.ClusteringEnabled,
    "empty input");

  return EXIT_SUCCESS;
}
