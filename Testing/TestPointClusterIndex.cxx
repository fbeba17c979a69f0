/*=========================================================================

  Program:   Visualization Toolkit
  Module:    TestPointClusterIndex.cxx

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointClusterIndex.h"
#include "vtkPointMapTestUtilities.h"

#include <vtkIdList.h>
#include <vtkMinimalStandardRandomSequence.h>
#include <vtkNew.h>

#include <cmath>

using namespace vtkPointMapTesting;

namespace
{
//----------------------------------------------------------------------------
vtkIdType SumMembers(const std::vector<vtkPointMapType::ClusterInfo>& clusters)
{
  vtkIdType sum = 0;
  for (const auto& cluster : clusters)
  {
    sum += cluster.MemberCount;
  }
  return sum;
}
}

//----------------------------------------------------------------------------
int TestPointClusterIndex(int vtkNotUsed(argc), char* vtkNotUsed(argv)[])
{
  std::vector<vtkPointMapType::ClusterInfo> clusters;
  vtkNew<vtkIdList> leaves;

  // 45,000 points spread over the eastern Mediterranean
  std::vector<vtkPointMapType::JitteredFeature> features;
  vtkNew<vtkMinimalStandardRandomSequence> random;
  random->SetSeed(8775070);
  for (int i = 0; i < 45000; ++i)
  {
    const double lon = random->GetRangeValue(-10.0, 45.0);
    random->Next();
    const double lat = random->GetRangeValue(20.0, 50.0);
    random->Next();
    std::ostringstream id;
    id << "location-" << i;
    features.push_back(MakePoint(id.str(), lon, lat));
  }

  vtkNew<vtkPointClusterIndex> index;
  index->Build(features);
  vtkPointMapTestAssert(index->GetClusteringEnabled(),
    "clustering must be enabled above MaxUnclusteredPoints");
  vtkPointMapTestAssert(index->GetNumberOfPoints() == 45000, "bad point count");

  // Membership partitions the input at every zoom level
  for (int zoom = 0; zoom <= 19; ++zoom)
  {
    index->GetClusters(zoom, clusters);
    vtkPointMapTestAssert(SumMembers(clusters) == 45000,
      "members at zoom " << zoom << " sum to " << SumMembers(clusters));
  }

  index->GetClusters(index->GetMaxClusterZoom() + 1, clusters);
  vtkPointMapTestAssert(clusters.size() == 45000,
    "above MaxClusterZoom every point is shown individually");

  // Leaves of the zoom-3 clusters cover the input exactly once
  index->GetClusters(3, clusters);
  std::vector<int> seen(features.size(), 0);
  for (const auto& cluster : clusters)
  {
    vtkPointMapTestAssert(index->GetLeaves(cluster.ClusterId, -1, 0, leaves),
      "leaves of a known cluster");
    vtkPointMapTestAssert(leaves->GetNumberOfIds() == cluster.MemberCount,
      "leaf count must equal member count");
    for (vtkIdType i = 0; i < leaves->GetNumberOfIds(); ++i)
    {
      ++seen[static_cast<size_t>(leaves->GetId(i))];
    }
  }
  for (size_t i = 0; i < seen.size(); ++i)
  {
    vtkPointMapTestAssert(seen[i] == 1, "point " << i << " seen " << seen[i] << " times");
  }

  // Paged leaves are stable
  vtkPointMapType::ClusterInfo biggest;
  for (const auto& cluster : clusters)
  {
    if (cluster.MemberCount > biggest.MemberCount)
    {
      biggest = cluster;
    }
  }
  vtkPointMapTestAssert(biggest.MemberCount > 20, "expected a large cluster");
  vtkNew<vtkIdList> all;
  vtkNew<vtkIdList> page;
  index->GetLeaves(biggest.ClusterId, 20, 0, all);
  vtkPointMapTestAssert(all->GetNumberOfIds() == 20, "limit must be honored");
  index->GetLeaves(biggest.ClusterId, 10, 10, page);
  for (vtkIdType i = 0; i < 10; ++i)
  {
    vtkPointMapTestAssert(page->GetId(i) == all->GetId(10 + i),
      "offset page must continue the first page");
  }
  index->GetLeaves(biggest.ClusterId, 20, 0, page);
  for (vtkIdType i = 0; i < 20; ++i)
  {
    vtkPointMapTestAssert(page->GetId(i) == all->GetId(i), "leaves must be stable");
  }

  // Stale ids are unknown after a rebuild
  const vtkIdType staleId = biggest.ClusterId;
  index->Build(features);
  vtkPointMapTestAssert(!index->HasCluster(staleId), "ids must not be reused");
  vtkPointMapTestAssert(
    index->GetExpansionZoom(staleId) == vtkPointClusterIndex::InvalidCluster,
    "stale id must be reported invalid");
  vtkPointMapTestAssert(!index->GetLeaves(staleId, 10, 0, leaves) &&
      leaves->GetNumberOfIds() == 0,
    "stale id has no leaves");

  // Expansion zoom of ten points on a line
  index->SetMaxUnclusteredPoints(0);
  index->Build(MakeGrid(0.0, 0.0, 1, 10, 0.001));
  index->GetClusters(0, clusters);
  vtkPointMapTestAssert(clusters.size() == 1 && clusters[0].MemberCount == 10,
    "the line must be a single cluster at zoom 0");
  vtkPointMapTestAssert(std::abs(clusters[0].Centroid[0] - 0.0045) < 1e-9 &&
      std::abs(clusters[0].Centroid[1]) < 1e-9,
    "centroid must be member-weighted");

  const int expansion = index->GetExpansionZoom(clusters[0].ClusterId);
  vtkPointMapTestAssert(expansion > 0 && expansion <= index->GetMaxClusterZoom(),
    "bad expansion zoom " << expansion);
  vtkPointMapTestAssert(clusters[0].ExpansionZoom == expansion,
    "cluster info must carry the expansion zoom");
  index->GetClusters(expansion - 1, clusters);
  vtkPointMapTestAssert(clusters.size() == 1, "no split before the expansion zoom");
  index->GetClusters(expansion, clusters);
  vtkPointMapTestAssert(clusters.size() > 1, "split at the expansion zoom");

  // Points closer than the cluster radius at MaxClusterZoom never split
  index->Build(MakeGrid(0.0, 0.0, 1, 5, 0.00002));
  index->GetClusters(index->GetMaxClusterZoom(), clusters);
  vtkPointMapTestAssert(clusters.size() == 1 && clusters[0].MemberCount == 5,
    "expected one cluster at MaxClusterZoom");
  vtkPointMapTestAssert(index->GetExpansionZoom(clusters[0].ClusterId) ==
      vtkPointClusterIndex::NoExpansion,
    "cluster must not expand");
  index->GetClusters(index->GetMaxClusterZoom() + 1, clusters);
  vtkPointMapTestAssert(clusters.size() == 5 && clusters[2].MemberCount == 1 &&
      clusters[2].FeatureIndex == 2,
    "single points reference their feature");
  vtkPointMapTestAssert(index->GetExpansionZoom(clusters[2].ClusterId) ==
      vtkPointClusterIndex::NoExpansion,
    "single points do not expand");
  vtkPointMapTestAssert(index->GetFeature(2) && index->GetFeature(2)->Id == "p0-2",
    "feature lookup by index");
  vtkPointMapTestAssert(!index->GetFeature(5), "feature index out of range");

  // Clustering disabled for small inputs
  index->SetMaxUnclusteredPoints(2000);
  index->Build(MakeGrid(0.0, 0.0, 10, 10, 0.00002));
  vtkPointMapTestAssert(!index->GetClusteringEnabled(), "clustering must be disabled");
  index->GetClusters(0, clusters);
  vtkPointMapTestAssert(clusters.size() == 100, "every point shown individually");
  for (const auto& cluster : clusters)
  {
    vtkPointMapTestAssert(cluster.MemberCount == 1 && cluster.FeatureIndex >= 0,
      "individual point expected");
  }

  // Empty input
  index->Build(std::vector<vtkPointMapType::JitteredFeature>());
  index->GetClusters(5, clusters);
  vtkPointMapTestAssert(clusters.empty() && index->GetNumberOfPoints() == 0,
    "empty input builds an empty index");

  return EXIT_SUCCESS;
}
