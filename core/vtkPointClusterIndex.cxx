/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointClusterIndex.h"
#include "vtkMercator.h"

#include <vtkIdList.h>
#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkPoints.h>
#include <vtkPolyData.h>
#include <vtkStaticPointLocator.h>

#include <algorithm>
#include <unordered_map>

vtkStandardNewMacro(vtkPointClusterIndex);

//----------------------------------------------------------------------------
// Internal class for cluster tree nodes
// Each node represents either one feature or a cluster of nodes
class vtkPointClusterIndex::ClusteringNode
{
public:
  vtkIdType NodeId;
  int Level;
  double gcsCoords[2]; // map plane x, y
  vtkIdType Parent;    // index into Nodes
  std::vector<vtkIdType> Children;
  vtkIdType NumberOfMarkers;
  vtkIdType FeatureIndex; // only relevant for leaf nodes
};

//----------------------------------------------------------------------------
class vtkPointClusterIndex::vtkInternal
{
public:
  std::vector<vtkPointMapType::JitteredFeature> Features;

  // All nodes of the current hierarchy
  std::vector<ClusteringNode> Nodes;

  // index: level, values: indices into Nodes
  std::vector<std::vector<vtkIdType> > NodeTable;

  // key: nodeId, value: index into Nodes
  std::unordered_map<vtkIdType, vtkIdType> AllNodesMap;

  vtkIdType UniqueNodeId = 0;
};

//----------------------------------------------------------------------------
vtkPointClusterIndex::vtkPointClusterIndex()
{
  this->ClusterRadius = 30;
  this->MaxClusterZoom = 16;
  this->MaxUnclusteredPoints = 2000;
  this->ClusteringEnabled = false;
  this->Internals = new vtkInternal;
}

//----------------------------------------------------------------------------
vtkPointClusterIndex::~vtkPointClusterIndex()
{
  delete this->Internals;
}

//----------------------------------------------------------------------------
void vtkPointClusterIndex::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "ClusterRadius: " << this->ClusterRadius << "\n"
     << indent << "MaxClusterZoom: " << this->MaxClusterZoom << "\n"
     << indent << "MaxUnclusteredPoints: " << this->MaxUnclusteredPoints << "\n"
     << indent << "ClusteringEnabled: " << this->ClusteringEnabled << "\n"
     << indent << "Number Of Points: " << this->Internals->Features.size()
     << "\n"
     << indent << "Number Of Nodes: " << this->Internals->Nodes.size()
     << std::endl;
}

//----------------------------------------------------------------------------
void vtkPointClusterIndex::Clear()
{
  this->Internals->Features.clear();
  this->Internals->Nodes.clear();
  this->Internals->NodeTable.clear();
  this->Internals->AllNodesMap.clear();
  this->ClusteringEnabled = false;
  this->Modified();
}

//----------------------------------------------------------------------------
vtkIdType vtkPointClusterIndex::NewNode(int level)
{
  ClusteringNode node;
  node.NodeId = this->Internals->UniqueNodeId++;
  node.Level = level;
  node.gcsCoords[0] = node.gcsCoords[1] = 0.0;
  node.Parent = -1;
  node.NumberOfMarkers = 0;
  node.FeatureIndex = -1;

  const vtkIdType index = static_cast<vtkIdType>(this->Internals->Nodes.size());
  this->Internals->Nodes.push_back(node);
  this->Internals->AllNodesMap.emplace(node.NodeId, index);
  this->Internals->NodeTable[static_cast<size_t>(level)].push_back(index);
  return index;
}

//----------------------------------------------------------------------------
void vtkPointClusterIndex::Build(
  const std::vector<vtkPointMapType::JitteredFeature>& features)
{
  this->Clear();
  this->Internals->Features = features;

  const int leafLevel = this->MaxClusterZoom + 1;
  this->Internals->NodeTable.resize(static_cast<size_t>(leafLevel + 1));
  this->Internals->Nodes.reserve(features.size() * 2);

  // Leaf level: one node per feature
  for (size_t i = 0; i < features.size(); ++i)
  {
    const vtkIdType index = this->NewNode(leafLevel);
    ClusteringNode& node = this->Internals->Nodes[static_cast<size_t>(index)];
    node.gcsCoords[0] = features[i].Position[0];
    node.gcsCoords[1] =
      vtkMercator::lat2y(vtkMercator::validLatitude(features[i].Position[1]));
    node.NumberOfMarkers = 1;
    node.FeatureIndex = static_cast<vtkIdType>(i);
  }

  this->ClusteringEnabled =
    static_cast<vtkIdType>(features.size()) > this->MaxUnclusteredPoints;
  if (this->ClusteringEnabled)
  {
    for (int level = this->MaxClusterZoom; level >= 0; --level)
    {
      this->ClusterLevel(level);
    }
  }

  vtkDebugMacro("Built cluster index with " << features.size() << " points and "
                                            << this->Internals->Nodes.size()
                                            << " nodes");
}

//----------------------------------------------------------------------------
void vtkPointClusterIndex::ClusterLevel(int level)
{
  const std::vector<vtkIdType> previous =
    this->Internals->NodeTable[static_cast<size_t>(level + 1)];
  if (previous.empty())
  {
    return;
  }

  vtkNew<vtkPoints> points;
  points->SetDataTypeToDouble();
  points->SetNumberOfPoints(static_cast<vtkIdType>(previous.size()));
  for (size_t i = 0; i < previous.size(); ++i)
  {
    const ClusteringNode& node =
      this->Internals->Nodes[static_cast<size_t>(previous[i])];
    points->SetPoint(
      static_cast<vtkIdType>(i), node.gcsCoords[0], node.gcsCoords[1], 0.0);
  }
  vtkNew<vtkPolyData> polyData;
  polyData->SetPoints(points.GetPointer());

  vtkNew<vtkStaticPointLocator> locator;
  locator->SetDataSet(polyData.GetPointer());
  locator->BuildLocator();

  const double radius =
    this->ClusterRadius * vtkMercator::worldUnitsPerPixel(level);

  std::vector<bool> visited(previous.size(), false);
  vtkNew<vtkIdList> neighbors;
  std::vector<vtkIdType> members;
  for (size_t i = 0; i < previous.size(); ++i)
  {
    if (visited[i])
    {
      continue;
    }
    visited[i] = true;

    double seed[3];
    points->GetPoint(static_cast<vtkIdType>(i), seed);
    locator->FindPointsWithinRadius(radius, seed, neighbors.GetPointer());

    members.clear();
    members.push_back(static_cast<vtkIdType>(i));
    for (vtkIdType j = 0; j < neighbors->GetNumberOfIds(); ++j)
    {
      const vtkIdType candidate = neighbors->GetId(j);
      if (!visited[static_cast<size_t>(candidate)])
      {
        visited[static_cast<size_t>(candidate)] = true;
        members.push_back(candidate);
      }
    }
    // Keep children in input order regardless of locator bucket order
    std::sort(members.begin() + 1, members.end());

    const vtkIdType parentIndex = this->NewNode(level);
    double numerator[2] = { 0.0, 0.0 };
    vtkIdType numMarkers = 0;
    for (vtkIdType member : members)
    {
      const vtkIdType childIndex = previous[static_cast<size_t>(member)];
      ClusteringNode& child =
        this->Internals->Nodes[static_cast<size_t>(childIndex)];
      child.Parent = parentIndex;
      numMarkers += child.NumberOfMarkers;
      for (int k = 0; k < 2; ++k)
      {
        numerator[k] += child.NumberOfMarkers * child.gcsCoords[k];
      }
      this->Internals->Nodes[static_cast<size_t>(parentIndex)].Children.push_back(
        childIndex);
    }

    ClusteringNode& parent =
      this->Internals->Nodes[static_cast<size_t>(parentIndex)];
    parent.NumberOfMarkers = numMarkers;
    parent.gcsCoords[0] = numerator[0] / numMarkers;
    parent.gcsCoords[1] = numerator[1] / numMarkers;
    if (numMarkers == 1)
    {
      const ClusteringNode& child = this->Internals->Nodes[static_cast<size_t>(
        previous[static_cast<size_t>(members[0])])];
      parent.FeatureIndex = child.FeatureIndex;
    }
  }

  vtkDebugMacro("Level " << level << ": " << previous.size() << " --> "
                         << this->Internals->NodeTable[level].size()
                         << " nodes");
}

//----------------------------------------------------------------------------
vtkIdType vtkPointClusterIndex::GetNumberOfPoints() const
{
  return static_cast<vtkIdType>(this->Internals->Features.size());
}

//----------------------------------------------------------------------------
const vtkPointMapType::JitteredFeature* vtkPointClusterIndex::GetFeature(
  vtkIdType index) const
{
  if (index < 0 || index >= this->GetNumberOfPoints())
  {
    return nullptr;
  }
  return &this->Internals->Features[static_cast<size_t>(index)];
}

//----------------------------------------------------------------------------
void vtkPointClusterIndex::GetClusters(
  int zoom, std::vector<vtkPointMapType::ClusterInfo>& clusters)
{
  clusters.clear();
  if (this->Internals->NodeTable.empty())
  {
    return;
  }

  const int leafLevel = static_cast<int>(this->Internals->NodeTable.size()) - 1;
  int level = std::max(0, std::min(zoom, leafLevel));
  if (!this->ClusteringEnabled)
  {
    level = leafLevel;
  }

  const std::vector<vtkIdType>& nodeSet =
    this->Internals->NodeTable[static_cast<size_t>(level)];
  clusters.reserve(nodeSet.size());
  for (vtkIdType nodeIndex : nodeSet)
  {
    vtkPointMapType::ClusterInfo info;
    this->FillClusterInfo(nodeIndex, info);
    clusters.push_back(info);
  }
}

//----------------------------------------------------------------------------
void vtkPointClusterIndex::FillClusterInfo(
  vtkIdType nodeIndex, vtkPointMapType::ClusterInfo& info)
{
  const ClusteringNode& node =
    this->Internals->Nodes[static_cast<size_t>(nodeIndex)];
  info.ClusterId = node.NodeId;
  info.Centroid[0] = node.gcsCoords[0];
  info.Centroid[1] = vtkMercator::y2lat(node.gcsCoords[1]);
  info.MemberCount = node.NumberOfMarkers;
  info.FeatureIndex = node.NumberOfMarkers == 1 ? node.FeatureIndex : -1;
  info.ExpansionZoom = this->GetExpansionZoom(node.NodeId);
}

//----------------------------------------------------------------------------
bool vtkPointClusterIndex::HasCluster(vtkIdType clusterId) const
{
  return this->Internals->AllNodesMap.find(clusterId) !=
    this->Internals->AllNodesMap.end();
}

//----------------------------------------------------------------------------
bool vtkPointClusterIndex::GetClusterInfo(
  vtkIdType clusterId, vtkPointMapType::ClusterInfo& info)
{
  auto iter = this->Internals->AllNodesMap.find(clusterId);
  if (iter == this->Internals->AllNodesMap.end())
  {
    return false;
  }
  this->FillClusterInfo(iter->second, info);
  return true;
}

//----------------------------------------------------------------------------
int vtkPointClusterIndex::GetExpansionZoom(vtkIdType clusterId)
{
  auto iter = this->Internals->AllNodesMap.find(clusterId);
  if (iter == this->Internals->AllNodesMap.end())
  {
    return InvalidCluster;
  }

  // Descend through levels where the node is carried over unchanged
  const ClusteringNode* node =
    &this->Internals->Nodes[static_cast<size_t>(iter->second)];
  while (node->Children.size() == 1)
  {
    node = &this->Internals->Nodes[static_cast<size_t>(node->Children[0])];
  }

  if (node->Children.empty())
  {
    return NoExpansion;
  }

  const int splitZoom = node->Level + 1;
  return splitZoom > this->MaxClusterZoom ? NoExpansion : splitZoom;
}

//----------------------------------------------------------------------------
bool vtkPointClusterIndex::GetLeaves(
  vtkIdType clusterId, vtkIdType limit, vtkIdType offset, vtkIdList* leaves)
{
  if (!leaves)
  {
    return false;
  }
  leaves->Reset();

  auto iter = this->Internals->AllNodesMap.find(clusterId);
  if (iter == this->Internals->AllNodesMap.end())
  {
    return false;
  }

  vtkIdType skip = std::max<vtkIdType>(0, offset);
  this->CollectLeaves(iter->second, limit, skip, leaves);
  return true;
}

//----------------------------------------------------------------------------
void vtkPointClusterIndex::CollectLeaves(
  vtkIdType nodeIndex, vtkIdType limit, vtkIdType& skip, vtkIdList* leaves)
{
  if (limit >= 0 && leaves->GetNumberOfIds() >= limit)
  {
    return;
  }

  const ClusteringNode& node =
    this->Internals->Nodes[static_cast<size_t>(nodeIndex)];
  if (node.Children.empty())
  {
    if (skip > 0)
    {
      --skip;
    }
    else
    {
      leaves->InsertNextId(node.FeatureIndex);
    }
    return;
  }

  // Skip whole subtrees that lie before the offset
  for (vtkIdType childIndex : node.Children)
  {
    const vtkIdType count =
      this->Internals->Nodes[static_cast<size_t>(childIndex)].NumberOfMarkers;
    if (skip >= count)
    {
      skip -= count;
      continue;
    }
    this->CollectLeaves(childIndex, limit, skip, leaves);
    if (limit >= 0 && leaves->GetNumberOfIds() >= limit)
    {
      return;
    }
  }
}
