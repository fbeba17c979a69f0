/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointClusterIndex - hierarchical point clustering per zoom level
// .SECTION Description
// Builds a cluster hierarchy for a fixed set of features. The hierarchy has
// one level per zoom level 0..MaxClusterZoom plus a leaf level holding one
// node per feature. Levels are built greedily from the deepest level up:
// each unvisited node of level z+1 seeds a node of level z that absorbs the
// unvisited nodes within ClusterRadius pixels, measured at zoom z on the
// map plane (360 * radius / (256 * 2^z) world units). Node coordinates are
// member-weighted centroids.
//
// Every node gets an id from a counter that is never reset, so ids handed
// out by a previous Build() are unknown to the current one.
//
// When the input holds at most MaxUnclusteredPoints features clustering is
// disabled and every zoom level shows the leaf level.
//

#ifndef __vtkPointClusterIndex_h
#define __vtkPointClusterIndex_h

#include <vtkObject.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vector>

class vtkIdList;

class VTKPOINTMAPCORE_EXPORT vtkPointClusterIndex : public vtkObject
{
public:
  static vtkPointClusterIndex* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkPointClusterIndex, vtkObject);

  // Description:
  // Sentinel values returned by GetExpansionZoom()
  enum
  {
    NoExpansion = -1,
    InvalidCluster = -2
  };

  // Description:
  // Clustering radius in pixels. Default is 30.
  vtkSetClampMacro(ClusterRadius, int, 1, 512);
  vtkGetMacro(ClusterRadius, int);

  // Description:
  // Deepest zoom level at which points are clustered. Default is 16.
  vtkSetClampMacro(MaxClusterZoom, int, 0, 19);
  vtkGetMacro(MaxClusterZoom, int);

  // Description:
  // Point count at or below which clustering is disabled. Default is 2000.
  vtkSetClampMacro(MaxUnclusteredPoints, int, 0, VTK_INT_MAX);
  vtkGetMacro(MaxUnclusteredPoints, int);

  // Description:
  // Rebuild the hierarchy for the given features. The features are copied.
  void Build(const std::vector<vtkPointMapType::JitteredFeature>& features);

  // Description:
  // Remove all nodes. Previously issued cluster ids become unknown.
  void Clear();

  vtkIdType GetNumberOfPoints() const;

  // Description:
  // True when the last Build() produced a clustered hierarchy
  bool GetClusteringEnabled() const { return this->ClusteringEnabled; }

  // Description:
  // Feature stored at the given index, or nullptr when out of range
  const vtkPointMapType::JitteredFeature* GetFeature(vtkIdType index) const;

  // Description:
  // Nodes displayed at the given zoom level. Above MaxClusterZoom the leaf
  // level is returned.
  void GetClusters(int zoom, std::vector<vtkPointMapType::ClusterInfo>& clusters);

  // Description:
  // Zoom level at which the cluster splits into several nodes.
  // Returns NoExpansion when that does not happen at or below
  // MaxClusterZoom and InvalidCluster for unknown ids.
  int GetExpansionZoom(vtkIdType clusterId);

  // Description:
  // Fill leaves with the feature indices of up to limit members of the
  // cluster, after skipping offset members. Members are visited depth
  // first in a stable order. A negative limit returns every member.
  // Returns false for unknown ids.
  bool GetLeaves(vtkIdType clusterId, vtkIdType limit, vtkIdType offset,
    vtkIdList* leaves);

  bool HasCluster(vtkIdType clusterId) const;

  // Description:
  // Describe a single node. Returns false for unknown ids.
  bool GetClusterInfo(vtkIdType clusterId, vtkPointMapType::ClusterInfo& info);

protected:
  vtkPointClusterIndex();
  ~vtkPointClusterIndex() override;

  int ClusterRadius;
  int MaxClusterZoom;
  int MaxUnclusteredPoints;
  bool ClusteringEnabled;

  class ClusteringNode;
  class vtkInternal;
  vtkInternal* Internals;

  // Build level z from the nodes of level z+1
  void ClusterLevel(int level);

  vtkIdType NewNode(int level);

  void FillClusterInfo(vtkIdType nodeIndex, vtkPointMapType::ClusterInfo& info);

  void CollectLeaves(vtkIdType nodeIndex, vtkIdType limit, vtkIdType& skip,
    vtkIdList* leaves);

private:
  vtkPointClusterIndex(const vtkPointClusterIndex&) = delete;
  vtkPointClusterIndex& operator=(const vtkPointClusterIndex&) = delete;
};

#endif // __vtkPointClusterIndex_h
