/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkClusterGlyphFeature - glyph rendering of a vtkPointClusterIndex
// .SECTION Description
// Draws the nodes of a vtkPointClusterIndex at the current map zoom level
// with a single vtkGlyph3DMapper. Clusters are drawn as discs colored and
// sized by member count, with the abbreviated count as label. Single points
// are drawn as small red discs. Glyph sizes are constant in screen space.
//
// The displayed node list is refreshed when the zoom level changes or the
// index is rebuilt.
//

#ifndef __vtkClusterGlyphFeature_h
#define __vtkClusterGlyphFeature_h

#include "vtkPolydataFeature.h"
#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vtkSmartPointer.h>

#include <string>
#include <vector>

class vtkActor2D;
class vtkGlyph3DMapper;
class vtkLabeledDataMapper;
class vtkPointClusterIndex;
class vtkPolyData;

class VTKPOINTMAPCORE_EXPORT vtkClusterGlyphFeature : public vtkPolydataFeature
{
public:
  static vtkClusterGlyphFeature* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkClusterGlyphFeature, vtkPolydataFeature);

  // Description:
  // Index whose nodes are drawn
  void SetIndex(vtkPointClusterIndex* index);
  vtkPointClusterIndex* GetIndex();

  void Init() override;
  void Update() override;
  void CleanUp() override;

  // Description:
  // Hit-test the displayed nodes. On a hit, result.ItemIndex is the
  // position of the node in the displayed list.
  bool HitTest(const double displayCoords[2],
    vtkPointMapType::PickResult& result) override;

  // Description:
  // Nodes displayed at the current zoom level
  std::size_t GetNumberOfDisplayedClusters();
  bool GetDisplayedCluster(vtkIdType item, vtkPointMapType::ClusterInfo& info);

  // Description:
  // Color and radius in pixels used for a node with the given member count
  static void GetClusterStyle(
    vtkIdType memberCount, unsigned char rgb[3], double& radius);

  // Description:
  // Count label, e.g. "950", "1.2k", "45k"
  static std::string FormatCount(vtkIdType count);

protected:
  vtkClusterGlyphFeature();
  ~vtkClusterGlyphFeature() override;

  // Refresh the displayed node list, returns true if it changed
  bool RefreshClusters();

  void RebuildPolyData();

  vtkSmartPointer<vtkPointClusterIndex> Index;
  std::vector<vtkPointMapType::ClusterInfo> DisplayedClusters;
  int DisplayedZoom;
  vtkTimeStamp RefreshTime;

  vtkSmartPointer<vtkPolyData> PolyData;
  vtkSmartPointer<vtkGlyph3DMapper> GlyphMapper;
  vtkSmartPointer<vtkPolyData> LabelData;
  vtkSmartPointer<vtkLabeledDataMapper> LabelMapper;
  vtkSmartPointer<vtkActor2D> LabelActor;

  const unsigned int BaseMarkerSize = 50;

private:
  vtkClusterGlyphFeature(const vtkClusterGlyphFeature&) = delete;
  vtkClusterGlyphFeature& operator=(const vtkClusterGlyphFeature&) = delete;
};

#endif // __vtkClusterGlyphFeature_h
