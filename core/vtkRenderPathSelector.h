/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkRenderPathSelector - split features between markers and clusters
// .SECTION Description
// Computes a vtkPointMapType::RenderPlan. Featured points receive
// individual markers first, up to min(MaxFeaturedMarkers, MaxDomMarkers).
// The remaining marker budget is given to bulk points only when the bulk
// count is at or below ClusterThresholdCount. Every other point, including
// featured points beyond their cap, goes to the clustered set.
//

#ifndef __vtkRenderPathSelector_h
#define __vtkRenderPathSelector_h

#include <vtkObject.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vector>

class VTKPOINTMAPCORE_EXPORT vtkRenderPathSelector : public vtkObject
{
public:
  static vtkRenderPathSelector* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkRenderPathSelector, vtkObject);

  vtkSetClampMacro(MaxFeaturedMarkers, int, 0, VTK_INT_MAX);
  vtkGetMacro(MaxFeaturedMarkers, int);

  vtkSetClampMacro(MaxDomMarkers, int, 0, VTK_INT_MAX);
  vtkGetMacro(MaxDomMarkers, int);

  vtkSetClampMacro(ClusterThresholdCount, int, 0, VTK_INT_MAX);
  vtkGetMacro(ClusterThresholdCount, int);

  vtkSetClampMacro(MaxUnclusteredPoints, int, 0, VTK_INT_MAX);
  vtkGetMacro(MaxUnclusteredPoints, int);

  // Description:
  // Partition the features. Indices in the plan refer to features.
  void Select(const std::vector<vtkPointMapType::JitteredFeature>& features,
    vtkPointMapType::RenderPlan& plan);

protected:
  vtkRenderPathSelector();
  ~vtkRenderPathSelector() override;

  int MaxFeaturedMarkers;
  int MaxDomMarkers;
  int ClusterThresholdCount;
  int MaxUnclusteredPoints;

private:
  vtkRenderPathSelector(const vtkRenderPathSelector&) = delete;
  vtkRenderPathSelector& operator=(const vtkRenderPathSelector&) = delete;
};

#endif // __vtkRenderPathSelector_h
