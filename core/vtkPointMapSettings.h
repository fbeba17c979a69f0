/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointMapSettings - tunable parameters of the point map engine
// .SECTION Description
// Every threshold used by the rendering pipeline lives here so that dense
// or sparse data sets can be accommodated without code changes. Changing
// any value bumps the MTime, which makes vtkPointMapEngine rebuild its
// feature sets and cluster index on the next update.
//

#ifndef __vtkPointMapSettings_h
#define __vtkPointMapSettings_h

#include <vtkObject.h>

#include "vtkpointmapcore_export.h"

class VTKPOINTMAPCORE_EXPORT vtkPointMapSettings : public vtkObject
{
public:
  static vtkPointMapSettings* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkPointMapSettings, vtkObject);

  // Description:
  // Bulk point count above which bulk points never get individual markers
  vtkSetClampMacro(ClusterThresholdCount, int, 0, VTK_INT_MAX);
  vtkGetMacro(ClusterThresholdCount, int);

  // Description:
  // Maximum number of individual (interactive) markers
  vtkSetClampMacro(MaxDomMarkers, int, 0, VTK_INT_MAX);
  vtkGetMacro(MaxDomMarkers, int);

  // Description:
  // Maximum number of featured points given individual markers
  vtkSetClampMacro(MaxFeaturedMarkers, int, 0, VTK_INT_MAX);
  vtkGetMacro(MaxFeaturedMarkers, int);

  // Description:
  // Clustered point count at or below which clustering is disabled
  vtkSetClampMacro(MaxUnclusteredPoints, int, 0, VTK_INT_MAX);
  vtkGetMacro(MaxUnclusteredPoints, int);

  vtkSetClampMacro(ClusterRadiusPixels, int, 1, 512);
  vtkGetMacro(ClusterRadiusPixels, int);

  vtkSetClampMacro(MaxClusterZoom, int, 0, 19);
  vtkGetMacro(MaxClusterZoom, int);

  vtkSetClampMacro(JitterBaseRadiusDegrees, double, 1e-9, 1.0);
  vtkGetMacro(JitterBaseRadiusDegrees, double);

  vtkSetClampMacro(JitterCapFactor, double, 1.0, 100.0);
  vtkGetMacro(JitterCapFactor, double);

  // Description:
  // Number of decimals used to decide that two coordinates coincide
  vtkSetClampMacro(CoordinatePrecision, int, 0, 12);
  vtkGetMacro(CoordinatePrecision, int);

  vtkSetMacro(ShowUncertainty, bool);
  vtkGetMacro(ShowUncertainty, bool);
  vtkBooleanMacro(ShowUncertainty, bool);

  vtkSetClampMacro(MaxSpiderMarkers, int, 1, 1000);
  vtkGetMacro(MaxSpiderMarkers, int);

  // Description:
  // Leaves fetched for a cluster hover preview, and how many of their
  // names are shown
  vtkSetClampMacro(HoverLeafLimit, int, 1, 1000);
  vtkGetMacro(HoverLeafLimit, int);
  vtkSetClampMacro(HoverSampleNames, int, 0, 1000);
  vtkGetMacro(HoverSampleNames, int);

  // Description:
  // Readiness checks before the renderer-not-ready diagnostic is raised
  vtkSetClampMacro(MaxReadyRetries, int, 1, VTK_INT_MAX);
  vtkGetMacro(MaxReadyRetries, int);

  // Description:
  // Duration of zoom-to-expand animations in milliseconds
  vtkSetClampMacro(AnimationDuration, int, 0, 10000);
  vtkGetMacro(AnimationDuration, int);

protected:
  vtkPointMapSettings();
  ~vtkPointMapSettings() override;

  int ClusterThresholdCount;
  int MaxDomMarkers;
  int MaxFeaturedMarkers;
  int MaxUnclusteredPoints;
  int ClusterRadiusPixels;
  int MaxClusterZoom;
  double JitterBaseRadiusDegrees;
  double JitterCapFactor;
  int CoordinatePrecision;
  bool ShowUncertainty;
  int MaxSpiderMarkers;
  int HoverLeafLimit;
  int HoverSampleNames;
  int MaxReadyRetries;
  int AnimationDuration;

private:
  vtkPointMapSettings(const vtkPointMapSettings&) = delete;
  vtkPointMapSettings& operator=(const vtkPointMapSettings&) = delete;
};

#endif // __vtkPointMapSettings_h
