/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkUncertaintyCircleFeature - translucent circle of given radius in km
// .SECTION Description
// Flat-plane approximation: the circle is a 64-point polygon with
// dx = km / (111.32 cos(lat)) degrees of longitude and
// dy = km / 110.574 degrees of latitude.
//

#ifndef __vtkUncertaintyCircleFeature_h
#define __vtkUncertaintyCircleFeature_h

#include "vtkPolydataFeature.h"
#include "vtkpointmapcore_export.h"

class vtkPoints;

class VTKPOINTMAPCORE_EXPORT vtkUncertaintyCircleFeature : public vtkPolydataFeature
{
public:
  static vtkUncertaintyCircleFeature* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkUncertaintyCircleFeature, vtkPolydataFeature);

  // Description:
  // Circle center as [longitude, latitude]
  vtkSetVector2Macro(Center, double);
  vtkGetVector2Macro(Center, double);

  vtkSetClampMacro(RadiusKm, double, 0.0, 20000.0);
  vtkGetMacro(RadiusKm, double);

  void Init() override;

  // Description:
  // Append the circle outline as [longitude, latitude, 0] points
  static void ComputeCirclePoints(const double center[2], double radiusKm,
    int numberOfPoints, vtkPoints* points);

protected:
  vtkUncertaintyCircleFeature();
  ~vtkUncertaintyCircleFeature() override;

  double Center[2];
  double RadiusKm;

private:
  vtkUncertaintyCircleFeature(const vtkUncertaintyCircleFeature&) = delete;
  vtkUncertaintyCircleFeature& operator=(const vtkUncertaintyCircleFeature&) = delete;
};

#endif // __vtkUncertaintyCircleFeature_h
