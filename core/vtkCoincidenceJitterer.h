/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkCoincidenceJitterer - separate points sharing a coordinate
// .SECTION Description
// Points whose coordinates agree after rounding to CoordinatePrecision
// decimals form a coincidence group. The n members of a group (n > 1) are
// moved onto a circle of radius BaseRadius * min(sqrt(n), CapFactor)
// degrees around the coordinate of the first member, member i at angle
// 2*pi*i/n, in input order. Points alone at their coordinate are copied
// unchanged. Output order matches input order.
//

#ifndef __vtkCoincidenceJitterer_h
#define __vtkCoincidenceJitterer_h

#include <vtkObject.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vector>

class VTKPOINTMAPCORE_EXPORT vtkCoincidenceJitterer : public vtkObject
{
public:
  static vtkCoincidenceJitterer* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkCoincidenceJitterer, vtkObject);

  // Description:
  // Base jitter radius in degrees, at least 1e-9 so that group members
  // never share a coordinate. Default is 0.001.
  vtkSetClampMacro(BaseRadius, double, 1e-9, 1.0);
  vtkGetMacro(BaseRadius, double);

  // Description:
  // Upper bound of the sqrt(n) radius growth. Default is 5.
  vtkSetClampMacro(CapFactor, double, 1.0, 100.0);
  vtkGetMacro(CapFactor, double);

  // Description:
  // Decimals kept when comparing coordinates. Default is 6.
  vtkSetClampMacro(CoordinatePrecision, int, 0, 12);
  vtkGetMacro(CoordinatePrecision, int);

  // Description:
  // Replace the contents of output with the jittered features
  void Jitter(const std::vector<vtkPointMapType::PointFeature>& input,
    std::vector<vtkPointMapType::JitteredFeature>& output);

  // Description:
  // Jitter radius in degrees for a group of the given size
  double ComputeRadius(int groupSize) const;

  // Description:
  // Number of groups with more than one member in the last Jitter() call
  vtkGetMacro(NumberOfCoincidenceGroups, vtkIdType);

protected:
  vtkCoincidenceJitterer();
  ~vtkCoincidenceJitterer() override;

  double BaseRadius;
  double CapFactor;
  int CoordinatePrecision;
  vtkIdType NumberOfCoincidenceGroups;

private:
  vtkCoincidenceJitterer(const vtkCoincidenceJitterer&) = delete;
  vtkCoincidenceJitterer& operator=(const vtkCoincidenceJitterer&) = delete;
};

#endif // __vtkCoincidenceJitterer_h
