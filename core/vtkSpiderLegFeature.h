/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkSpiderLegFeature - connector lines of a spidered cluster
// .SECTION Description
// One line from the cluster anchor to each spider member. Member positions
// are offsets in display pixels from the anchor, so the legs are rebuilt
// from the current zoom level on every update.
//

#ifndef __vtkSpiderLegFeature_h
#define __vtkSpiderLegFeature_h

#include "vtkPolydataFeature.h"
#include "vtkpointmapcore_export.h"

#include <array>
#include <vector>

class vtkPolyData;

class VTKPOINTMAPCORE_EXPORT vtkSpiderLegFeature : public vtkPolydataFeature
{
public:
  static vtkSpiderLegFeature* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkSpiderLegFeature, vtkPolydataFeature);

  // Description:
  // Cluster position as [longitude, latitude]
  vtkSetVector2Macro(Anchor, double);
  vtkGetVector2Macro(Anchor, double);

  void SetLegOffsets(const std::vector<std::array<double, 2> >& offsets);
  std::size_t GetNumberOfLegs() const { return this->LegOffsets.size(); }

  void Init() override;
  void Update() override;

protected:
  vtkSpiderLegFeature();
  ~vtkSpiderLegFeature() override;

  void BuildGeometry();

  double Anchor[2];
  std::vector<std::array<double, 2> > LegOffsets;
  vtkPolyData* PolyData;

private:
  vtkSpiderLegFeature(const vtkSpiderLegFeature&) = delete;
  vtkSpiderLegFeature& operator=(const vtkSpiderLegFeature&) = delete;
};

#endif // __vtkSpiderLegFeature_h
