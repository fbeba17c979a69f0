/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkUncertaintyCircleFeature.h"
#include "vtkMercator.h"
#include "vtkPointMap_typedef.h"

#include <vtkCellArray.h>
#include <vtkMath.h>
#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkPoints.h>
#include <vtkPolyData.h>
#include <vtkProperty.h>

#include <cmath>

vtkStandardNewMacro(vtkUncertaintyCircleFeature);

namespace
{
const int CIRCLE_RESOLUTION = 64;
}

//----------------------------------------------------------------------------
vtkUncertaintyCircleFeature::vtkUncertaintyCircleFeature()
  : vtkPolydataFeature()
{
  this->Center[0] = this->Center[1] = 0.0;
  this->RadiusKm = 0.0;
  this->SetColor(vtkPointMapType::EvidenceLayerColor(
    vtkPointMapType::EvidenceLayer::None));
  this->SetOpacity(0.25);
}

//----------------------------------------------------------------------------
vtkUncertaintyCircleFeature::~vtkUncertaintyCircleFeature() {}

//----------------------------------------------------------------------------
void vtkUncertaintyCircleFeature::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Center: " << this->Center[0] << ", " << this->Center[1]
     << "\n"
     << indent << "RadiusKm: " << this->RadiusKm << std::endl;
}

//----------------------------------------------------------------------------
void vtkUncertaintyCircleFeature::ComputeCirclePoints(const double center[2],
  double radiusKm, int numberOfPoints, vtkPoints* points)
{
  const double dx = vtkMercator::km2lonDegrees(radiusKm, center[1]);
  const double dy = vtkMercator::km2latDegrees(radiusKm);
  for (int i = 0; i < numberOfPoints; ++i)
  {
    const double angle = 2.0 * vtkMath::Pi() * i / numberOfPoints;
    points->InsertNextPoint(
      center[0] + dx * std::cos(angle), center[1] + dy * std::sin(angle), 0.0);
  }
}

//----------------------------------------------------------------------------
void vtkUncertaintyCircleFeature::Init()
{
  vtkNew<vtkPoints> latLng;
  ComputeCirclePoints(this->Center, this->RadiusKm, CIRCLE_RESOLUTION,
    latLng.GetPointer());

  // Project to the map plane
  vtkNew<vtkPoints> points;
  vtkNew<vtkCellArray> polys;
  polys->InsertNextCell(latLng->GetNumberOfPoints());
  for (vtkIdType i = 0; i < latLng->GetNumberOfPoints(); ++i)
  {
    double p[3];
    latLng->GetPoint(i, p);
    polys->InsertCellPoint(points->InsertNextPoint(
      p[0], vtkMercator::lat2y(vtkMercator::validLatitude(p[1])), 0.0));
  }

  vtkNew<vtkPolyData> polyData;
  polyData->SetPoints(points.GetPointer());
  polyData->SetPolys(polys.GetPointer());
  this->Mapper->SetInputData(polyData.GetPointer());

  this->Superclass::Init();
}
