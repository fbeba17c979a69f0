/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkSpiderLegFeature.h"
#include "vtkMercator.h"
#include "vtkPointMap_typedef.h"

#include <vtkCellArray.h>
#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkPoints.h>
#include <vtkPolyData.h>
#include <vtkProperty.h>

vtkStandardNewMacro(vtkSpiderLegFeature);

//----------------------------------------------------------------------------
vtkSpiderLegFeature::vtkSpiderLegFeature()
  : vtkPolydataFeature()
{
  this->Anchor[0] = this->Anchor[1] = 0.0;
  this->PolyData = vtkPolyData::New();

  this->SetColor("#b45309");
  this->SetOpacity(0.6);
  this->Actor->GetProperty()->SetLineWidth(1.5);
}

//----------------------------------------------------------------------------
vtkSpiderLegFeature::~vtkSpiderLegFeature()
{
  this->PolyData->Delete();
}

//----------------------------------------------------------------------------
void vtkSpiderLegFeature::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Anchor: " << this->Anchor[0] << ", " << this->Anchor[1]
     << "\n"
     << indent << "Number Of Legs: " << this->LegOffsets.size() << std::endl;
}

//----------------------------------------------------------------------------
void vtkSpiderLegFeature::SetLegOffsets(
  const std::vector<std::array<double, 2> >& offsets)
{
  this->LegOffsets = offsets;
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkSpiderLegFeature::BuildGeometry()
{
  vtkPointMap* map = this->GetMap();
  if (!map)
  {
    return;
  }

  const double wpp = map->GetWorldUnitsPerPixel();
  const double x = this->Anchor[0];
  const double y = vtkMercator::lat2y(vtkMercator::validLatitude(this->Anchor[1]));

  vtkNew<vtkPoints> points;
  vtkNew<vtkCellArray> lines;
  const vtkIdType origin = points->InsertNextPoint(x, y, 0.0);
  for (const auto& offset : this->LegOffsets)
  {
    lines->InsertNextCell(2);
    lines->InsertCellPoint(origin);
    lines->InsertCellPoint(
      points->InsertNextPoint(x + offset[0] * wpp, y + offset[1] * wpp, 0.0));
  }

  this->PolyData->Initialize();
  this->PolyData->SetPoints(points.GetPointer());
  this->PolyData->SetLines(lines.GetPointer());
}

//----------------------------------------------------------------------------
void vtkSpiderLegFeature::Init()
{
  this->Mapper->SetInputData(this->PolyData);
  this->Superclass::Init();
  this->BuildGeometry();
}

//----------------------------------------------------------------------------
void vtkSpiderLegFeature::Update()
{
  this->BuildGeometry();
  this->Superclass::Update();
}
