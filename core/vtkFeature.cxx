/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkFeature.h"

//----------------------------------------------------------------------------
vtkFeature::vtkFeature()
  : Visibility(true)
{
}

//----------------------------------------------------------------------------
vtkFeature::~vtkFeature() {}

//----------------------------------------------------------------------------
void vtkFeature::PrintSelf(std::ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Key: " << this->Key << "\n"
     << indent << "Visibility: " << this->Visibility << "\n"
     << indent << "Layer: " << this->Layer.GetPointer() << "\n";
}

//----------------------------------------------------------------------------
bool vtkFeature::IsVisible()
{
  return this->Visibility && this->Layer && this->Layer->GetVisibility();
}

//----------------------------------------------------------------------------
bool vtkFeature::HitTest(const double vtkNotUsed(displayCoords)[2],
  vtkPointMapType::PickResult& vtkNotUsed(result))
{
  return false;
}

//----------------------------------------------------------------------------
vtkPointMap* vtkFeature::GetMap()
{
  return this->Layer ? this->Layer->GetMap() : nullptr;
}

//----------------------------------------------------------------------------
double vtkFeature::GetLayerZCoord()
{
  return this->Layer ? this->Layer->GetZCoord() : 0.0;
}
