/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPolydataFeature.h"
#include "vtkPointMap_typedef.h"

#include <vtkObjectFactory.h>
#include <vtkProperty.h>

vtkStandardNewMacro(vtkPolydataFeature);

//----------------------------------------------------------------------------
vtkPolydataFeature::vtkPolydataFeature()
  : Actor(vtkActor::New())
  , Mapper(vtkPolyDataMapper::New())
{
  this->Actor->SetMapper(this->Mapper);
  this->Actor->GetProperty()->LightingOff();
  this->Actor->PickableOff();
}

//----------------------------------------------------------------------------
vtkPolydataFeature::~vtkPolydataFeature()
{
  this->Actor->Delete();
  this->Mapper->Delete();
}

//----------------------------------------------------------------------------
void vtkPolydataFeature::PrintSelf(std::ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Opacity: " << this->Actor->GetProperty()->GetOpacity() << "\n";
}

//----------------------------------------------------------------------------
void vtkPolydataFeature::SetColor(const std::string& hex)
{
  double rgb[3];
  vtkPointMapType::HexToRGB(hex, rgb);
  this->Actor->GetProperty()->SetColor(rgb);
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPolydataFeature::SetOpacity(double opacity)
{
  this->Actor->GetProperty()->SetOpacity(opacity);
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPolydataFeature::Init()
{
  if (!this->Layer)
  {
    vtkErrorMacro("Feature " << this->Key << " initialized outside of a layer");
    return;
  }

  this->Actor->SetPosition(0.0, 0.0, this->GetLayerZCoord());
  this->Actor->SetVisibility(this->IsVisible());
  this->Layer->AddActor(this->Actor);
  this->BuildTime.Modified();
}

//----------------------------------------------------------------------------
void vtkPolydataFeature::Update()
{
  this->Actor->SetVisibility(this->IsVisible());
  this->UpdateTime.Modified();
}

//----------------------------------------------------------------------------
void vtkPolydataFeature::CleanUp()
{
  if (this->Layer)
  {
    this->Layer->RemoveActor(this->Actor);
  }
  this->SetLayer(nullptr);
}
