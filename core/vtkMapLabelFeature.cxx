/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkMapLabelFeature.h"

#include <vtkObjectFactory.h>
#include <vtkTextActor.h>
#include <vtkTextProperty.h>

#include <cmath>

vtkStandardNewMacro(vtkMapLabelFeature);

//----------------------------------------------------------------------------
vtkMapLabelFeature::vtkMapLabelFeature()
  : vtkFeature()
  , TextActor(vtkSmartPointer<vtkTextActor>::New())
{
  this->Anchor[0] = this->Anchor[1] = 0.0;
  this->DisplayOffset[0] = this->DisplayOffset[1] = 0.0;

  vtkTextProperty* prop = this->TextActor->GetTextProperty();
  prop->SetFontSize(13);
  prop->SetColor(0.1, 0.1, 0.1);
  prop->SetBackgroundColor(1.0, 1.0, 1.0);
  prop->SetBackgroundOpacity(0.9);
  prop->SetFrame(true);
  prop->SetFrameColor(0.45, 0.33, 0.2);
  prop->SetJustificationToCentered();
  prop->SetVerticalJustificationToBottom();
  this->TextActor->PickableOff();
}

//----------------------------------------------------------------------------
vtkMapLabelFeature::~vtkMapLabelFeature() {}

//----------------------------------------------------------------------------
void vtkMapLabelFeature::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Text: " << this->Text << "\n"
     << indent << "Anchor: " << this->Anchor[0] << ", " << this->Anchor[1]
     << std::endl;
}

//----------------------------------------------------------------------------
void vtkMapLabelFeature::SetText(const std::string& text)
{
  if (this->Text == text)
  {
    return;
  }
  this->Text = text;
  this->TextActor->SetInput(this->Text.c_str());
  this->Modified();
}

//----------------------------------------------------------------------------
vtkTextProperty* vtkMapLabelFeature::GetTextProperty()
{
  return this->TextActor->GetTextProperty();
}

//----------------------------------------------------------------------------
void vtkMapLabelFeature::Init()
{
  if (!this->Layer)
  {
    vtkErrorMacro("Invalid Layer!");
    return;
  }

  this->Layer->AddActor2D(this->TextActor);
  this->BuildTime.Modified();
}

//----------------------------------------------------------------------------
void vtkMapLabelFeature::Update()
{
  vtkPointMap* map = this->GetMap();
  if (map)
  {
    const double latLng[2] = { this->Anchor[1], this->Anchor[0] };
    double display[2];
    map->ComputeDisplayCoords(latLng, display);
    this->TextActor->SetDisplayPosition(
      static_cast<int>(std::floor(display[0] + this->DisplayOffset[0] + 0.5)),
      static_cast<int>(std::floor(display[1] + this->DisplayOffset[1] + 0.5)));
  }

  this->TextActor->SetVisibility(this->IsVisible());
  this->UpdateTime.Modified();
}

//----------------------------------------------------------------------------
void vtkMapLabelFeature::CleanUp()
{
  if (this->Layer)
  {
    this->Layer->RemoveActor(this->TextActor);
  }
  this->SetLayer(nullptr);
}
