/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkLayer.h"

#include <vtkProp.h>

//----------------------------------------------------------------------------
vtkLayer::vtkLayer()
  : Visibility(true)
  , ZCoord(0.0)
  , Map(nullptr)
  , Renderer(nullptr)
{
}

//----------------------------------------------------------------------------
vtkLayer::~vtkLayer() {}

//----------------------------------------------------------------------------
void vtkLayer::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Name: " << this->Name << "\n"
     << indent << "Visibility: " << this->Visibility << "\n"
     << indent << "ZCoord: " << this->ZCoord << "\n"
     << indent << "Asynchronous: " << this->IsAsynchronous() << "\n"
     << indent << "Map: " << this->Map << "\n";
}

//----------------------------------------------------------------------------
void vtkLayer::SetName(const std::string& name)
{
  if (name != this->Name)
  {
    this->Name = name;
    this->Modified();
  }
}

//----------------------------------------------------------------------------
void vtkLayer::SetMap(vtkPointMap* map)
{
  if (this->Map == map)
  {
    return;
  }

  this->Map = map;
  this->Renderer = map ? map->GetRenderer() : nullptr;
  this->Modified();
}

//----------------------------------------------------------------------------
vtkPointMap::AsyncState vtkLayer::ResolveAsync()
{
  vtkWarningMacro("ResolveAsync() called on synchronous layer " << this->Name);
  return vtkPointMap::AsyncOff;
}

//----------------------------------------------------------------------------
bool vtkLayer::CanRegister(vtkProp* prop, const char* action)
{
  if (!prop)
  {
    vtkErrorMacro("Cannot " << action << " a null prop");
    return false;
  }
  if (!this->Renderer)
  {
    vtkErrorMacro("Cannot " << action << " a prop, layer " << this->Name
                            << " has no renderer");
    return false;
  }
  return true;
}

//----------------------------------------------------------------------------
bool vtkLayer::AddActor(vtkProp* prop)
{
  if (!this->CanRegister(prop, "add"))
  {
    return false;
  }
  this->Renderer->AddActor(prop);
  return true;
}

//----------------------------------------------------------------------------
bool vtkLayer::AddActor2D(vtkProp* prop)
{
  if (!this->CanRegister(prop, "add"))
  {
    return false;
  }
  this->Renderer->AddActor2D(prop);
  return true;
}

//----------------------------------------------------------------------------
bool vtkLayer::RemoveActor(vtkProp* prop)
{
  if (!this->CanRegister(prop, "remove"))
  {
    return false;
  }
  this->Renderer->RemoveViewProp(prop);
  return true;
}
