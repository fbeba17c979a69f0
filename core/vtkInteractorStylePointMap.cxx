/*=========================================================================

  Program:   Visualization Toolkit
  Module:    vtkPointMap

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkInteractorStylePointMap.h"
#include "Timer.h"
#include "vtkPointMap.h"

#include <vtkObjectFactory.h>
#include <vtkRenderWindow.h>
#include <vtkRenderWindowInteractor.h>

#include <cstdlib>

vtkStandardNewMacro(vtkInteractorStylePointMap);

//-----------------------------------------------------------------------------
vtkInteractorStylePointMap::vtkInteractorStylePointMap()
  : vtkInteractorStyle()
  , Map(nullptr)
  , Timer(new vtkPointMapType::Timer)
{
  this->StartPosition[0] = this->StartPosition[1] = 0;
  this->LastPosition[0] = this->LastPosition[1] = 0;
}

//-----------------------------------------------------------------------------
vtkInteractorStylePointMap::~vtkInteractorStylePointMap() {}

//-----------------------------------------------------------------------------
void vtkInteractorStylePointMap::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "DoubleClickDelay: " << this->DoubleClickDelay << "\n"
     << indent << "ClickTolerance: " << this->ClickTolerance << std::endl;
}

//-----------------------------------------------------------------------------
void vtkInteractorStylePointMap::SetMap(vtkPointMap* map)
{
  this->Map = map;
}

//-----------------------------------------------------------------------------
void vtkInteractorStylePointMap::OnLeftButtonDown()
{
  int* pos = this->Interactor->GetEventPosition();
  if (this->IsDoubleClick())
  {
    this->ZoomIn(1);
    this->ButtonDown = false;
    return;
  }

  this->StartPosition[0] = this->LastPosition[0] = pos[0];
  this->StartPosition[1] = this->LastPosition[1] = pos[1];
  this->ButtonDown = true;
  this->MouseMoved = false;
}

//-----------------------------------------------------------------------------
void vtkInteractorStylePointMap::OnLeftButtonUp()
{
  if (!this->ButtonDown)
  {
    return;
  }
  this->ButtonDown = false;

  if (this->Interactor->GetRenderWindow())
  {
    this->Interactor->GetRenderWindow()->SetCurrentCursor(VTK_CURSOR_DEFAULT);
  }

  if (!this->MouseMoved && this->Map)
  {
    double displayCoords[2] = { static_cast<double>(this->StartPosition[0]),
      static_cast<double>(this->StartPosition[1]) };
    vtkDebugMacro("Click at " << displayCoords[0] << ", " << displayCoords[1]);
    this->Map->InvokeEvent(vtkPointMap::DisplayClickEvent, displayCoords);
    this->Map->Draw();
  }
  this->MouseMoved = false;
}

//-----------------------------------------------------------------------------
bool vtkInteractorStylePointMap::IsDoubleClick()
{
  // Second click within the delay of the first
  const bool onTime = this->MouseClicks > 0 &&
    this->Timer->GetElapsedMilliseconds() < static_cast<long long>(this->DoubleClickDelay);
  if (onTime)
  {
    this->MouseClicks = 0;
    return true;
  }

  this->MouseClicks = 1;
  this->Timer->Restart();
  return false;
}

//--------------------------------------------------------------------------
void vtkInteractorStylePointMap::OnMouseMove()
{
  if (!this->Map)
  {
    return;
  }

  int* pos = this->Interactor->GetEventPosition();
  if (!this->ButtonDown)
  {
    double displayCoords[2] = { static_cast<double>(pos[0]),
      static_cast<double>(pos[1]) };
    this->Map->InvokeEvent(vtkPointMap::DisplayHoverEvent, displayCoords);
    return;
  }

  if (!this->MouseMoved)
  {
    const int dx = std::abs(pos[0] - this->StartPosition[0]);
    const int dy = std::abs(pos[1] - this->StartPosition[1]);
    if (dx <= this->ClickTolerance && dy <= this->ClickTolerance)
    {
      return;
    }
    this->MouseMoved = true;
    if (this->Interactor->GetRenderWindow())
    {
      this->Interactor->GetRenderWindow()->SetCurrentCursor(VTK_CURSOR_SIZEALL);
    }
  }

  this->PanMap(pos[0] - this->LastPosition[0], pos[1] - this->LastPosition[1]);
  this->LastPosition[0] = pos[0];
  this->LastPosition[1] = pos[1];
}

//----------------------------------------------------------------------------
void vtkInteractorStylePointMap::OnMouseWheelForward()
{
  this->ZoomIn(1);
}

//----------------------------------------------------------------------------
void vtkInteractorStylePointMap::OnMouseWheelBackward()
{
  this->ZoomOut(1);
}

//-----------------------------------------------------------------------------
void vtkInteractorStylePointMap::PanMap(double dx, double dy)
{
  if (!this->Map)
  {
    return;
  }

  this->Map->InvokeEvent(vtkPointMap::UserInteractionEvent);
  this->Map->StopAnimation();
  this->Map->PanBy(dx, dy);
  this->Map->Draw();
}

//-----------------------------------------------------------------------------
void vtkInteractorStylePointMap::ZoomIn(int levels)
{
  if (this->Map && this->Map->GetZoom() < 19)
  {
    this->Map->InvokeEvent(vtkPointMap::UserInteractionEvent);
    this->Map->StopAnimation();
    this->Map->SetZoom(this->Map->GetZoom() + levels);
    this->Map->Draw();
  }
}

//-----------------------------------------------------------------------------
void vtkInteractorStylePointMap::ZoomOut(int levels)
{
  if (this->Map && this->Map->GetZoom() > 0)
  {
    this->Map->InvokeEvent(vtkPointMap::UserInteractionEvent);
    this->Map->StopAnimation();
    this->Map->SetZoom(this->Map->GetZoom() - levels);
    this->Map->Draw();
  }
}
