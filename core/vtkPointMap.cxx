/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/

#include "vtkPointMap.h"
#include "Timer.h"
#include "vtkFeatureLayer.h"
#include "vtkInteractorStylePointMap.h"
#include "vtkLayer.h"
#include "vtkMercator.h"

// VTK Includes
#include <vtkCallbackCommand.h>
#include <vtkCamera.h>
#include <vtkObjectFactory.h>
#include <vtkRenderWindow.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>

#include <algorithm>
#include <cmath>

vtkStandardNewMacro(vtkPointMap);

namespace
{
// Camera height above the map plane. Layers live in [0, 1].
const double CAMERA_DISTANCE = 10.0;

double easeInOut(double t)
{
  return t < 0.5 ? 2.0 * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 2.0) / 2.0;
}
}

//----------------------------------------------------------------------------
static void StaticPollingCallback(vtkObject* vtkNotUsed(caller),
  long unsigned int vtkNotUsed(eventId), void* clientData,
  void* vtkNotUsed(callData))
{
  vtkPointMap* self = static_cast<vtkPointMap*>(clientData);
  self->PollingCallback();
}

//----------------------------------------------------------------------------
vtkPointMap::vtkPointMap()
  : InteractorStyle(vtkSmartPointer<vtkInteractorStylePointMap>::New())
  , AnimationTimer(new vtkPointMapType::Timer)
{
  this->Renderer = nullptr;
  this->InteractorStyle->SetMap(this);

  this->Zoom = 1;
  this->Center[0] = this->Center[1] = 0.0;
  this->ViewportSize[0] = 800;
  this->ViewportSize[1] = 600;
  this->Initialized = false;
  this->PollingCallbackCommand = nullptr;
  this->CurrentAsyncState = AsyncOff;
  for (int i = 0; i < 3; ++i)
  {
    this->AnimationStart[i] = this->AnimationTarget[i] = 0.0;
  }
}

//----------------------------------------------------------------------------
vtkPointMap::~vtkPointMap()
{
  for (auto& layer : this->Layers)
  {
    vtkFeatureLayer* featureLayer = vtkFeatureLayer::SafeDownCast(layer);
    if (featureLayer)
    {
      featureLayer->RemoveAllFeatures();
    }
    layer->SetMap(nullptr);
  }
  this->Layers.clear();

  if (this->PollingCallbackCommand)
  {
    if (this->Interactor)
    {
      this->Interactor->RemoveObserver(this->PollingCallbackCommand);
    }
    this->PollingCallbackCommand->Delete();
  }
  if (this->Interactor)
  {
    this->Interactor->UnRegister(this);
  }
  if (this->Renderer)
  {
    this->Renderer->UnRegister(this);
  }
}

//----------------------------------------------------------------------------
void vtkPointMap::PrintSelf(ostream& os, vtkIndent indent)
{
  Superclass::PrintSelf(os, indent);
  os << indent << "Zoom Level: " << this->Zoom << "\n"
     << indent << "Center Lat/Lon: " << this->Center[0] << " "
     << this->Center[1] << "\n"
     << indent << "Initialized: " << this->Initialized << "\n"
     << indent << "Number Of Layers: " << this->Layers.size() << "\n"
     << indent << "Animating: " << this->Animating << std::endl;
}

//----------------------------------------------------------------------------
void vtkPointMap::SetRenderer(vtkRenderer* ren)
{
  if (this->Renderer == ren)
  {
    return;
  }
  if (this->Renderer)
  {
    this->Renderer->UnRegister(this);
  }
  this->Renderer = ren;
  if (this->Renderer)
  {
    this->Renderer->Register(this);
  }
  this->Initialized = false;
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPointMap::SetVisibleBounds(double latLngCoords[4])
{
  // Clip input coords to max lat/lon supported by web mercator (for now)
  double validCoords[4];
  validCoords[0] = vtkMercator::validLatitude(latLngCoords[0]);
  validCoords[1] = vtkMercator::validLongitude(latLngCoords[1]);
  validCoords[2] = vtkMercator::validLatitude(latLngCoords[2]);
  validCoords[3] = vtkMercator::validLongitude(latLngCoords[3]);

  // Convert to gcs coordinates
  double worldCoords[4];
  worldCoords[0] = validCoords[1];
  worldCoords[1] = vtkMercator::lat2y(validCoords[0]);
  worldCoords[2] = validCoords[3];
  worldCoords[3] = vtkMercator::lat2y(validCoords[2]);

  // Compute size as the larger of delta lon/lat
  double dx = fabs(worldCoords[2] - worldCoords[0]);
  if (dx > 180.0)
  {
    // If > 180, then points wrap around the 180th meridian
    dx = 360.0 - dx;
  }
  double dy = fabs(worldCoords[3] - worldCoords[1]);
  double delta = dx > dy ? dx : dy;

  // Compute zoom level
  double maxDelta = 360.0;
  double maxZoom = 20; // NB: from 0 to 19
  int zoom = 0;
  double scaledDelta = delta;
  for (zoom = 0; scaledDelta < maxDelta && zoom < maxZoom; zoom++)
  {
    scaledDelta *= 2.0;
  }

  // Update center and zoom
  double center[2];
  center[0] = 0.5 * (validCoords[0] + validCoords[2]);
  center[1] = 0.5 * (validCoords[1] + validCoords[3]);
  this->SetZoom(zoom > 0 ? zoom - 1 : 0);
  this->SetCenter(center);
}

//----------------------------------------------------------------------------
void vtkPointMap::GetCenter(double latlngPoint[2])
{
  latlngPoint[0] = this->Center[0];
  latlngPoint[1] = this->Center[1];
}

//----------------------------------------------------------------------------
void vtkPointMap::SetZoom(int zoom)
{
  zoom = std::max(0, std::min(19, zoom));
  if (this->Zoom == zoom)
  {
    return;
  }

  this->NotifyViewChange();
  this->Zoom = zoom;
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPointMap::NotifyViewChange()
{
  if (!this->AdvancingAnimation)
  {
    this->InvokeEvent(UserInteractionEvent);
  }
}

//----------------------------------------------------------------------------
void vtkPointMap::SetCenter(double latLonPoint[2])
{
  this->SetCenter(latLonPoint[0], latLonPoint[1]);
}

//----------------------------------------------------------------------------
void vtkPointMap::SetCenter(double latitude, double longitude)
{
  latitude = vtkMercator::validLatitude(latitude);
  longitude = vtkMercator::validLongitude(longitude);
  if (this->Center[0] == latitude && this->Center[1] == longitude)
  {
    return;
  }

  this->NotifyViewChange();
  this->Center[0] = latitude;
  this->Center[1] = longitude;

  // If initialized, update camera position
  if (this->Initialized)
  {
    this->UpdateCamera();
  }

  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPointMap::GetViewportSize(int size[2])
{
  int* renSize = this->Renderer ? this->Renderer->GetSize() : nullptr;
  if (renSize && renSize[0] > 0 && renSize[1] > 0)
  {
    size[0] = renSize[0];
    size[1] = renSize[1];
    return;
  }

  size[0] = this->ViewportSize[0];
  size[1] = this->ViewportSize[1];
}

//----------------------------------------------------------------------------
void vtkPointMap::AddLayer(vtkLayer* layer)
{
  if (!this->Renderer)
  {
    vtkWarningMacro("Cannot add layer to vtkPointMap."
      << " Must set map's renderer *before* adding layers.");
    return;
  }

  if (!layer)
  {
    return;
  }

  LayerContainer::iterator it =
    std::find(this->Layers.begin(), this->Layers.end(), layer);
  if (it == this->Layers.end())
  {
    this->Layers.push_back(layer);
  }

  layer->SetMap(this);
  this->UpdateLayerSequence();
}

//----------------------------------------------------------------------------
void vtkPointMap::RemoveLayer(vtkLayer* layer)
{
  auto itLayer = std::find(this->Layers.begin(), this->Layers.end(), layer);
  if (itLayer == this->Layers.end())
  {
    return;
  }

  // Release the props of any features before detaching the layer
  vtkFeatureLayer* featureLayer = vtkFeatureLayer::SafeDownCast(layer);
  if (featureLayer)
  {
    featureLayer->RemoveAllFeatures();
  }

  vtkSmartPointer<vtkLayer> holder = *itLayer;
  this->Layers.erase(itLayer);
  holder->SetMap(nullptr);
  this->UpdateLayerSequence();
}

//----------------------------------------------------------------------------
vtkLayer* vtkPointMap::FindLayer(const char* name)
{
  vtkLayer* result = nullptr; // return value

  LayerContainer::iterator it = this->Layers.begin();
  for (; it != this->Layers.end(); it++)
  {
    vtkLayer* layer = *it;
    if (layer->GetName() == name)
    {
      result = layer;
      break;
    }
  }

  return result;
}

//----------------------------------------------------------------------------
void vtkPointMap::UpdateLayerSequence()
{
  // Stack layers along z, later layers on top
  for (size_t i = 0; i < this->Layers.size(); ++i)
  {
    this->Layers[i]->SetZCoord(0.01 * static_cast<double>(i + 1));
  }
}

//----------------------------------------------------------------------------
void vtkPointMap::UpdateCamera()
{
  vtkCamera* camera = this->Renderer->GetActiveCamera();
  camera->ParallelProjectionOn();

  double x = this->Center[1];
  double y = vtkMercator::lat2y(this->Center[0]);
  camera->SetPosition(x, y, CAMERA_DISTANCE);
  camera->SetFocalPoint(x, y, 0.0);
  camera->SetViewUp(0.0, 1.0, 0.0);
  camera->SetClippingRange(0.1, 2.0 * CAMERA_DISTANCE);

  // Camera parallel scale == 1/2 the viewport height in world coords.
  // Each tile is 360 / 2**zoom in world coords
  // Each tile is 256 (pixels) in display coords
  int renSize[2];
  this->GetViewportSize(renSize);
  int zoomLevelFactor = 1 << this->Zoom;
  const double displayScaling = 1.0 / this->DevicePixelRatio;
  double parallelScale =
    displayScaling * 0.5 * (renSize[1] * 360.0 / zoomLevelFactor) / 256.0;
  camera->SetParallelScale(parallelScale);
}

//----------------------------------------------------------------------------
void vtkPointMap::Update()
{
  if (!this->Renderer)
  {
    return;
  }

  if (!this->Initialized)
  {
    this->Initialize();
  }

  this->InvokeEvent(vtkCommand::UpdateEvent);

  this->UpdateCamera();

  for (size_t i = 0; i < this->Layers.size(); ++i)
  {
    this->Layers[i]->Update();
  }
}

//----------------------------------------------------------------------------
void vtkPointMap::Initialize()
{
  // Initialize polling timer when an interactor is available
  vtkRenderWindowInteractor* interactor = this->Interactor;
  if (!interactor && this->Renderer->GetRenderWindow())
  {
    interactor = this->Renderer->GetRenderWindow()->GetInteractor();
  }
  if (interactor && !this->PollingCallbackCommand)
  {
    if (interactor != this->Interactor)
    {
      this->SetInteractor(interactor);
    }
    this->PollingCallbackCommand = vtkCallbackCommand::New();
    this->PollingCallbackCommand->SetClientData(this);
    this->PollingCallbackCommand->SetCallback(StaticPollingCallback);

    interactor->CreateRepeatingTimer(31); // prime number > 30 fps
    interactor->AddObserver(
      vtkCommand::TimerEvent, this->PollingCallbackCommand);
  }

  this->Renderer->SetBackground(0.96, 0.94, 0.89);
  this->UpdateCamera();
  this->UpdateLayerSequence();

  this->Initialized = true;
  vtkDebugMacro("Map initialized");
  this->InvokeEvent(ReadyEvent);
}

//----------------------------------------------------------------------------
void vtkPointMap::Draw()
{
  if (!this->Renderer)
  {
    return;
  }

  this->Update();
  if (this->Renderer->GetRenderWindow())
  {
    this->Renderer->GetRenderWindow()->Render();
  }
}

//----------------------------------------------------------------------------
bool vtkPointMap::IsReady() const
{
  return this->Renderer != nullptr && this->Initialized;
}

//----------------------------------------------------------------------------
vtkPointMap::AsyncState vtkPointMap::GetAsyncState()
{
  return this->CurrentAsyncState;
}

//----------------------------------------------------------------------------
double vtkPointMap::GetWorldUnitsPerPixel()
{
  return vtkMercator::worldUnitsPerPixel(this->Zoom) / this->DevicePixelRatio;
}

//----------------------------------------------------------------------------
void vtkPointMap::ComputeLatLngCoords(
  const double displayCoords[2], double latLngCoords[2])
{
  int size[2];
  this->GetViewportSize(size);
  const double wpp = this->GetWorldUnitsPerPixel();

  double x = this->Center[1] + (displayCoords[0] - 0.5 * size[0]) * wpp;
  double y = vtkMercator::lat2y(this->Center[0]) +
    (displayCoords[1] - 0.5 * size[1]) * wpp;

  latLngCoords[0] = vtkMercator::validLatitude(vtkMercator::y2lat(y));
  latLngCoords[1] = vtkMercator::validLongitude(x);
}

//----------------------------------------------------------------------------
void vtkPointMap::ComputeDisplayCoords(
  const double latLngCoords[2], double displayCoords[2])
{
  int size[2];
  this->GetViewportSize(size);
  const double wpp = this->GetWorldUnitsPerPixel();

  double dx = latLngCoords[1] - this->Center[1];
  double dy =
    vtkMercator::lat2y(latLngCoords[0]) - vtkMercator::lat2y(this->Center[0]);
  displayCoords[0] = 0.5 * size[0] + dx / wpp;
  displayCoords[1] = 0.5 * size[1] + dy / wpp;
}

//----------------------------------------------------------------------------
void vtkPointMap::PanBy(double dx, double dy)
{
  const double wpp = this->GetWorldUnitsPerPixel();
  double x = this->Center[1] - dx * wpp;
  double y = vtkMercator::lat2y(this->Center[0]) - dy * wpp;
  this->SetCenter(vtkMercator::y2lat(y), x);
}

//----------------------------------------------------------------------------
void vtkPointMap::EaseTo(double latitude, double longitude, int zoom)
{
  if (this->Animating)
  {
    this->StopAnimation();
  }

  this->AnimationStart[0] = this->Center[0];
  this->AnimationStart[1] = this->Center[1];
  this->AnimationStart[2] = this->Zoom;
  this->AnimationTarget[0] = vtkMercator::validLatitude(latitude);
  this->AnimationTarget[1] = vtkMercator::validLongitude(longitude);
  this->AnimationTarget[2] = std::max(0, std::min(19, zoom));
  this->AnimationTimer->Restart();
  this->Animating = true;
  vtkDebugMacro("EaseTo " << latitude << ", " << longitude << " zoom " << zoom);
}

//----------------------------------------------------------------------------
void vtkPointMap::StopAnimation()
{
  if (!this->Animating)
  {
    return;
  }

  this->Animating = false;
  this->InvokeEvent(AnimationCancelledEvent);
}

//----------------------------------------------------------------------------
bool vtkPointMap::AdvanceAnimation()
{
  if (!this->Animating)
  {
    return false;
  }

  const double t = this->AnimationTimer->GetProgress(this->AnimationDuration);

  this->AdvancingAnimation = true;
  if (t >= 1.0)
  {
    this->Animating = false;
    this->SetZoom(static_cast<int>(this->AnimationTarget[2]));
    this->SetCenter(this->AnimationTarget[0], this->AnimationTarget[1]);
    this->AdvancingAnimation = false;
    this->InvokeEvent(AnimationCompleteEvent);
    return true;
  }

  const double s = easeInOut(t);
  double values[3];
  for (int i = 0; i < 3; ++i)
  {
    values[i] = this->AnimationStart[i] +
      s * (this->AnimationTarget[i] - this->AnimationStart[i]);
  }
  this->SetZoom(static_cast<int>(std::floor(values[2] + 0.5)));
  this->SetCenter(values[0], values[1]);
  this->AdvancingAnimation = false;
  return true;
}

//----------------------------------------------------------------------------
void vtkPointMap::PollingCallback()
{
  AsyncState result;
  AsyncState newState = AsyncIdle;

  // Compute highest "state" of async layers
  LayerContainer allLayers(this->Layers);
  for (size_t i = 0; i < allLayers.size(); ++i)
  {
    if (allLayers[i]->IsAsynchronous())
    {
      result = allLayers[i]->ResolveAsync();
      newState = newState >= result ? newState : result;
    }
  }
  this->CurrentAsyncState = newState;

  bool viewChanged = this->AdvanceAnimation();

  this->InvokeEvent(PollEvent);

  // Redraw on partial or full update
  if (newState >= AsyncPartialUpdate || viewChanged)
  {
    this->Draw();
  }
}

//----------------------------------------------------------------------------
vtkInteractorStylePointMap* vtkPointMap::GetInteractorStyle()
{
  return this->InteractorStyle;
}

//----------------------------------------------------------------------------
void vtkPointMap::SetInteractor(vtkRenderWindowInteractor* inter)
{
  if (this->Interactor != inter)
  {
    if (this->Interactor)
    {
      if (this->PollingCallbackCommand)
      {
        this->Interactor->RemoveObserver(this->PollingCallbackCommand);
        this->PollingCallbackCommand->Delete();
        this->PollingCallbackCommand = nullptr;
      }
      this->Interactor->UnRegister(this);
    }

    this->Interactor = inter;
    if (this->Interactor)
    {
      this->Interactor->Register(this);
      this->Interactor->SetInteractorStyle(this->InteractorStyle);
    }

    this->Modified();
  }
}
