/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointMap - Map representation using vtk rendering components.
//
// .SECTION Description
//
// Manages a stack of vtkLayer instances drawn by a single vtkRenderer whose
// camera looks at the web-mercator plane with a parallel projection. The
// visible area is defined by an integer zoom level and a center; the
// transformation between lat-lon and display coordinates is computed
// analytically from those and the viewport size, so it is available before
// anything has been rendered.
//
// The map also drives the periodic polling used by asynchronous layers and
// the camera animations requested through EaseTo().
//
// Interaction is delegated to vtkInteractorStylePointMap, which reports user
// actions through the events listed in vtkPointMap::Events.
//
// \sa vtkInteractorStylePointMap
//

#ifndef __vtkPointMap_h
#define __vtkPointMap_h
#include <memory>
#include <string>
#include <vector>

#include <vtkCommand.h>
#include <vtkObject.h>
#include <vtkSmartPointer.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

class vtkCallbackCommand;
class vtkInteractorStylePointMap;
class vtkLayer;
class vtkRenderer;
class vtkRenderWindowInteractor;

namespace vtkPointMapType
{
class Timer;
}

class VTKPOINTMAPCORE_EXPORT vtkPointMap : public vtkObject
{
public:
  using LayerContainer = std::vector<vtkSmartPointer<vtkLayer> >;

  // Description:
  // State of asynchronous layers
  enum AsyncState
  {
    AsyncOff = 0,       // layer is not asynchronous
    AsyncIdle,          // no work scheduled
    AsyncPending,       // work in progress
    AsyncPartialUpdate, // some work completed
    AsyncFullUpdate     // all work completed
  };

  enum Events
  {
    // User started a pan or zoom, or the view is changed through
    // SetZoom()/SetCenter() outside of an animation. Invoked before the
    // view changes.
    UserInteractionEvent = vtkCommand::UserEvent + 100,
    // Single click, calldata is double[2] display coordinates
    DisplayClickEvent,
    // Mouse moved without button, calldata is double[2] display coordinates
    DisplayHoverEvent,
    AnimationCompleteEvent,
    AnimationCancelledEvent,
    // Map initialized and able to accept content
    ReadyEvent,
    // Invoked on every PollingCallback()
    PollEvent
  };

  static vtkPointMap* New();
  void PrintSelf(ostream& os, vtkIndent indent) override;
  vtkTypeMacro(vtkPointMap, vtkObject)

  // Description:
  // Get/Set the renderer to which map content will be added
  // The map takes a reference to the renderer. This ensures that map can
  // delete its contents before the renderer is deleted.
  void SetRenderer(vtkRenderer* ren);
  vtkGetMacro(Renderer, vtkRenderer*)

  // Description:
  // Interactor on which vtkInteractorStylePointMap is installed.
  void SetInteractor(vtkRenderWindowInteractor* interactor);
  vtkInteractorStylePointMap* GetInteractorStyle();

  // Description:
  // Get/Set the detailing level
  vtkGetMacro(Zoom, int)
  void SetZoom(int zoom);

  // Description:
  // Get/Set center of the map, as [latitude, longitude]
  void GetCenter(double latlngPoint[2]);
  void SetCenter(double latlngPoint[2]);
  void SetCenter(double latitude, double longitude);

  // Description:
  // Set center & zoom level to display area of interest.
  // The 4 coordinates specify a rectangle in lon-lat units:
  // [latitude1, longitude1, latitude2, longitude2]
  void SetVisibleBounds(double latlngCoords[4]);

  // Description:
  // Viewport size used for coordinate transformations when the renderer
  // is not attached to a render window. Default is 800 x 600.
  vtkSetVector2Macro(ViewportSize, int);
  vtkGetVector2Macro(ViewportSize, int);

  // Description:
  // Current viewport size in pixels
  void GetViewportSize(int size[2]);

  // Description:
  // Add / Remove layer from the map. Layers added later are drawn on top.
  void AddLayer(vtkLayer* layer);
  void RemoveLayer(vtkLayer* layer);
  vtkLayer* FindLayer(const char* name);
  std::size_t GetNumberOfLayers() const { return this->Layers.size(); }

  // Description:
  // Update the map contents for the current view
  void Update();

  // Description:
  // Update the renderer with relevant map content
  void Draw();

  // Description:
  // True once a renderer is set and the map has been initialized by the
  // first Update()/Draw(). Content must only be added when ready.
  bool IsReady() const;

  // Description:
  // Periodically poll asynchronous layers and advance camera animations.
  // Driven by an interactor timer when an interactor is available.
  void PollingCallback();

  // Description:
  // Current state of asynchronous layers
  enum AsyncState GetAsyncState();

  // Description:
  // Compute [latitude, longitude] for given display coordinates
  void ComputeLatLngCoords(const double displayCoords[2], double latLngCoords[2]);

  // Description:
  // Compute display coordinates for given [latitude, longitude]
  void ComputeDisplayCoords(const double latLngCoords[2], double displayCoords[2]);

  // Description:
  // World units covered by one display pixel at the current zoom level
  double GetWorldUnitsPerPixel();

  // Description:
  // Move the view by the given offset in display pixels
  void PanBy(double dx, double dy);

  // Description:
  // Animate the view to the given center and zoom level. An animation
  // already in progress is superseded (AnimationCancelledEvent) rather than
  // queued. AnimationCompleteEvent is invoked when the target is reached.
  void EaseTo(double latitude, double longitude, int zoom);
  void StopAnimation();
  bool IsAnimating() const { return this->Animating; }

  // Description:
  // Duration of EaseTo() animations in milliseconds. With a duration of 0
  // the target is reached on the next PollingCallback().
  vtkSetClampMacro(AnimationDuration, int, 0, 10000);
  vtkGetMacro(AnimationDuration, int);

  vtkSetMacro(DevicePixelRatio, int);
  int GetDevicePixelRatio() const { return this->DevicePixelRatio; }

protected:
  vtkPointMap();
  ~vtkPointMap() override;

  void Initialize();

  // Description:
  // Invoke UserInteractionEvent unless the change comes from an animation
  void NotifyViewChange();

  void UpdateLayerSequence();

  void UpdateCamera();

  // Advances the current animation, returns true if the view changed
  bool AdvanceAnimation();

  // Description:
  // The renderer used to draw the maps
  vtkRenderer* Renderer;

  // Description:
  // The interactor style used by the map
  vtkSmartPointer<vtkInteractorStylePointMap> InteractorStyle;

  // Description:
  // Set Zoom level, which determines the level of detailing
  int Zoom;

  // Description:
  // Center of the map [latitude, longitude]
  double Center[2];

  int ViewportSize[2];

  bool Initialized;

  // Description:
  // List of layers attached to the map
  LayerContainer Layers;

  // Description:
  // Callback method for polling timer
  vtkCallbackCommand* PollingCallbackCommand;

  // Description:
  // Current state of asynchronous layers
  AsyncState CurrentAsyncState;

  int DevicePixelRatio = 1;

  //@{
  /**
   * Camera animation state
   */
  bool Animating = false;
  bool AdvancingAnimation = false;
  int AnimationDuration = 500;
  double AnimationStart[3];  // lat, lon, zoom
  double AnimationTarget[3]; // lat, lon, zoom
  std::unique_ptr<vtkPointMapType::Timer> AnimationTimer;
  //@}

private:
  vtkPointMap(const vtkPointMap&) = delete;
  vtkPointMap& operator=(const vtkPointMap&) = delete;

  vtkRenderWindowInteractor* Interactor = nullptr;
};

#endif // __vtkPointMap_h
