/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkViewportLifecycleManager - owner of every map-attached resource
// .SECTION Description
// The manager is the only object holding the vtkPointMap. Other components
// add and remove map content through it, by key, and query the view
// through the forwarding methods below.
//
// Resources are vtkFeature instances stored in named categories. Each
// category is a vtkFeatureLayer; categories are stacked in registration
// order. Adding a feature under a key that is already registered removes
// the previous feature first.
//
// Operations that mutate the map must wait until the map is ready. They are
// queued with RunWhenReady() and run in order once it is; an operation
// queued again under the same name replaces the queued one. Each poll of
// a map that is not ready counts as a retry. When MaxReadyRetries is
// reached, RendererNotReadyEvent is invoked once and a warning is logged.
// Queued operations stay queued.
//
// Map clicks and hovers are hit-tested against the categories that have
// subscriptions, top-most first, and dispatched through the subscription
// table. Positions that hit nothing are dispatched to the "background"
// subscriptions.
//
// The manager forwards vtkPointMap::UserInteractionEvent,
// AnimationCompleteEvent and AnimationCancelledEvent to its own observers.
//

#ifndef __vtkViewportLifecycleManager_h
#define __vtkViewportLifecycleManager_h

#include <vtkCommand.h>
#include <vtkObject.h>
#include <vtkSmartPointer.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <functional>
#include <string>
#include <vector>

class vtkFeature;
class vtkFeatureLayer;
class vtkPointMap;

class VTKPOINTMAPCORE_EXPORT vtkViewportLifecycleManager : public vtkObject
{
public:
  static vtkViewportLifecycleManager* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkViewportLifecycleManager, vtkObject);

  enum Events
  {
    // Map still not ready after MaxReadyRetries, invoked once per attach
    RendererNotReadyEvent = vtkCommand::UserEvent + 300
  };

  using Operation = std::function<void()>;
  using Handler = std::function<void(const vtkPointMapType::PickResult&)>;

  struct Subscription
  {
    std::string LayerId;
    vtkPointMapType::Interaction Kind;
    Handler Callback;
  };

  // Description:
  // Attach to / detach from a map. Both are idempotent. Detaching removes
  // every resource, subscription and queued operation.
  void Attach(vtkPointMap* map);
  void Detach();
  bool IsAttached() const;

  // Description:
  // True when attached to a map that accepts content
  bool IsReady();

  // Description:
  // Register a category. A vtkFeatureLayer is created when layer is null.
  // Registering an existing name does nothing.
  void RegisterCategory(const std::string& name, vtkFeatureLayer* layer = nullptr);
  vtkFeatureLayer* GetCategoryLayer(const std::string& name);

  // Description:
  // Add a feature under key, removing any feature with the same key first.
  // Returns false when the map is not ready or the category is unknown.
  bool AddFeature(
    const std::string& category, const std::string& key, vtkFeature* feature);

  // Description:
  // Remove the feature registered under key. Unknown keys are ignored.
  bool RemoveFeature(const std::string& key);

  void ClearCategory(const std::string& category);
  vtkFeature* FindFeature(const std::string& key);
  std::size_t GetNumberOfFeatures(const std::string& category);
  std::size_t GetNumberOfFeatures() const;

  // Description:
  // Run op now if the map is ready, otherwise queue it under name
  void RunWhenReady(const std::string& name, Operation op);
  std::size_t GetNumberOfPendingOperations() const;

  // Description:
  // Run queued operations if the map is ready, otherwise count a retry
  void FlushPending();

  vtkSetClampMacro(MaxReadyRetries, int, 1, VTK_INT_MAX);
  vtkGetMacro(MaxReadyRetries, int);
  vtkGetMacro(ReadyRetries, int);

  // Description:
  // Replace / remove the whole subscription table
  void SetSubscriptions(const std::vector<Subscription>& subscriptions);
  void ClearSubscriptions();
  std::size_t GetNumberOfSubscriptions() const;

  // Description:
  // Hit-test the display position and call the matching handlers.
  // Returns true if a handler was called.
  bool DispatchInteraction(
    vtkPointMapType::Interaction kind, const double displayCoords[2]);

  // Description:
  // View access. Safe to call while detached.
  int GetZoom();
  bool ComputeDisplayCoords(const double latLngCoords[2], double displayCoords[2]);
  bool ComputeLatLngCoords(const double displayCoords[2], double latLngCoords[2]);
  void EaseTo(double latitude, double longitude, int zoom);
  void StopAnimation();
  bool IsAnimating();
  void SetAnimationDuration(int milliseconds);
  void Update();

protected:
  vtkViewportLifecycleManager();
  ~vtkViewportLifecycleManager() override;

  // Add registered category layers to the map when possible
  void AttachLayers();

  void OnMapReady(vtkObject* caller, unsigned long event, void* data);
  void OnMapPoll(vtkObject* caller, unsigned long event, void* data);
  void OnMapInteraction(vtkObject* caller, unsigned long event, void* data);
  void ForwardMapEvent(vtkObject* caller, unsigned long event, void* data);

  bool HasSubscription(const std::string& layerId) const;

  vtkSmartPointer<vtkPointMap> Map;
  int MaxReadyRetries;
  int ReadyRetries;
  bool NotReadyReported;

  class vtkInternal;
  vtkInternal* Internals;

private:
  vtkViewportLifecycleManager(const vtkViewportLifecycleManager&) = delete;
  vtkViewportLifecycleManager& operator=(const vtkViewportLifecycleManager&) = delete;
};

#endif // __vtkViewportLifecycleManager_h
