/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointMapEngine - renders large point sets on a vtkPointMap
// .SECTION Description
// Entry point of the library. Bulk locations, featured factoids and
// journey routes are set on the engine; Update() turns them into map
// content:
//
//   normalize -> jitter coincident points -> choose the render path of
//   every point -> cluster index over the clustered points -> features
//
// Points on the marker path get an individual vtkPointMarkerFeature. The
// others are drawn by a single vtkClusterGlyphFeature from the cluster
// index. Clicking a cluster expands it through vtkSpiderfyController;
// clicking a point shows a popup and invokes PointActivatedEvent.
//
// The rebuild only happens when the inputs or the settings were modified
// since the last one. All map content goes through the
// vtkViewportLifecycleManager, so inputs may be set and Update() called
// before the map is ready.
//
// .SECTION See Also
// vtkPointMapSettings vtkViewportLifecycleManager vtkSpiderfyController
//

#ifndef __vtkPointMapEngine_h
#define __vtkPointMapEngine_h

#include <vtkCommand.h>
#include <vtkObject.h>
#include <vtkSmartPointer.h>
#include <vtkTimeStamp.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <string>
#include <vector>

class vtkCoincidenceJitterer;
class vtkPointClusterLayer;
class vtkPointFeatureNormalizer;
class vtkPointMap;
class vtkPointMapSettings;
class vtkRenderPathSelector;
class vtkSpiderfyController;
class vtkViewportLifecycleManager;

class VTKPOINTMAPCORE_EXPORT vtkPointMapEngine : public vtkObject
{
public:
  static vtkPointMapEngine* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkPointMapEngine, vtkObject);

  enum Events
  {
    // A point was activated, calldata is const vtkPointMapType::PointFeature*
    PointActivatedEvent = vtkCommand::UserEvent + 400,
    // Cluster preview available, calldata is
    // const vtkPointMapType::ClusterPreview*
    ClusterActivatedEvent,
    // Rebuild finished, calldata is const vtkPointMapType::RenderPlanCounts*
    RenderPlanChangedEvent
  };

  // Description:
  // Input records
  void SetBulkLocations(const std::vector<vtkPointMapType::BulkLocation>& locations);
  void SetFeaturedFactoids(
    const std::vector<vtkPointMapType::FeaturedFactoid>& factoids);
  void SetJourneyRoutes(const std::vector<vtkPointMapType::JourneyRoute>& routes);

  // Description:
  // Tunable parameters. Modifying them triggers a rebuild on Update().
  vtkPointMapSettings* GetSettings();

  // Description:
  // Attach to / detach from a map
  void Attach(vtkPointMap* map);
  void Detach();

  vtkViewportLifecycleManager* GetLifecycleManager();
  vtkSpiderfyController* GetSpiderfyController();
  vtkPointClusterLayer* GetClusterLayer();

  // Description:
  // Rebuild if inputs or settings changed, then update the map
  void Update();

  // Description:
  // Results of the last rebuild
  const std::vector<vtkPointMapType::JitteredFeature>& GetFeatures() const
  {
    return this->Features;
  }
  const vtkPointMapType::RenderPlan& GetRenderPlan() const { return this->Plan; }
  const vtkPointMapType::RenderPlanCounts& GetRenderPlanCounts() const
  {
    return this->Counts;
  }

  // Description:
  // Show the popup of the feature with the given id and invoke
  // PointActivatedEvent. Returns false for unknown ids. The popup is
  // queued until the map is ready.
  bool ActivateFeature(const std::string& id);

  // Description:
  // Remove the point popup and the cluster hover preview
  void DismissPopups();

protected:
  vtkPointMapEngine();
  ~vtkPointMapEngine() override;

  void Rebuild();
  void QueueResources();
  void InstallResources();
  void ActivatePoint(const vtkPointMapType::PointFeature& feature);

  void OnClusterClick(const vtkPointMapType::PickResult& result);
  void OnClusterHover(const vtkPointMapType::PickResult& result);
  void OnMarkerClick(const vtkPointMapType::PickResult& result);
  void OnBackgroundClick(const vtkPointMapType::PickResult& result);
  void OnHoverLeaves(unsigned long generation,
    const vtkPointMapType::ClusterInfo& info, bool success,
    const std::vector<vtkPointMapType::JitteredFeature>& leaves);
  void HideHoverPreview();
  void RemoveWhenReady(const std::string& key);

  void OnUserInteraction(vtkObject* caller, unsigned long event, void* data);

  std::vector<vtkPointMapType::BulkLocation> BulkLocations;
  std::vector<vtkPointMapType::FeaturedFactoid> FeaturedFactoids;
  std::vector<vtkPointMapType::JourneyRoute> JourneyRoutes;

  vtkSmartPointer<vtkPointMapSettings> Settings;
  vtkSmartPointer<vtkPointFeatureNormalizer> Normalizer;
  vtkSmartPointer<vtkCoincidenceJitterer> Jitterer;
  vtkSmartPointer<vtkRenderPathSelector> Selector;
  vtkSmartPointer<vtkPointClusterLayer> ClusterLayer;
  vtkSmartPointer<vtkViewportLifecycleManager> LifecycleManager;
  vtkSmartPointer<vtkSpiderfyController> SpiderfyController;

  std::vector<vtkPointMapType::JitteredFeature> Features;
  vtkPointMapType::RenderPlan Plan;
  vtkPointMapType::RenderPlanCounts Counts;
  vtkTimeStamp BuildTime;

  // Event calldata
  vtkPointMapType::PointFeature ActivePoint;
  vtkPointMapType::ClusterPreview Preview;

  unsigned long HoverGeneration;
  vtkIdType HoveredClusterId;
  unsigned long InteractionObserverTag;

private:
  vtkPointMapEngine(const vtkPointMapEngine&) = delete;
  vtkPointMapEngine& operator=(const vtkPointMapEngine&) = delete;
};

#endif // __vtkPointMapEngine_h
