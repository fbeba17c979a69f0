/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkSpiderfyController - expands activated clusters
// .SECTION Description
// Activating a cluster either zooms the map to the level at which the
// cluster splits, or, when it never splits within the clustered zoom range,
// fans its members out around the cluster position ("spider").
//
// Both queries on the cluster index are asynchronous. Every activation and
// every Invalidate() increments a generation counter; results carrying an
// older generation are discarded. A failed query logs an error and leaves
// the controller Idle without any spider content.
//
// Spider content is added to the "spider" category of the lifecycle
// manager: one marker per member (spider-marker-<i>), the connector lines
// (spider-legs) and, when not every member could be shown, a
// "+N more" label (spider-overflow).
//

#ifndef __vtkSpiderfyController_h
#define __vtkSpiderfyController_h

#include <vtkCommand.h>
#include <vtkObject.h>
#include <vtkSmartPointer.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vector>

class vtkPointClusterLayer;
class vtkViewportLifecycleManager;

class VTKPOINTMAPCORE_EXPORT vtkSpiderfyController : public vtkObject
{
public:
  static vtkSpiderfyController* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkSpiderfyController, vtkObject);

  enum Events
  {
    // State changed, calldata is const vtkPointMapType::SpiderState*
    StateChangedEvent = vtkCommand::UserEvent + 500
  };

  // Description:
  // Manager receiving the spider content. Registers the "spider" category
  // if needed.
  void SetLifecycleManager(vtkViewportLifecycleManager* manager);
  vtkViewportLifecycleManager* GetLifecycleManager();

  // Description:
  // Layer answering the cluster queries
  void SetClusterLayer(vtkPointClusterLayer* layer);
  vtkPointClusterLayer* GetClusterLayer();

  // Description:
  // Maximum number of members fanned out
  vtkSetClampMacro(MaxSpiderMarkers, int, 1, 1000);
  vtkGetMacro(MaxSpiderMarkers, int);

  // Description:
  // Start expanding a cluster. Unknown ids are ignored.
  void ActivateCluster(vtkIdType clusterId);

  // Description:
  // Discard the current spider, pending results and animation
  void Invalidate();

  vtkPointMapType::SpiderState GetState() const { return this->State; }
  unsigned long GetGeneration() const { return this->Generation; }
  vtkIdType GetActiveClusterId() const { return this->ActiveCluster.ClusterId; }

  // Description:
  // Layout of the current spider, empty unless Spidered
  const vtkPointMapType::SpiderLayout& GetLayout() const { return this->Layout; }

  // Description:
  // Distance of spider members from the cluster in pixels
  static double ComputeRadius(vtkIdType count);

  // Description:
  // Display positions of count members around origin. Two members are
  // placed left and right, more on a circle starting at the top and
  // running clockwise.
  static void ComputeLayout(const double origin[2], vtkIdType count,
    vtkPointMapType::SpiderLayout& layout);

protected:
  vtkSpiderfyController();
  ~vtkSpiderfyController() override;

  void SetState(vtkPointMapType::SpiderState state);

  void OnExpansionZoom(unsigned long generation, bool success, int zoom);
  void OnLeaves(unsigned long generation, bool success,
    const std::vector<vtkPointMapType::JitteredFeature>& leaves);
  void OnAnimationEnded(vtkObject* caller, unsigned long event, void* data);

  bool BuildSpider(const std::vector<vtkPointMapType::JitteredFeature>& leaves);

  vtkSmartPointer<vtkViewportLifecycleManager> LifecycleManager;
  vtkSmartPointer<vtkPointClusterLayer> ClusterLayer;
  std::vector<unsigned long> ObserverTags;

  int MaxSpiderMarkers;
  vtkPointMapType::SpiderState State;
  unsigned long Generation;
  vtkPointMapType::ClusterInfo ActiveCluster;
  vtkPointMapType::SpiderLayout Layout;

private:
  vtkSpiderfyController(const vtkSpiderfyController&) = delete;
  vtkSpiderfyController& operator=(const vtkSpiderfyController&) = delete;
};

#endif // __vtkSpiderfyController_h
