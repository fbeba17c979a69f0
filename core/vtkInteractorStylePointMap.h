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
// .NAME vtkInteractorStylePointMap - interactor style for point map views
// .SECTION Description
//
// Supports panning (left drag), zooming (mouse-wheel or double-click),
// single-click activation and hover. The style does not pick anything
// itself: it reports clicks and hovers through vtkPointMap events
// (DisplayClickEvent, DisplayHoverEvent) and announces every pan or zoom
// with vtkPointMap::UserInteractionEvent *before* the view changes, so that
// observers can tear down transient content first.
//
#ifndef __vtkInteractorStylePointMap_h
#define __vtkInteractorStylePointMap_h
#include <memory>

#include <vtkInteractorStyle.h>

#include "vtkpointmapcore_export.h"

class vtkPointMap;

namespace vtkPointMapType
{
class Timer;
}

class VTKPOINTMAPCORE_EXPORT vtkInteractorStylePointMap
  : public vtkInteractorStyle
{
public:
  // Description:
  // Standard VTK functions.
  static vtkInteractorStylePointMap* New();
  vtkTypeMacro(vtkInteractorStylePointMap, vtkInteractorStyle);

  void PrintSelf(ostream& os, vtkIndent indent) override;

  // Description:
  // Overriding these functions to implement custom
  // interactions.
  void OnLeftButtonDown() override;
  void OnLeftButtonUp() override;
  void OnMouseMove() override;
  void OnMouseWheelForward() override;
  void OnMouseWheelBackward() override;

  vtkSetMacro(DoubleClickDelay, size_t);

  // Description:
  // Movement (in pixels) below which a press/release is a click
  vtkSetMacro(ClickTolerance, int);
  vtkGetMacro(ClickTolerance, int);

  // Map
  void SetMap(vtkPointMap* map);

  // Description:
  // Programmatic equivalents of the mouse gestures. Each announces the
  // change with vtkPointMap::UserInteractionEvent and redraws the map.
  void PanMap(double dx, double dy);
  void ZoomIn(int levels);
  void ZoomOut(int levels);

protected:
  vtkInteractorStylePointMap();
  ~vtkInteractorStylePointMap() override;

private:
  vtkInteractorStylePointMap(const vtkInteractorStylePointMap&) = delete;
  void operator=(const vtkInteractorStylePointMap&) = delete;

  bool IsDoubleClick();

  vtkPointMap* Map;

  std::unique_ptr<vtkPointMapType::Timer> Timer;
  size_t DoubleClickDelay = 500;
  unsigned char MouseClicks = 0;

  int ClickTolerance = 5;
  int StartPosition[2];
  int LastPosition[2];
  bool ButtonDown = false;

  /**
   * Set once the pointer moved farther than ClickTolerance while the button
   * was down; the release is then the end of a pan, not a click.
   */
  bool MouseMoved = false;
};

#endif // __vtkInteractorStylePointMap_h
