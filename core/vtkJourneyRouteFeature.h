/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkJourneyRouteFeature - polyline of a journey route
// .SECTION Description
// Line width 3 and opacity 0.8, colored by route type. Pilgrimage routes
// are dashed; the dashes have a constant length in pixels, so their
// geometry is rebuilt when the zoom level changes.
//

#ifndef __vtkJourneyRouteFeature_h
#define __vtkJourneyRouteFeature_h

#include "vtkPolydataFeature.h"
#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

class vtkPolyData;

class VTKPOINTMAPCORE_EXPORT vtkJourneyRouteFeature : public vtkPolydataFeature
{
public:
  static vtkJourneyRouteFeature* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkJourneyRouteFeature, vtkPolydataFeature);

  void SetRoute(const vtkPointMapType::JourneyRoute& route);
  const vtkPointMapType::JourneyRoute& GetRoute() const { return this->Route; }

  void Init() override;
  void Update() override;

  // Description:
  // Line color for a route type, "#rrggbb"
  static const char* GetRouteColor(const std::string& routeType);
  static bool IsDashed(const std::string& routeType);

  // Description:
  // Number of line cells of the current geometry
  vtkIdType GetNumberOfSegments();

protected:
  vtkJourneyRouteFeature();
  ~vtkJourneyRouteFeature() override;

  void BuildGeometry(double worldUnitsPerPixel);

  vtkPointMapType::JourneyRoute Route;
  vtkPolyData* PolyData;
  int BuiltZoom;

private:
  vtkJourneyRouteFeature(const vtkJourneyRouteFeature&) = delete;
  vtkJourneyRouteFeature& operator=(const vtkJourneyRouteFeature&) = delete;
};

#endif // __vtkJourneyRouteFeature_h
