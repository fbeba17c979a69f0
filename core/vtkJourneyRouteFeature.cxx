/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkJourneyRouteFeature.h"
#include "vtkMercator.h"

#include <vtkCellArray.h>
#include <vtkMath.h>
#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkPoints.h>
#include <vtkPolyData.h>
#include <vtkProperty.h>

#include <algorithm>
#include <cmath>

vtkStandardNewMacro(vtkJourneyRouteFeature);

namespace
{
// Dash pattern in pixels
const double DASH_LENGTH = 6.0;
const double GAP_LENGTH = 6.0;
}

//----------------------------------------------------------------------------
vtkJourneyRouteFeature::vtkJourneyRouteFeature()
  : vtkPolydataFeature()
{
  this->PolyData = vtkPolyData::New();
  this->BuiltZoom = -1;

  this->SetOpacity(0.8);
  this->Actor->GetProperty()->SetLineWidth(3.0);
}

//----------------------------------------------------------------------------
vtkJourneyRouteFeature::~vtkJourneyRouteFeature()
{
  this->PolyData->Delete();
}

//----------------------------------------------------------------------------
void vtkJourneyRouteFeature::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Route: " << this->Route.Id << " (" << this->Route.RouteType
     << ")\n"
     << indent << "Number Of Coordinates: " << this->Route.Coordinates.size()
     << std::endl;
}

//----------------------------------------------------------------------------
const char* vtkJourneyRouteFeature::GetRouteColor(const std::string& routeType)
{
  if (routeType == "campaign")
  {
    return "#dc2626";
  }
  if (routeType == "migration")
  {
    return "#7c3aed";
  }
  if (routeType == "trade_route")
  {
    return "#d97706";
  }
  if (routeType == "pilgrimage")
  {
    return "#059669";
  }
  return "#6b7280";
}

//----------------------------------------------------------------------------
bool vtkJourneyRouteFeature::IsDashed(const std::string& routeType)
{
  return routeType == "pilgrimage";
}

//----------------------------------------------------------------------------
void vtkJourneyRouteFeature::SetRoute(const vtkPointMapType::JourneyRoute& route)
{
  this->Route = route;

  this->SetColor(GetRouteColor(route.RouteType));
  this->BuiltZoom = -1;
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkJourneyRouteFeature::BuildGeometry(double worldUnitsPerPixel)
{
  vtkNew<vtkPoints> points;
  vtkNew<vtkCellArray> lines;

  std::vector<std::array<double, 2> > world;
  for (const auto& coord : this->Route.Coordinates)
  {
    world.push_back({ { coord[0],
      vtkMercator::lat2y(vtkMercator::validLatitude(coord[1])) } });
  }

  if (!IsDashed(this->Route.RouteType))
  {
    if (world.size() >= 2)
    {
      lines->InsertNextCell(static_cast<vtkIdType>(world.size()));
      for (const auto& p : world)
      {
        lines->InsertCellPoint(points->InsertNextPoint(p[0], p[1], 0.0));
      }
    }
  }
  else
  {
    // Walk the polyline, emitting one line cell per dash
    const double dash = DASH_LENGTH * worldUnitsPerPixel;
    const double period = (DASH_LENGTH + GAP_LENGTH) * worldUnitsPerPixel;
    double phase = 0.0; // distance into the current period
    for (size_t i = 1; i < world.size(); ++i)
    {
      const double dx = world[i][0] - world[i - 1][0];
      const double dy = world[i][1] - world[i - 1][1];
      const double length = std::sqrt(dx * dx + dy * dy);
      double s = 0.0;
      while (s < length)
      {
        const double step = phase < dash ? dash - phase : period - phase;
        const double end = std::min(length, s + step);
        if (phase < dash && length > 0.0)
        {
          lines->InsertNextCell(2);
          lines->InsertCellPoint(points->InsertNextPoint(world[i - 1][0] +
              dx * s / length, world[i - 1][1] + dy * s / length, 0.0));
          lines->InsertCellPoint(points->InsertNextPoint(world[i - 1][0] +
              dx * end / length, world[i - 1][1] + dy * end / length, 0.0));
        }
        phase = std::fmod(phase + (end - s), period);
        s = end;
      }
    }
  }

  this->PolyData->Initialize();
  this->PolyData->SetPoints(points.GetPointer());
  this->PolyData->SetLines(lines.GetPointer());
}

//----------------------------------------------------------------------------
void vtkJourneyRouteFeature::Init()
{
  vtkPointMap* map = this->GetMap();
  const int zoom = map ? map->GetZoom() : 0;
  this->BuildGeometry(vtkMercator::worldUnitsPerPixel(zoom));
  this->BuiltZoom = zoom;
  this->Mapper->SetInputData(this->PolyData);

  this->Superclass::Init();
}

//----------------------------------------------------------------------------
void vtkJourneyRouteFeature::Update()
{
  vtkPointMap* map = this->GetMap();
  if (map && IsDashed(this->Route.RouteType) &&
    map->GetZoom() != this->BuiltZoom)
  {
    this->BuildGeometry(vtkMercator::worldUnitsPerPixel(map->GetZoom()));
    this->BuiltZoom = map->GetZoom();
  }

  this->Superclass::Update();
}

//----------------------------------------------------------------------------
vtkIdType vtkJourneyRouteFeature::GetNumberOfSegments()
{
  return this->PolyData->GetNumberOfLines();
}
