/*=========================================================================

  Program:   Visualization Toolkit
  Module:    vtkMercator.h

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

// .NAME vtkMercator - web-mercator helpers for the map plane
// .SECTION Description
// The map plane uses x = longitude and y = lat2y(latitude), both in
// degree units. At zoom level z the 256 pixel world image spans 360
// units, i.e. 360 / (256 * 2^z) units per display pixel.
//
// All members are static.
//

#ifndef __vtkMercator_h
#define __vtkMercator_h

#include <vtkMath.h>

#include <algorithm>
#include <cmath>

class vtkMercator
{
public:
  // Description:
  // Latitude beyond which the projection is clipped (y2lat(180))
  static double MaxLatitude() { return 85.0511; }
  static double MaxLongitude() { return 179.999; }

  // Description:
  // Latitude <-> plane y coordinate, both in degrees
  static double lat2y(double latitude)
  {
    const double phi = vtkMath::RadiansFromDegrees(latitude);
    return vtkMath::DegreesFromRadians(std::log(std::tan(0.25 * vtkMath::Pi() + 0.5 * phi)));
  }

  static double y2lat(double y)
  {
    const double v = vtkMath::RadiansFromDegrees(y);
    return vtkMath::DegreesFromRadians(2.0 * std::atan(std::exp(v)) - 0.5 * vtkMath::Pi());
  }

  // Description:
  // Clamp to the projected range
  static double validLatitude(double latitude)
  {
    return std::max(-MaxLatitude(), std::min(MaxLatitude(), latitude));
  }

  static double validLongitude(double longitude)
  {
    return std::max(-MaxLongitude(), std::min(MaxLongitude(), longitude));
  }

  // Description:
  // Plane units covered by one display pixel at the given zoom level
  static double worldUnitsPerPixel(int zoom)
  {
    return 360.0 / (256.0 * std::ldexp(1.0, zoom));
  }

  // Description:
  // Flat-plane conversion of a distance in km to degrees. The longitude
  // span grows with latitude and is bounded near the poles.
  static double km2lonDegrees(double km, double latitude)
  {
    const double c = std::cos(vtkMath::RadiansFromDegrees(latitude));
    return km / (111.32 * std::max(c, 1e-6));
  }

  static double km2latDegrees(double km) { return km / 110.574; }

private:
  vtkMercator() = delete;
};

#endif // __vtkMercator_h
