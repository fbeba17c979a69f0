/*=========================================================================

  Program:   Visualization Toolkit
  Module:    vtkPointMapTestUtilities.h

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointMapTestUtilities - record builders shared by the tests

#ifndef __vtkPointMapTestUtilities_h
#define __vtkPointMapTestUtilities_h

#include "vtkPointMap_typedef.h"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Report and fail the calling test when expr is false
#define vtkPointMapTestAssert(expr, message)                                  \
  if (!(expr))                                                                 \
  {                                                                            \
    std::cerr << __FILE__ << ":" << __LINE__ << ": " << message << std::endl; \
    return EXIT_FAILURE;                                                       \
  }

namespace vtkPointMapTesting
{
//----------------------------------------------------------------------------
inline vtkPointMapType::BulkLocation MakeLocation(
  const std::string& id, double lon, double lat)
{
  vtkPointMapType::BulkLocation location;
  location.Id = id;
  location.Name = "Location " + id;
  location.Coordinates.push_back(lon);
  location.Coordinates.push_back(lat);
  return location;
}

//----------------------------------------------------------------------------
inline vtkPointMapType::FeaturedFactoid MakeFactoid(const std::string& id,
  double lon, double lat,
  vtkPointMapType::EvidenceLayer layer = vtkPointMapType::EvidenceLayer::Documented,
  double uncertaintyKm = 0.0)
{
  vtkPointMapType::FeaturedFactoid factoid;
  factoid.Id = id;
  factoid.Summary = "Factoid " + id;
  factoid.Layer = layer;
  factoid.UncertaintyRadiusKm = uncertaintyKm;
  factoid.Coordinates.push_back(lon);
  factoid.Coordinates.push_back(lat);
  return factoid;
}

//----------------------------------------------------------------------------
inline vtkPointMapType::JitteredFeature MakePoint(const std::string& id,
  double lon, double lat,
  vtkPointMapType::FeatureKind kind = vtkPointMapType::FeatureKind::BulkLocation)
{
  vtkPointMapType::JitteredFeature feature;
  feature.Id = id;
  feature.Name = id;
  feature.Kind = kind;
  feature.Position[0] = feature.OriginalPosition[0] = lon;
  feature.Position[1] = feature.OriginalPosition[1] = lat;
  return feature;
}

//----------------------------------------------------------------------------
// rows x cols points starting at (lon, lat), spacing in degrees
inline std::vector<vtkPointMapType::JitteredFeature> MakeGrid(
  double lon, double lat, int rows, int cols, double spacing)
{
  std::vector<vtkPointMapType::JitteredFeature> features;
  for (int r = 0; r < rows; ++r)
  {
    for (int c = 0; c < cols; ++c)
    {
      std::ostringstream id;
      id << "p" << r << "-" << c;
      features.push_back(
        MakePoint(id.str(), lon + c * spacing, lat + r * spacing));
    }
  }
  return features;
}
}

#endif // __vtkPointMapTestUtilities_h
