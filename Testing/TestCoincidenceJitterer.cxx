/*=========================================================================

  Program:   Visualization Toolkit
  Module:    TestCoincidenceJitterer.cxx

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkCoincidenceJitterer.h"
#include "vtkPointMapSettings.h"
#include "vtkPointMapTestUtilities.h"

#include <vtkNew.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

using namespace vtkPointMapTesting;

//----------------------------------------------------------------------------
int TestCoincidenceJitterer(int vtkNotUsed(argc), char* vtkNotUsed(argv)[])
{
  vtkNew<vtkCoincidenceJitterer> jitterer;
  std::vector<vtkPointMapType::JitteredFeature> output;

  // Three bulk locations on the same coordinate
  std::vector<vtkPointMapType::PointFeature> input;
  for (int i = 0; i < 3; ++i)
  {
    std::ostringstream id;
    id << "location-" << i;
    input.push_back(MakePoint(id.str(), 35.0, 33.0));
  }

  jitterer->Jitter(input, output);
  vtkPointMapTestAssert(output.size() == 3, "count must be preserved");
  vtkPointMapTestAssert(jitterer->GetNumberOfCoincidenceGroups() == 1,
    "expected a single coincidence group");

  const double radius = 0.001 * std::min(std::sqrt(3.0), 5.0);
  vtkPointMapTestAssert(std::abs(jitterer->ComputeRadius(3) - radius) < 1e-12,
    "bad jitter radius " << jitterer->ComputeRadius(3));

  std::set<std::pair<double, double> > distinct;
  for (size_t i = 0; i < output.size(); ++i)
  {
    const auto& feature = output[i];
    vtkPointMapTestAssert(feature.Id == input[i].Id, "output order must match input");
    vtkPointMapTestAssert(feature.CoincidenceGroupSize == 3, "bad group size");
    vtkPointMapTestAssert(feature.OriginalPosition[0] == 35.0 &&
        feature.OriginalPosition[1] == 33.0,
      "original position must be kept");
    const double dx = feature.Position[0] - 35.0;
    const double dy = feature.Position[1] - 33.0;
    vtkPointMapTestAssert(std::sqrt(dx * dx + dy * dy) <= radius + 1e-12,
      "member " << i << " too far from the group origin");
    distinct.insert(std::make_pair(feature.Position[0], feature.Position[1]));
  }
  vtkPointMapTestAssert(distinct.size() == 3, "jittered positions must be distinct");

  // First member sits at angle 0
  vtkPointMapTestAssert(std::abs(output[0].Position[0] - (35.0 + radius)) < 1e-12 &&
      std::abs(output[0].Position[1] - 33.0) < 1e-12,
    "first member must be placed at angle 0");

  // Deterministic
  std::vector<vtkPointMapType::JitteredFeature> again;
  jitterer->Jitter(input, again);
  for (size_t i = 0; i < output.size(); ++i)
  {
    vtkPointMapTestAssert(output[i].Position == again[i].Position,
      "jitter must be deterministic");
  }

  // Singletons pass through unchanged, groups cap their radius
  input.clear();
  input.push_back(MakePoint("single", 10.0, 20.0));
  for (int i = 0; i < 100; ++i)
  {
    std::ostringstream id;
    id << "crowd-" << i;
    input.push_back(MakePoint(id.str(), -5.0, 40.0));
  }
  input.push_back(MakePoint("near", 10.0000004, 20.0)); // rounds to "single"

  jitterer->Jitter(input, output);
  vtkPointMapTestAssert(output.size() == input.size(), "count must be preserved");
  vtkPointMapTestAssert(output[0].CoincidenceGroupSize == 2,
    "coordinates equal at 6 decimals coincide");
  vtkPointMapTestAssert(
    std::abs(jitterer->ComputeRadius(100) - 0.005) < 1e-12, "radius must be capped");

  jitterer->SetCoordinatePrecision(7);
  jitterer->Jitter(input, output);
  vtkPointMapTestAssert(output[0].CoincidenceGroupSize == 1 &&
      output[0].Position == input[0].Position,
    "singletons must be unchanged");
  vtkPointMapTestAssert(jitterer->GetNumberOfCoincidenceGroups() == 1,
    "only the crowd should coincide at 7 decimals");

  distinct.clear();
  for (const auto& feature : output)
  {
    distinct.insert(std::make_pair(feature.Position[0], feature.Position[1]));
  }
  vtkPointMapTestAssert(distinct.size() == output.size(),
    "no two records may share a coordinate after jitter");

  // The smallest radius still separates the members
  jitterer->SetBaseRadius(0.0);
  vtkPointMapTestAssert(jitterer->GetBaseRadius() > 0.0, "radius must stay positive");
  input.clear();
  for (int i = 0; i < 3; ++i)
  {
    std::ostringstream id;
    id << "location-" << i;
    input.push_back(MakePoint(id.str(), 35.0, 33.0));
  }
  jitterer->Jitter(input, output);
  distinct.clear();
  for (const auto& feature : output)
  {
    distinct.insert(std::make_pair(feature.Position[0], feature.Position[1]));
  }
  vtkPointMapTestAssert(distinct.size() == 3,
    "members must be distinct at the minimum radius");

  vtkNew<vtkPointMapSettings> settings;
  settings->SetJitterBaseRadiusDegrees(0.0);
  vtkPointMapTestAssert(settings->GetJitterBaseRadiusDegrees() > 0.0,
    "settings must keep a positive jitter radius");

  // Empty input
  input.clear();
  jitterer->Jitter(input, output);
  vtkPointMapTestAssert(output.empty(), "empty input");

  return EXIT_SUCCESS;
}
