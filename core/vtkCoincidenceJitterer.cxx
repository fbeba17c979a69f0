/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkCoincidenceJitterer.h"

#include <vtkMath.h>
#include <vtkObjectFactory.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

vtkStandardNewMacro(vtkCoincidenceJitterer);

//----------------------------------------------------------------------------
vtkCoincidenceJitterer::vtkCoincidenceJitterer()
{
  this->BaseRadius = 0.001;
  this->CapFactor = 5.0;
  this->CoordinatePrecision = 6;
  this->NumberOfCoincidenceGroups = 0;
}

//----------------------------------------------------------------------------
vtkCoincidenceJitterer::~vtkCoincidenceJitterer() {}

//----------------------------------------------------------------------------
void vtkCoincidenceJitterer::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "BaseRadius: " << this->BaseRadius << "\n"
     << indent << "CapFactor: " << this->CapFactor << "\n"
     << indent << "CoordinatePrecision: " << this->CoordinatePrecision << "\n"
     << indent << "NumberOfCoincidenceGroups: "
     << this->NumberOfCoincidenceGroups << std::endl;
}

//----------------------------------------------------------------------------
double vtkCoincidenceJitterer::ComputeRadius(int groupSize) const
{
  const double factor =
    std::min(std::sqrt(static_cast<double>(groupSize)), this->CapFactor);
  return this->BaseRadius * factor;
}

//----------------------------------------------------------------------------
void vtkCoincidenceJitterer::Jitter(
  const std::vector<vtkPointMapType::PointFeature>& input,
  std::vector<vtkPointMapType::JitteredFeature>& output)
{
  output.clear();
  output.reserve(input.size());
  this->NumberOfCoincidenceGroups = 0;

  // Group input indices by rounded coordinate
  using Key = std::pair<long long, long long>;
  std::map<Key, std::vector<size_t> > groups;
  const double scale = std::pow(10.0, this->CoordinatePrecision);
  for (size_t i = 0; i < input.size(); ++i)
  {
    const Key key(std::llround(input[i].Position[0] * scale),
      std::llround(input[i].Position[1] * scale));
    groups[key].push_back(i);
  }

  for (const auto& feature : input)
  {
    vtkPointMapType::JitteredFeature jittered;
    static_cast<vtkPointMapType::PointFeature&>(jittered) = feature;
    jittered.OriginalPosition = feature.Position;
    jittered.CoincidenceGroupSize = 1;
    output.push_back(jittered);
  }

  const double twoPi = 2.0 * vtkMath::Pi();
  for (const auto& entry : groups)
  {
    const std::vector<size_t>& members = entry.second;
    const size_t n = members.size();
    if (n < 2)
    {
      continue;
    }

    ++this->NumberOfCoincidenceGroups;
    const vtkPointMapType::Coordinate origin = input[members[0]].Position;
    const double radius = this->ComputeRadius(static_cast<int>(n));
    for (size_t i = 0; i < n; ++i)
    {
      const double angle = twoPi * static_cast<double>(i) / n;
      vtkPointMapType::JitteredFeature& jittered = output[members[i]];
      jittered.Position[0] = origin[0] + radius * std::cos(angle);
      jittered.Position[1] = origin[1] + radius * std::sin(angle);
      jittered.CoincidenceGroupSize = static_cast<int>(n);
    }
  }

  vtkDebugMacro("Jittered " << this->NumberOfCoincidenceGroups
                            << " coincidence group(s)");
}
