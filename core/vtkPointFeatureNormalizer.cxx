/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointFeatureNormalizer.h"

#include <vtkMath.h>
#include <vtkObjectFactory.h>

#include <unordered_map>

vtkStandardNewMacro(vtkPointFeatureNormalizer);

namespace
{
//----------------------------------------------------------------------------
// Insert or replace (last write wins) a feature by id
void InsertFeature(vtkPointMapType::PointFeature& feature,
  std::unordered_map<std::string, size_t>& index,
  std::vector<vtkPointMapType::PointFeature>& output)
{
  auto iter = index.find(feature.Id);
  if (iter != index.end())
  {
    output[iter->second] = feature;
    return;
  }
  index.emplace(feature.Id, output.size());
  output.push_back(feature);
}
}

//----------------------------------------------------------------------------
vtkPointFeatureNormalizer::vtkPointFeatureNormalizer()
{
  this->NumberOfDroppedRecords = 0;
  this->NumberOfLocations = 0;
  this->NumberOfFactoids = 0;
}

//----------------------------------------------------------------------------
vtkPointFeatureNormalizer::~vtkPointFeatureNormalizer() {}

//----------------------------------------------------------------------------
void vtkPointFeatureNormalizer::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "NumberOfDroppedRecords: " << this->NumberOfDroppedRecords
     << "\n"
     << indent << "NumberOfLocations: " << this->NumberOfLocations << "\n"
     << indent << "NumberOfFactoids: " << this->NumberOfFactoids << std::endl;
}

//----------------------------------------------------------------------------
bool vtkPointFeatureNormalizer::IsValidCoordinate(
  const std::vector<double>& coordinates)
{
  if (coordinates.size() != 2)
  {
    return false;
  }
  return !vtkMath::IsNan(coordinates[0]) && !vtkMath::IsNan(coordinates[1]) &&
    !vtkMath::IsInf(coordinates[0]) && !vtkMath::IsInf(coordinates[1]);
}

//----------------------------------------------------------------------------
vtkIdType vtkPointFeatureNormalizer::Normalize(
  const std::vector<vtkPointMapType::BulkLocation>& locations,
  const std::vector<vtkPointMapType::FeaturedFactoid>& factoids,
  std::vector<vtkPointMapType::PointFeature>& output)
{
  output.clear();
  output.reserve(locations.size() + factoids.size());
  this->NumberOfDroppedRecords = 0;

  std::unordered_map<std::string, size_t> index;
  for (const auto& location : locations)
  {
    if (!IsValidCoordinate(location.Coordinates))
    {
      vtkDebugMacro("Dropping location " << location.Id);
      ++this->NumberOfDroppedRecords;
      continue;
    }

    vtkPointMapType::PointFeature feature;
    feature.Id = "location-" + location.Id;
    feature.Position[0] = location.Coordinates[0];
    feature.Position[1] = location.Coordinates[1];
    feature.Kind = vtkPointMapType::FeatureKind::BulkLocation;
    feature.Name = location.Name;
    feature.Category = location.Category;
    InsertFeature(feature, index, output);
  }

  for (const auto& factoid : factoids)
  {
    if (!IsValidCoordinate(factoid.Coordinates))
    {
      vtkDebugMacro("Dropping factoid " << factoid.Id);
      ++this->NumberOfDroppedRecords;
      continue;
    }

    vtkPointMapType::PointFeature feature;
    feature.Id = "factoid-" + factoid.Id;
    feature.Position[0] = factoid.Coordinates[0];
    feature.Position[1] = factoid.Coordinates[1];
    feature.Kind = vtkPointMapType::FeatureKind::FeaturedFactoid;
    feature.Name = factoid.Summary.empty() ? factoid.LocationName : factoid.Summary;
    feature.Category = factoid.Category;
    feature.Layer = factoid.Layer;
    feature.ConfidenceLevel = factoid.Confidence;
    feature.UncertaintyRadiusKm =
      factoid.UncertaintyRadiusKm > 0.0 ? factoid.UncertaintyRadiusKm : 0.0;
    InsertFeature(feature, index, output);
  }

  this->NumberOfLocations = 0;
  this->NumberOfFactoids = 0;
  for (const auto& feature : output)
  {
    if (feature.Kind == vtkPointMapType::FeatureKind::FeaturedFactoid)
    {
      ++this->NumberOfFactoids;
    }
    else
    {
      ++this->NumberOfLocations;
    }
  }

  if (this->NumberOfDroppedRecords > 0)
  {
    vtkWarningMacro("Dropped " << this->NumberOfDroppedRecords
                               << " record(s) without valid coordinates");
  }

  this->Modified();
  return static_cast<vtkIdType>(output.size());
}
