/*=========================================================================

  Program:   Visualization Toolkit
  Module:    TestPointFeatureNormalizer.cxx

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointFeatureNormalizer.h"
#include "vtkPointMapTestUtilities.h"

#include <vtkMath.h>
#include <vtkNew.h>

using namespace vtkPointMapTesting;

//----------------------------------------------------------------------------
int TestPointFeatureNormalizer(int vtkNotUsed(argc), char* vtkNotUsed(argv)[])
{
  vtkNew<vtkPointFeatureNormalizer> normalizer;
  std::vector<vtkPointMapType::PointFeature> features;

  // All valid
  std::vector<vtkPointMapType::BulkLocation> locations;
  locations.push_back(MakeLocation("1", 29.9187, 31.2001));
  locations.push_back(MakeLocation("2", 12.4964, 41.9028));
  std::vector<vtkPointMapType::FeaturedFactoid> factoids;
  factoids.push_back(MakeFactoid("7", 43.4, 36.4,
    vtkPointMapType::EvidenceLayer::Attested, 5.0));

  vtkIdType count = normalizer->Normalize(locations, factoids, features);
  vtkPointMapTestAssert(count == 3, "expected 3 features, got " << count);
  vtkPointMapTestAssert(normalizer->GetNumberOfDroppedRecords() == 0,
    "no record should be dropped");
  vtkPointMapTestAssert(features[0].Id == "location-1", "bad id " << features[0].Id);
  vtkPointMapTestAssert(features[2].Id == "factoid-7", "bad id " << features[2].Id);
  vtkPointMapTestAssert(
    features[2].Kind == vtkPointMapType::FeatureKind::FeaturedFactoid,
    "factoid kind expected");
  vtkPointMapTestAssert(features[2].Position[0] == 43.4 &&
      features[2].Position[1] == 36.4,
    "coordinates are [lon, lat]");
  vtkPointMapTestAssert(features[2].UncertaintyRadiusKm == 5.0 &&
      features[2].Layer == vtkPointMapType::EvidenceLayer::Attested,
    "factoid attributes must be carried over");
  vtkPointMapTestAssert(features[2].Name == "Factoid 7", "factoid name from summary");
  vtkPointMapTestAssert(normalizer->GetNumberOfLocations() == 2 &&
      normalizer->GetNumberOfFactoids() == 1,
    "bad kind statistics");

  // Malformed coordinates are dropped and counted
  vtkPointMapType::BulkLocation missing = MakeLocation("3", 0.0, 0.0);
  missing.Coordinates.clear();
  vtkPointMapType::BulkLocation threeValues = MakeLocation("4", 1.0, 2.0);
  threeValues.Coordinates.push_back(3.0);
  vtkPointMapType::BulkLocation notANumber =
    MakeLocation("5", vtkMath::Nan(), 10.0);
  vtkPointMapType::FeaturedFactoid infinite =
    MakeFactoid("8", 10.0, vtkMath::Inf());
  locations.push_back(missing);
  locations.push_back(threeValues);
  locations.push_back(notANumber);
  factoids.push_back(infinite);

  count = normalizer->Normalize(locations, factoids, features);
  vtkPointMapTestAssert(count == 3, "malformed records must be dropped, got "
      << count);
  vtkPointMapTestAssert(normalizer->GetNumberOfDroppedRecords() == 4,
    "expected 4 dropped records, got "
      << normalizer->GetNumberOfDroppedRecords());
  for (const auto& feature : features)
  {
    vtkPointMapTestAssert(!vtkMath::IsNan(feature.Position[0]) &&
        !vtkMath::IsNan(feature.Position[1]) &&
        !vtkMath::IsInf(feature.Position[0]) &&
        !vtkMath::IsInf(feature.Position[1]),
      "non-finite coordinate in output");
  }

  // Id collisions: last write wins, in place
  locations.clear();
  factoids.clear();
  locations.push_back(MakeLocation("1", 1.0, 1.0));
  locations.push_back(MakeLocation("2", 2.0, 2.0));
  locations.push_back(MakeLocation("1", 3.0, 3.0));
  count = normalizer->Normalize(locations, factoids, features);
  vtkPointMapTestAssert(count == 2, "duplicate ids must collapse, got " << count);
  vtkPointMapTestAssert(features[0].Id == "location-1" &&
      features[0].Position[0] == 3.0,
    "the later record must replace the earlier one in place");
  vtkPointMapTestAssert(normalizer->GetNumberOfDroppedRecords() == 0,
    "statistics must be reset by each call");

  // Bulk and featured ids live in separate namespaces
  factoids.push_back(MakeFactoid("1", 4.0, 4.0));
  count = normalizer->Normalize(locations, factoids, features);
  vtkPointMapTestAssert(count == 3, "location-1 and factoid-1 must both survive");

  // Empty input
  locations.clear();
  factoids.clear();
  count = normalizer->Normalize(locations, factoids, features);
  vtkPointMapTestAssert(count == 0 && features.empty(), "empty input");

  return EXIT_SUCCESS;
}
