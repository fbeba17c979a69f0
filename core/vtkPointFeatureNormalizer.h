/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointFeatureNormalizer - convert input records to point features
// .SECTION Description
// Bulk locations and featured factoids are converted into a single
// vtkPointMapType::PointFeature list. Feature ids are built from the record
// id prefixed by its kind ("location-" or "factoid-") so the two sources
// never collide with each other.
//
// Records whose coordinate pair is missing or not finite are dropped and
// counted; the count is available from GetNumberOfDroppedRecords() after
// each call to Normalize(). When two records resolve to the same feature id
// the later one replaces the earlier one.
//

#ifndef __vtkPointFeatureNormalizer_h
#define __vtkPointFeatureNormalizer_h

#include <vtkObject.h>

#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vector>

class VTKPOINTMAPCORE_EXPORT vtkPointFeatureNormalizer : public vtkObject
{
public:
  static vtkPointFeatureNormalizer* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkPointFeatureNormalizer, vtkObject);

  // Description:
  // Replace the contents of output with the normalized features.
  // Returns the number of output features.
  vtkIdType Normalize(const std::vector<vtkPointMapType::BulkLocation>& locations,
    const std::vector<vtkPointMapType::FeaturedFactoid>& factoids,
    std::vector<vtkPointMapType::PointFeature>& output);

  // Description:
  // Statistics of the last call to Normalize()
  vtkGetMacro(NumberOfDroppedRecords, vtkIdType);
  vtkGetMacro(NumberOfLocations, vtkIdType);
  vtkGetMacro(NumberOfFactoids, vtkIdType);

  // Description:
  // A coordinate is valid when it holds exactly [lon, lat], both finite
  static bool IsValidCoordinate(const std::vector<double>& coordinates);

protected:
  vtkPointFeatureNormalizer();
  ~vtkPointFeatureNormalizer() override;

  vtkIdType NumberOfDroppedRecords;
  vtkIdType NumberOfLocations;
  vtkIdType NumberOfFactoids;

private:
  vtkPointFeatureNormalizer(const vtkPointFeatureNormalizer&) = delete;
  vtkPointFeatureNormalizer& operator=(const vtkPointFeatureNormalizer&) = delete;
};

#endif // __vtkPointFeatureNormalizer_h
