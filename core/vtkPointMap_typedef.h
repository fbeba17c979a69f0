/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointMap_typedef - plain data types shared by the point map engine
// .SECTION Description
//
// Records consumed from the application (BulkLocation, FeaturedFactoid,
// JourneyRoute), the normalized point representation (PointFeature,
// JitteredFeature) and the small value types passed between the engine
// components and carried as event call data.
//
// Coordinates are always stored as [longitude, latitude] in degrees.
//

#ifndef __vtkPointMap_typedef_h
#define __vtkPointMap_typedef_h

#include <vtkType.h>

#include <array>
#include <cstdlib>
#include <string>
#include <vector>

namespace vtkPointMapType
{

enum class FeatureKind : unsigned short
{
  BulkLocation = 0,
  FeaturedFactoid
};

// Evidence layer of a factoid, drives marker colors
enum class EvidenceLayer : unsigned short
{
  None = 0,
  Documented,
  Attested,
  Inferred
};

enum class SpiderState : unsigned short
{
  Idle = 0,
  Zooming,
  Spidered
};

enum class Interaction : unsigned short
{
  Click = 0,
  Hover
};

using Coordinate = std::array<double, 2>;

//----------------------------------------------------------------------------
// Input records. Coordinates may be missing or malformed, in which case
// vtkPointFeatureNormalizer drops the record.
struct BulkLocation
{
  std::string Id;
  std::string Name;
  std::string Category;
  std::vector<double> Coordinates; // [lon, lat]
};

struct FeaturedFactoid
{
  std::string Id;
  std::string Summary;
  std::string LocationName;
  std::string Category;
  EvidenceLayer Layer = EvidenceLayer::None;
  double Confidence = -1.0;         // negative when unknown
  double UncertaintyRadiusKm = 0.0; // 0 when unknown
  std::vector<double> Coordinates;  // [lon, lat]
};

struct JourneyRoute
{
  std::string Id;
  std::string Name;
  std::string RouteType; // travel, campaign, migration, trade_route, pilgrimage
  std::vector<Coordinate> Coordinates;
};

//----------------------------------------------------------------------------
struct PointFeature
{
  std::string Id;
  Coordinate Position = { { 0.0, 0.0 } };
  FeatureKind Kind = FeatureKind::BulkLocation;
  std::string Name;
  std::string Category;
  EvidenceLayer Layer = EvidenceLayer::None;
  double ConfidenceLevel = -1.0;
  double UncertaintyRadiusKm = 0.0;
};

struct JitteredFeature : public PointFeature
{
  Coordinate OriginalPosition = { { 0.0, 0.0 } };
  int CoincidenceGroupSize = 1;
};

//----------------------------------------------------------------------------
struct ClusterInfo
{
  vtkIdType ClusterId = -1;
  Coordinate Centroid = { { 0.0, 0.0 } }; // [lon, lat]
  vtkIdType MemberCount = 0;
  int ExpansionZoom = -1;
  vtkIdType FeatureIndex = -1; // single points only
};

// Partition of a feature set into the clustered (glyph) path and the
// individually interactive marker path. Both hold indices into the
// feature vector the plan was computed from.
struct RenderPlan
{
  std::vector<vtkIdType> ClusteredSet;
  std::vector<vtkIdType> DomMarkerSet;
  vtkIdType FeaturedDomCount = 0;
  vtkIdType BulkDomCount = 0;
  bool ClusteringEnabled = false;
};

struct RenderPlanCounts
{
  vtkIdType Locations = 0; // bulk locations after normalization
  vtkIdType Events = 0;    // featured factoids after normalization
  vtkIdType Clustered = 0;
  vtkIdType Markers = 0;
  vtkIdType Dropped = 0;
};

struct SpiderLayout
{
  std::array<double, 2> Origin = { { 0.0, 0.0 } }; // display coordinates
  std::vector<std::array<double, 2> > MemberPoints;
  vtkIdType OverflowCount = 0;
};

struct ClusterPreview
{
  vtkIdType ClusterId = -1;
  vtkIdType MemberCount = 0;
  std::vector<std::string> SampleNames;
};

// Result of hit-testing map content at a display position
struct PickResult
{
  std::string Category;
  std::string FeatureKey;
  vtkIdType ItemIndex = -1;
};

//----------------------------------------------------------------------------
// Converts "#rrggbb" to unsigned char rgb. Returns false on malformed input.
inline bool HexToRGB(const std::string& hex, unsigned char rgb[3])
{
  if (hex.size() != 7 || hex[0] != '#')
  {
    return false;
  }
  for (int i = 0; i < 3; ++i)
  {
    const std::string component = hex.substr(1 + 2 * i, 2);
    char* end = nullptr;
    const long value = std::strtol(component.c_str(), &end, 16);
    if (end != component.c_str() + 2)
    {
      return false;
    }
    rgb[i] = static_cast<unsigned char>(value);
  }
  return true;
}

inline void HexToRGB(const std::string& hex, double rgb[3])
{
  unsigned char c[3] = { 0, 0, 0 };
  HexToRGB(hex, c);
  for (int i = 0; i < 3; ++i)
  {
    rgb[i] = c[i] / 255.0;
  }
}

inline const char* EvidenceLayerColor(EvidenceLayer layer)
{
  switch (layer)
  {
    case EvidenceLayer::Documented:
      return "#7c2d12";
    case EvidenceLayer::Attested:
      return "#b45309";
    case EvidenceLayer::Inferred:
      return "#6b7280";
    case EvidenceLayer::None:
      break;
  }
  return "#b45309";
}

inline EvidenceLayer EvidenceLayerFromString(const std::string& name)
{
  if (name == "documented")
  {
    return EvidenceLayer::Documented;
  }
  if (name == "attested")
  {
    return EvidenceLayer::Attested;
  }
  if (name == "inferred")
  {
    return EvidenceLayer::Inferred;
  }
  return EvidenceLayer::None;
}
}
#endif // __vtkPointMap_typedef_h
