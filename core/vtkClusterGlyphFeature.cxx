/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkClusterGlyphFeature.h"
#include "vtkMercator.h"
#include "vtkPointClusterIndex.h"

// VTK Includes
#include <vtkActor2D.h>
#include <vtkDistanceToCamera.h>
#include <vtkDoubleArray.h>
#include <vtkGlyph3DMapper.h>
#include <vtkLabeledDataMapper.h>
#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkPointData.h>
#include <vtkPoints.h>
#include <vtkPolyData.h>
#include <vtkProperty.h>
#include <vtkRegularPolygonSource.h>
#include <vtkRenderer.h>
#include <vtkStringArray.h>
#include <vtkTextProperty.h>
#include <vtkUnsignedCharArray.h>

#include <cmath>
#include <sstream>

vtkStandardNewMacro(vtkClusterGlyphFeature);

//----------------------------------------------------------------------------
namespace
{
enum
{
  MARKER_TYPE = 0,
  CLUSTER_TYPE = 1
};

const double SINGLE_POINT_RADIUS = 8.0;
}

//----------------------------------------------------------------------------
vtkClusterGlyphFeature::vtkClusterGlyphFeature()
  : vtkPolydataFeature()
  , DisplayedZoom(-1)
  , PolyData(vtkSmartPointer<vtkPolyData>::New())
  , GlyphMapper(vtkSmartPointer<vtkGlyph3DMapper>::New())
  , LabelData(vtkSmartPointer<vtkPolyData>::New())
  , LabelMapper(vtkSmartPointer<vtkLabeledDataMapper>::New())
  , LabelActor(vtkSmartPointer<vtkActor2D>::New())
{
}

//----------------------------------------------------------------------------
vtkClusterGlyphFeature::~vtkClusterGlyphFeature() {}

//----------------------------------------------------------------------------
void vtkClusterGlyphFeature::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "DisplayedZoom: " << this->DisplayedZoom << "\n"
     << indent << "Displayed Clusters: " << this->DisplayedClusters.size()
     << std::endl;
}

//----------------------------------------------------------------------------
void vtkClusterGlyphFeature::SetIndex(vtkPointClusterIndex* index)
{
  if (this->Index == index)
  {
    return;
  }
  this->Index = index;
  this->DisplayedZoom = -1;
  this->Modified();
}

//----------------------------------------------------------------------------
vtkPointClusterIndex* vtkClusterGlyphFeature::GetIndex()
{
  return this->Index;
}

//----------------------------------------------------------------------------
void vtkClusterGlyphFeature::GetClusterStyle(
  vtkIdType memberCount, unsigned char rgb[3], double& radius)
{
  const char* color = "#7c2d12";
  radius = 32.0;
  if (memberCount <= 1)
  {
    color = "#dc2626";
    radius = SINGLE_POINT_RADIUS;
  }
  else if (memberCount < 100)
  {
    color = "#b45309";
    radius = 18.0;
  }
  else if (memberCount < 500)
  {
    color = "#92400e";
    radius = 24.0;
  }
  vtkPointMapType::HexToRGB(color, rgb);
}

//----------------------------------------------------------------------------
std::string vtkClusterGlyphFeature::FormatCount(vtkIdType count)
{
  std::ostringstream label;
  if (count >= 10000)
  {
    label << std::llround(count / 1000.0) << "k";
  }
  else if (count >= 1000)
  {
    const long long tenths = std::llround(count / 100.0);
    label << tenths / 10;
    if (tenths % 10)
    {
      label << "." << tenths % 10;
    }
    label << "k";
  }
  else
  {
    label << count;
  }
  return label.str();
}

//----------------------------------------------------------------------------
void vtkClusterGlyphFeature::Init()
{
  if (!this->Layer)
  {
    vtkErrorMacro("Invalid Layer!");
    return;
  }

  // Add "MarkerType" array to polydata - to select glyph
  const char* typeName = "MarkerType";
  vtkNew<vtkUnsignedCharArray> types;
  types->SetName(typeName);
  types->SetNumberOfComponents(1);
  this->PolyData->GetPointData()->AddArray(types.GetPointer());

  // Add "MarkerScale" to scale glyph size
  const char* scaleName = "MarkerScale";
  vtkNew<vtkDoubleArray> scales;
  scales->SetName(scaleName);
  scales->SetNumberOfComponents(1);
  this->PolyData->GetPointData()->AddArray(scales.GetPointer());

  // Add "Color" array, used as direct rgb colors
  const char* colorName = "Color";
  vtkNew<vtkUnsignedCharArray> colors;
  colors->SetName(colorName);
  colors->SetNumberOfComponents(3);
  this->PolyData->GetPointData()->AddArray(colors.GetPointer());

  // Use DistanceToCamera filter to scale markers to constant screen size.
  const auto rend = this->Layer->GetRenderer();
  vtkNew<vtkDistanceToCamera> dFilter;
  dFilter->SetScreenSize(this->BaseMarkerSize);
  dFilter->SetRenderer(rend);
  dFilter->SetInputData(this->PolyData);
  dFilter->ScalingOn();
  dFilter->SetInputArrayToProcess(
    0, 0, 0, vtkDataObject::FIELD_ASSOCIATION_POINTS, scaleName);

  // Unit diameter discs, scaled per point
  vtkNew<vtkRegularPolygonSource> pointMarkerSource;
  pointMarkerSource->SetNumberOfSides(12);
  pointMarkerSource->SetRadius(0.5);
  vtkNew<vtkRegularPolygonSource> clusterMarkerSource;
  clusterMarkerSource->SetNumberOfSides(18);
  clusterMarkerSource->SetRadius(0.5);
  clusterMarkerSource->SetOutputPointsPrecision(vtkAlgorithm::SINGLE_PRECISION);

  this->GlyphMapper->SetSourceConnection(
    MARKER_TYPE, pointMarkerSource->GetOutputPort());
  this->GlyphMapper->SetSourceConnection(
    CLUSTER_TYPE, clusterMarkerSource->GetOutputPort());
  this->GlyphMapper->SetInputConnection(dFilter->GetOutputPort());

  // Select glyph type by "MarkerType" array
  this->GlyphMapper->SourceIndexingOn();
  this->GlyphMapper->SetSourceIndexArray(typeName);

  // Set scale by "DistanceToCamera" array
  this->GlyphMapper->SetScaleModeToScaleByMagnitude();
  this->GlyphMapper->SetScaleArray("DistanceToCamera");

  // Color by "Color" array
  this->GlyphMapper->ScalarVisibilityOn();
  this->GlyphMapper->SetScalarModeToUsePointFieldData();
  this->GlyphMapper->SelectColorArray(colorName);
  this->GlyphMapper->SetColorModeToDirectScalars();

  // Switch in the glyph mapper, and do NOT call Superclass::Init()
  this->Actor->SetMapper(this->GlyphMapper);
  this->Actor->SetPosition(0.0, 0.0, this->GetLayerZCoord());
  this->Actor->GetProperty()->SetOpacity(0.9);
  this->Layer->AddActor(this->Actor);

  // Count labels
  const char* countName = "Count";
  vtkNew<vtkStringArray> counts;
  counts->SetName(countName);
  this->LabelData->GetPointData()->AddArray(counts.GetPointer());

  this->LabelMapper->SetInputData(this->LabelData);
  this->LabelMapper->SetLabelModeToLabelFieldData();
  this->LabelMapper->SetFieldDataName(countName);
  auto textProp = this->LabelMapper->GetLabelTextProperty();
  textProp->SetFontSize(12);
  textProp->BoldOn();
  textProp->ItalicOff();
  textProp->ShadowOff();
  textProp->SetColor(1.0, 1.0, 1.0);
  textProp->SetJustificationToCentered();
  textProp->SetVerticalJustificationToCentered();
  this->LabelActor->SetMapper(this->LabelMapper);
  this->Layer->AddActor2D(this->LabelActor);

  this->DisplayedZoom = -1;
  this->BuildTime.Modified();
}

//----------------------------------------------------------------------------
bool vtkClusterGlyphFeature::RefreshClusters()
{
  vtkPointMap* map = this->GetMap();
  if (!map || !this->Index)
  {
    return false;
  }

  const int zoom = map->GetZoom();
  const bool changed = zoom != this->DisplayedZoom ||
    this->Index->GetMTime() > this->RefreshTime.GetMTime() ||
    this->GetMTime() > this->RefreshTime.GetMTime();
  if (!changed)
  {
    return false;
  }

  this->Index->GetClusters(zoom, this->DisplayedClusters);
  this->DisplayedZoom = zoom;
  this->RefreshTime.Modified();
  return true;
}

//----------------------------------------------------------------------------
void vtkClusterGlyphFeature::RebuildPolyData()
{
  vtkPointData* pointData = this->PolyData->GetPointData();
  auto types =
    vtkUnsignedCharArray::SafeDownCast(pointData->GetArray("MarkerType"));
  auto scales = vtkDoubleArray::SafeDownCast(pointData->GetArray("MarkerScale"));
  auto colors = vtkUnsignedCharArray::SafeDownCast(pointData->GetArray("Color"));
  auto counts = vtkStringArray::SafeDownCast(
    this->LabelData->GetPointData()->GetAbstractArray("Count"));
  if (!types || !scales || !colors || !counts)
  {
    vtkErrorMacro("vtkClusterGlyphFeature has NOT been initialized");
    return;
  }
  types->Reset();
  scales->Reset();
  colors->Reset();
  counts->Reset();

  vtkPointMap* map = this->GetMap();
  const double pixelRatio = map ? map->GetDevicePixelRatio() : 1.0;

  vtkNew<vtkPoints> points;
  vtkNew<vtkPoints> labelPoints;
  for (const auto& cluster : this->DisplayedClusters)
  {
    const double x = cluster.Centroid[0];
    const double y = vtkMercator::lat2y(cluster.Centroid[1]);
    points->InsertNextPoint(x, y, 0.0);

    unsigned char rgb[3];
    double radius = 0.0;
    GetClusterStyle(cluster.MemberCount, rgb, radius);
    types->InsertNextValue(cluster.MemberCount > 1 ? CLUSTER_TYPE : MARKER_TYPE);
    scales->InsertNextValue(2.0 * radius * pixelRatio / this->BaseMarkerSize);
    colors->InsertNextTypedTuple(rgb);

    if (cluster.MemberCount > 1)
    {
      labelPoints->InsertNextPoint(x, y, this->GetLayerZCoord());
      counts->InsertNextValue(FormatCount(cluster.MemberCount));
    }
  }

  this->PolyData->SetPoints(points.GetPointer());
  this->PolyData->Modified();
  this->LabelData->SetPoints(labelPoints.GetPointer());
  this->LabelData->Modified();
}

//----------------------------------------------------------------------------
void vtkClusterGlyphFeature::Update()
{
  if (this->RefreshClusters())
  {
    this->RebuildPolyData();
  }

  const bool visible = this->IsVisible();
  this->Actor->SetVisibility(visible);
  this->LabelActor->SetVisibility(visible);
  this->UpdateTime.Modified();
}

//----------------------------------------------------------------------------
void vtkClusterGlyphFeature::CleanUp()
{
  if (this->Layer)
  {
    this->Layer->RemoveActor(this->LabelActor);
  }
  this->DisplayedClusters.clear();
  this->Superclass::CleanUp();
}

//----------------------------------------------------------------------------
bool vtkClusterGlyphFeature::HitTest(
  const double displayCoords[2], vtkPointMapType::PickResult& result)
{
  vtkPointMap* map = this->GetMap();
  if (!map || !this->IsVisible())
  {
    return false;
  }
  this->RefreshClusters();

  vtkIdType closest = -1;
  double closestDistance2 = 0.0;
  for (size_t i = 0; i < this->DisplayedClusters.size(); ++i)
  {
    const auto& cluster = this->DisplayedClusters[i];
    const double latLng[2] = { cluster.Centroid[1], cluster.Centroid[0] };
    double display[2];
    map->ComputeDisplayCoords(latLng, display);

    unsigned char rgb[3];
    double radius = 0.0;
    GetClusterStyle(cluster.MemberCount, rgb, radius);
    const double dx = display[0] - displayCoords[0];
    const double dy = display[1] - displayCoords[1];
    const double d2 = dx * dx + dy * dy;
    if (d2 <= radius * radius && (closest < 0 || d2 < closestDistance2))
    {
      closest = static_cast<vtkIdType>(i);
      closestDistance2 = d2;
    }
  }

  if (closest < 0)
  {
    return false;
  }
  result.FeatureKey = this->Key;
  result.ItemIndex = closest;
  return true;
}

//----------------------------------------------------------------------------
std::size_t vtkClusterGlyphFeature::GetNumberOfDisplayedClusters()
{
  this->RefreshClusters();
  return this->DisplayedClusters.size();
}

//----------------------------------------------------------------------------
bool vtkClusterGlyphFeature::GetDisplayedCluster(
  vtkIdType item, vtkPointMapType::ClusterInfo& info)
{
  if (item < 0 || item >= static_cast<vtkIdType>(this->DisplayedClusters.size()))
  {
    return false;
  }
  info = this->DisplayedClusters[static_cast<size_t>(item)];
  return true;
}
