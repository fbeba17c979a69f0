/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointMarkerFeature.h"
#include "vtkMercator.h"

#include <vtkNew.h>
#include <vtkObjectFactory.h>
#include <vtkPolyDataMapper.h>
#include <vtkProperty.h>
#include <vtkRegularPolygonSource.h>

vtkStandardNewMacro(vtkPointMarkerFeature);

namespace
{
const double FEATURED_MARKER_SIZE = 32.0;
const double MARKER_SIZE = 24.0;
const char* OUTLINE_COLOR = "#fbbf24";
}

//----------------------------------------------------------------------------
vtkPointMarkerFeature::vtkPointMarkerFeature()
  : vtkPolydataFeature()
  , OutlineActor(vtkSmartPointer<vtkActor>::New())
{
  this->Anchor[0] = this->Anchor[1] = 0.0;
  this->DisplayOffset[0] = this->DisplayOffset[1] = 0.0;
  this->MarkerSize = MARKER_SIZE;
  this->Outline = false;
  this->FillColor = vtkPointMapType::EvidenceLayerColor(
    vtkPointMapType::EvidenceLayer::None);
}

//----------------------------------------------------------------------------
vtkPointMarkerFeature::~vtkPointMarkerFeature() {}

//----------------------------------------------------------------------------
void vtkPointMarkerFeature::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Point: " << this->PointFeature.Id << "\n"
     << indent << "Anchor: " << this->Anchor[0] << ", " << this->Anchor[1]
     << "\n"
     << indent << "DisplayOffset: " << this->DisplayOffset[0] << ", "
     << this->DisplayOffset[1] << "\n"
     << indent << "MarkerSize: " << this->MarkerSize << "\n"
     << indent << "Outline: " << this->Outline << "\n"
     << indent << "FillColor: " << this->FillColor << std::endl;
}

//----------------------------------------------------------------------------
void vtkPointMarkerFeature::SetPointFeature(
  const vtkPointMapType::JitteredFeature& feature)
{
  this->PointFeature = feature;
  this->Anchor[0] = feature.Position[0];
  this->Anchor[1] = feature.Position[1];

  const bool featured =
    feature.Kind == vtkPointMapType::FeatureKind::FeaturedFactoid;
  this->MarkerSize = featured ? FEATURED_MARKER_SIZE : MARKER_SIZE;
  this->Outline = featured;
  this->SetFillColor(vtkPointMapType::EvidenceLayerColor(feature.Layer));
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPointMarkerFeature::SetFillColor(const std::string& hex)
{
  unsigned char rgb[3];
  if (!vtkPointMapType::HexToRGB(hex, rgb))
  {
    vtkWarningMacro("Invalid color " << hex);
    return;
  }
  this->FillColor = hex;
  double color[3];
  vtkPointMapType::HexToRGB(hex, color);
  this->Actor->GetProperty()->SetColor(color);
  this->Modified();
}

//----------------------------------------------------------------------------
void vtkPointMarkerFeature::Init()
{
  if (!this->Layer)
  {
    vtkErrorMacro("Invalid Layer!");
    return;
  }

  // Unit diameter disc, scaled to the marker size on every update
  vtkNew<vtkRegularPolygonSource> disc;
  disc->SetNumberOfSides(24);
  disc->SetRadius(0.5);
  this->Mapper->SetInputConnection(disc->GetOutputPort());
  this->Actor->GetProperty()->LightingOff();

  if (this->Outline)
  {
    vtkNew<vtkRegularPolygonSource> ring;
    ring->SetNumberOfSides(24);
    ring->SetRadius(0.5);
    ring->GeneratePolygonOff();
    ring->GeneratePolylineOn();
    vtkNew<vtkPolyDataMapper> ringMapper;
    ringMapper->SetInputConnection(ring->GetOutputPort());
    this->OutlineActor->SetMapper(ringMapper.GetPointer());

    double gold[3];
    vtkPointMapType::HexToRGB(OUTLINE_COLOR, gold);
    this->OutlineActor->GetProperty()->SetColor(gold);
    this->OutlineActor->GetProperty()->SetLineWidth(3.0);
    this->OutlineActor->GetProperty()->LightingOff();
    this->Layer->AddActor(this->OutlineActor);
  }

  this->Superclass::Init();
}

//----------------------------------------------------------------------------
void vtkPointMarkerFeature::Update()
{
  vtkPointMap* map = this->GetMap();
  if (!map)
  {
    return;
  }

  const double wpp = map->GetWorldUnitsPerPixel();
  const double scale = this->MarkerSize * wpp;
  const double x = this->Anchor[0] + this->DisplayOffset[0] * wpp;
  const double y =
    vtkMercator::lat2y(vtkMercator::validLatitude(this->Anchor[1])) +
    this->DisplayOffset[1] * wpp;
  const double z = this->GetLayerZCoord();

  this->Actor->SetScale(scale, scale, 1.0);
  this->Actor->SetPosition(x, y, z);
  if (this->Outline)
  {
    this->OutlineActor->SetScale(scale, scale, 1.0);
    this->OutlineActor->SetPosition(x, y, z + 0.001);
    this->OutlineActor->SetVisibility(this->IsVisible());
  }

  this->Superclass::Update();
}

//----------------------------------------------------------------------------
void vtkPointMarkerFeature::CleanUp()
{
  if (this->Layer && this->Outline)
  {
    this->Layer->RemoveActor(this->OutlineActor);
  }
  this->Superclass::CleanUp();
}

//----------------------------------------------------------------------------
bool vtkPointMarkerFeature::ComputeDisplayPosition(double display[2])
{
  vtkPointMap* map = this->GetMap();
  if (!map)
  {
    return false;
  }

  const double latLng[2] = { this->Anchor[1], this->Anchor[0] };
  map->ComputeDisplayCoords(latLng, display);
  display[0] += this->DisplayOffset[0];
  display[1] += this->DisplayOffset[1];
  return true;
}

//----------------------------------------------------------------------------
bool vtkPointMarkerFeature::HitTest(
  const double displayCoords[2], vtkPointMapType::PickResult& result)
{
  double display[2];
  if (!this->IsVisible() || !this->ComputeDisplayPosition(display))
  {
    return false;
  }

  const double radius = 0.5 * this->MarkerSize;
  const double dx = display[0] - displayCoords[0];
  const double dy = display[1] - displayCoords[1];
  if (dx * dx + dy * dy > radius * radius)
  {
    return false;
  }

  result.FeatureKey = this->Key;
  result.ItemIndex = 0;
  return true;
}
