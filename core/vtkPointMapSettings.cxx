/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointMapSettings.h"

#include <vtkObjectFactory.h>

vtkStandardNewMacro(vtkPointMapSettings);

//----------------------------------------------------------------------------
vtkPointMapSettings::vtkPointMapSettings()
{
  this->ClusterThresholdCount = 500;
  this->MaxDomMarkers = 200;
  this->MaxFeaturedMarkers = 200;
  this->MaxUnclusteredPoints = 2000;
  this->ClusterRadiusPixels = 30;
  this->MaxClusterZoom = 16;
  this->JitterBaseRadiusDegrees = 0.001;
  this->JitterCapFactor = 5.0;
  this->CoordinatePrecision = 6;
  this->ShowUncertainty = true;
  this->MaxSpiderMarkers = 20;
  this->HoverLeafLimit = 10;
  this->HoverSampleNames = 5;
  this->MaxReadyRetries = 20;
  this->AnimationDuration = 500;
}

//----------------------------------------------------------------------------
vtkPointMapSettings::~vtkPointMapSettings() {}

//----------------------------------------------------------------------------
void vtkPointMapSettings::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "ClusterThresholdCount: " << this->ClusterThresholdCount
     << "\n"
     << indent << "MaxDomMarkers: " << this->MaxDomMarkers << "\n"
     << indent << "MaxFeaturedMarkers: " << this->MaxFeaturedMarkers << "\n"
     << indent << "MaxUnclusteredPoints: " << this->MaxUnclusteredPoints << "\n"
     << indent << "ClusterRadiusPixels: " << this->ClusterRadiusPixels << "\n"
     << indent << "MaxClusterZoom: " << this->MaxClusterZoom << "\n"
     << indent << "JitterBaseRadiusDegrees: " << this->JitterBaseRadiusDegrees
     << "\n"
     << indent << "JitterCapFactor: " << this->JitterCapFactor << "\n"
     << indent << "CoordinatePrecision: " << this->CoordinatePrecision << "\n"
     << indent << "ShowUncertainty: " << this->ShowUncertainty << "\n"
     << indent << "MaxSpiderMarkers: " << this->MaxSpiderMarkers << "\n"
     << indent << "HoverLeafLimit: " << this->HoverLeafLimit << "\n"
     << indent << "HoverSampleNames: " << this->HoverSampleNames << "\n"
     << indent << "MaxReadyRetries: " << this->MaxReadyRetries << "\n"
     << indent << "AnimationDuration: " << this->AnimationDuration << std::endl;
}
