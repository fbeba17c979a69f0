/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkFeatureLayer.h"
#include "vtkFeature.h"

#include <vtkObjectFactory.h>
#include <vtkSmartPointer.h>

#include <algorithm>
#include <vector>

vtkStandardNewMacro(vtkFeatureLayer);

//----------------------------------------------------------------------------
class vtkFeatureLayer::vtkInternal
{
public:
  typedef std::vector<vtkSmartPointer<vtkFeature> > FeatureList;

  FeatureList::iterator Find(vtkFeature* feature)
  {
    return std::find(this->Features.begin(), this->Features.end(), feature);
  }

  FeatureList Features;
};

//----------------------------------------------------------------------------
vtkFeatureLayer::vtkFeatureLayer()
  : Impl(new vtkInternal)
{
}

//----------------------------------------------------------------------------
vtkFeatureLayer::~vtkFeatureLayer()
{
  delete this->Impl;
}

//----------------------------------------------------------------------------
void vtkFeatureLayer::PrintSelf(std::ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Features: " << this->GetNumberOfFeatures() << "\n";
}

//----------------------------------------------------------------------------
void vtkFeatureLayer::UnRegister(vtkObjectBase* o)
{
  // Last reference: features still point back at this layer
  if (this->GetReferenceCount() == 1 && this->Impl)
  {
    this->RemoveAllFeatures();
  }
  this->Superclass::UnRegister(o);
}

//----------------------------------------------------------------------------
bool vtkFeatureLayer::AddFeature(vtkFeature* feature)
{
  if (!feature || this->HasFeature(feature))
  {
    return false;
  }

  if (!this->Renderer)
  {
    vtkWarningMacro("Cannot add feature " << feature->GetKey() << " to layer "
                                          << this->Name
                                          << ": the layer is not on a map with a renderer");
    return false;
  }

  feature->SetLayer(this);
  this->Impl->Features.push_back(feature);
  feature->Init();
  this->Modified();
  return true;
}

//----------------------------------------------------------------------------
bool vtkFeatureLayer::RemoveFeature(vtkFeature* feature)
{
  auto iter = this->Impl->Find(feature);
  if (!feature || iter == this->Impl->Features.end())
  {
    return false;
  }

  // The list may hold the last reference
  vtkSmartPointer<vtkFeature> holder = *iter;
  this->Impl->Features.erase(iter);
  holder->CleanUp();
  this->Modified();
  return true;
}

//----------------------------------------------------------------------------
void vtkFeatureLayer::RemoveAllFeatures()
{
  vtkInternal::FeatureList features;
  features.swap(this->Impl->Features);
  if (features.empty())
  {
    return;
  }

  for (const auto& feature : features)
  {
    feature->CleanUp();
  }
  this->Modified();
}

//----------------------------------------------------------------------------
bool vtkFeatureLayer::HasFeature(vtkFeature* feature) const
{
  return std::find(this->Impl->Features.begin(), this->Impl->Features.end(),
           feature) != this->Impl->Features.end();
}

//----------------------------------------------------------------------------
std::size_t vtkFeatureLayer::GetNumberOfFeatures() const
{
  return this->Impl->Features.size();
}

//----------------------------------------------------------------------------
vtkFeature* vtkFeatureLayer::GetFeature(std::size_t index) const
{
  if (index >= this->Impl->Features.size())
  {
    return nullptr;
  }
  return this->Impl->Features[index];
}

//----------------------------------------------------------------------------
void vtkFeatureLayer::Update()
{
  // Features may remove themselves while updating
  const vtkInternal::FeatureList features = this->Impl->Features;
  for (const auto& feature : features)
  {
    feature->Update();
  }
}
