/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkViewportLifecycleManager.h"
#include "vtkFeature.h"
#include "vtkFeatureLayer.h"
#include "vtkPointMap.h"

#include <vtkObjectFactory.h>

#include <algorithm>
#include <deque>
#include <map>
#include <utility>

vtkStandardNewMacro(vtkViewportLifecycleManager);

//----------------------------------------------------------------------------
class vtkViewportLifecycleManager::vtkInternal
{
public:
  struct Category
  {
    std::string Name;
    vtkSmartPointer<vtkFeatureLayer> Layer;
  };

  struct Entry
  {
    std::string Category;
    vtkSmartPointer<vtkFeature> Feature;
  };

  // Stacking order, bottom first
  std::vector<Category> Categories;

  // key: resource key
  std::map<std::string, Entry> Registry;

  std::deque<std::pair<std::string, Operation> > Pending;

  std::vector<Subscription> Subscriptions;

  std::vector<unsigned long> ObserverTags;

  Category* FindCategory(const std::string& name)
  {
    for (auto& category : this->Categories)
    {
      if (category.Name == name)
      {
        return &category;
      }
    }
    return nullptr;
  }
};

//----------------------------------------------------------------------------
vtkViewportLifecycleManager::vtkViewportLifecycleManager()
{
  this->MaxReadyRetries = 20;
  this->ReadyRetries = 0;
  this->NotReadyReported = false;
  this->Internals = new vtkInternal;
}

//----------------------------------------------------------------------------
vtkViewportLifecycleManager::~vtkViewportLifecycleManager()
{
  this->Detach();
  delete this->Internals;
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Attached: " << this->IsAttached() << "\n"
     << indent << "MaxReadyRetries: " << this->MaxReadyRetries << "\n"
     << indent << "ReadyRetries: " << this->ReadyRetries << "\n"
     << indent << "Categories:";
  for (const auto& category : this->Internals->Categories)
  {
    os << " " << category.Name;
  }
  os << "\n"
     << indent << "Number Of Features: " << this->Internals->Registry.size()
     << "\n"
     << indent << "Pending Operations: " << this->Internals->Pending.size()
     << "\n"
     << indent << "Subscriptions: " << this->Internals->Subscriptions.size()
     << std::endl;
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::Attach(vtkPointMap* map)
{
  if (this->Map == map)
  {
    return;
  }
  this->Detach();
  if (!map)
  {
    return;
  }

  this->Map = map;
  this->ReadyRetries = 0;
  this->NotReadyReported = false;

  auto& tags = this->Internals->ObserverTags;
  tags.push_back(map->AddObserver(
    vtkPointMap::ReadyEvent, this, &vtkViewportLifecycleManager::OnMapReady));
  tags.push_back(map->AddObserver(
    vtkPointMap::PollEvent, this, &vtkViewportLifecycleManager::OnMapPoll));
  tags.push_back(map->AddObserver(vtkPointMap::DisplayClickEvent, this,
    &vtkViewportLifecycleManager::OnMapInteraction));
  tags.push_back(map->AddObserver(vtkPointMap::DisplayHoverEvent, this,
    &vtkViewportLifecycleManager::OnMapInteraction));
  tags.push_back(map->AddObserver(vtkPointMap::UserInteractionEvent, this,
    &vtkViewportLifecycleManager::ForwardMapEvent));
  tags.push_back(map->AddObserver(vtkPointMap::AnimationCompleteEvent, this,
    &vtkViewportLifecycleManager::ForwardMapEvent));
  tags.push_back(map->AddObserver(vtkPointMap::AnimationCancelledEvent, this,
    &vtkViewportLifecycleManager::ForwardMapEvent));

  this->AttachLayers();
  vtkDebugMacro("Attached to map " << map);

  if (this->IsReady())
  {
    this->FlushPending();
  }
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::Detach()
{
  if (!this->Map)
  {
    return;
  }

  for (unsigned long tag : this->Internals->ObserverTags)
  {
    this->Map->RemoveObserver(tag);
  }
  this->Internals->ObserverTags.clear();
  this->Internals->Subscriptions.clear();
  this->Internals->Pending.clear();

  // Removing a layer from the map cleans up its features
  this->Internals->Registry.clear();
  for (auto& category : this->Internals->Categories)
  {
    if (category.Layer->GetMap() == this->Map)
    {
      this->Map->RemoveLayer(category.Layer);
    }
    else
    {
      category.Layer->RemoveAllFeatures();
    }
  }

  vtkDebugMacro("Detached from map " << this->Map.GetPointer());
  this->Map = nullptr;
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::IsAttached() const
{
  return this->Map != nullptr;
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::IsReady()
{
  return this->Map && this->Map->IsReady();
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::RegisterCategory(
  const std::string& name, vtkFeatureLayer* layer)
{
  if (this->Internals->FindCategory(name))
  {
    return;
  }

  vtkInternal::Category category;
  category.Name = name;
  category.Layer = layer;
  if (!category.Layer)
  {
    category.Layer = vtkSmartPointer<vtkFeatureLayer>::New();
  }
  category.Layer->SetName(name);
  this->Internals->Categories.push_back(category);

  this->AttachLayers();
}

//----------------------------------------------------------------------------
vtkFeatureLayer* vtkViewportLifecycleManager::GetCategoryLayer(
  const std::string& name)
{
  vtkInternal::Category* category = this->Internals->FindCategory(name);
  return category ? category->Layer.GetPointer() : nullptr;
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::AttachLayers()
{
  if (!this->Map || !this->Map->GetRenderer())
  {
    return;
  }

  for (auto& category : this->Internals->Categories)
  {
    if (category.Layer->GetMap() != this->Map)
    {
      this->Map->AddLayer(category.Layer);
    }
  }
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::AddFeature(
  const std::string& categoryName, const std::string& key, vtkFeature* feature)
{
  if (!feature)
  {
    return false;
  }

  if (!this->IsReady())
  {
    vtkWarningMacro("Cannot add " << key << ": map is not ready."
                                  << " Use RunWhenReady() to defer map changes.");
    return false;
  }

  vtkInternal::Category* category = this->Internals->FindCategory(categoryName);
  if (!category)
  {
    vtkErrorMacro("Unknown category " << categoryName);
    return false;
  }
  this->AttachLayers();

  // Remove before add
  this->RemoveFeature(key);

  feature->SetKey(key);
  if (!category->Layer->AddFeature(feature))
  {
    vtkErrorMacro("Layer " << categoryName << " refused feature " << key);
    return false;
  }

  vtkInternal::Entry entry;
  entry.Category = categoryName;
  entry.Feature = feature;
  this->Internals->Registry[key] = entry;
  vtkDebugMacro("Added " << key << " to " << categoryName);
  return true;
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::RemoveFeature(const std::string& key)
{
  auto iter = this->Internals->Registry.find(key);
  if (iter == this->Internals->Registry.end())
  {
    return false;
  }

  vtkInternal::Entry entry = iter->second;
  this->Internals->Registry.erase(iter);

  vtkInternal::Category* category = this->Internals->FindCategory(entry.Category);
  if (category)
  {
    category->Layer->RemoveFeature(entry.Feature);
  }
  vtkDebugMacro("Removed " << key);
  return true;
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::ClearCategory(const std::string& categoryName)
{
  std::vector<std::string> keys;
  for (const auto& item : this->Internals->Registry)
  {
    if (item.second.Category == categoryName)
    {
      keys.push_back(item.first);
    }
  }

  for (const auto& key : keys)
  {
    this->RemoveFeature(key);
  }
}

//----------------------------------------------------------------------------
vtkFeature* vtkViewportLifecycleManager::FindFeature(const std::string& key)
{
  auto iter = this->Internals->Registry.find(key);
  return iter == this->Internals->Registry.end() ? nullptr
                                                 : iter->second.Feature.GetPointer();
}

//----------------------------------------------------------------------------
std::size_t vtkViewportLifecycleManager::GetNumberOfFeatures(
  const std::string& categoryName)
{
  vtkInternal::Category* category = this->Internals->FindCategory(categoryName);
  return category ? category->Layer->GetNumberOfFeatures() : 0;
}

//----------------------------------------------------------------------------
std::size_t vtkViewportLifecycleManager::GetNumberOfFeatures() const
{
  return this->Internals->Registry.size();
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::RunWhenReady(
  const std::string& name, Operation op)
{
  if (!op)
  {
    return;
  }

  if (this->IsReady() && this->Internals->Pending.empty())
  {
    op();
    return;
  }

  auto& pending = this->Internals->Pending;
  auto iter = std::find_if(pending.begin(), pending.end(),
    [&name](const std::pair<std::string, Operation>& item) {
      return item.first == name;
    });
  if (iter != pending.end())
  {
    iter->second = std::move(op);
  }
  else
  {
    pending.push_back(std::make_pair(name, std::move(op)));
  }
  vtkDebugMacro("Queued " << name);

  this->FlushPending();
}

//----------------------------------------------------------------------------
std::size_t vtkViewportLifecycleManager::GetNumberOfPendingOperations() const
{
  return this->Internals->Pending.size();
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::FlushPending()
{
  if (this->Internals->Pending.empty())
  {
    return;
  }

  if (!this->IsReady())
  {
    ++this->ReadyRetries;
    if (this->ReadyRetries >= this->MaxReadyRetries && !this->NotReadyReported)
    {
      this->NotReadyReported = true;
      vtkWarningMacro("Map not ready after " << this->ReadyRetries
                                             << " attempts, "
                                             << this->Internals->Pending.size()
                                             << " operation(s) still queued");
      this->InvokeEvent(RendererNotReadyEvent);
    }
    return;
  }

  this->AttachLayers();
  this->ReadyRetries = 0;
  while (!this->Internals->Pending.empty())
  {
    auto item = std::move(this->Internals->Pending.front());
    this->Internals->Pending.pop_front();
    vtkDebugMacro("Running " << item.first);
    item.second();
  }
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::SetSubscriptions(
  const std::vector<Subscription>& subscriptions)
{
  this->Internals->Subscriptions = subscriptions;
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::ClearSubscriptions()
{
  this->Internals->Subscriptions.clear();
}

//----------------------------------------------------------------------------
std::size_t vtkViewportLifecycleManager::GetNumberOfSubscriptions() const
{
  return this->Internals->Subscriptions.size();
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::HasSubscription(const std::string& layerId) const
{
  for (const auto& subscription : this->Internals->Subscriptions)
  {
    if (subscription.LayerId == layerId)
    {
      return true;
    }
  }
  return false;
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::DispatchInteraction(
  vtkPointMapType::Interaction kind, const double displayCoords[2])
{
  if (!this->Map)
  {
    return false;
  }

  // Handlers may replace the table
  const std::vector<Subscription> subscriptions = this->Internals->Subscriptions;

  vtkPointMapType::PickResult result;
  bool hit = false;
  auto& categories = this->Internals->Categories;
  for (auto iter = categories.rbegin(); iter != categories.rend() && !hit; ++iter)
  {
    if (!this->HasSubscription(iter->Name))
    {
      continue;
    }

    vtkFeatureLayer* layer = iter->Layer;
    for (std::size_t i = layer->GetNumberOfFeatures(); i > 0; --i)
    {
      vtkFeature* feature = layer->GetFeature(i - 1);
      if (feature && feature->HitTest(displayCoords, result))
      {
        result.Category = iter->Name;
        if (result.FeatureKey.empty())
        {
          result.FeatureKey = feature->GetKey();
        }
        hit = true;
        break;
      }
    }
  }

  if (!hit)
  {
    result = vtkPointMapType::PickResult();
    result.Category = "background";
  }

  bool handled = false;
  for (const auto& subscription : subscriptions)
  {
    if (subscription.LayerId == result.Category && subscription.Kind == kind &&
      subscription.Callback)
    {
      subscription.Callback(result);
      handled = true;
    }
  }
  return handled;
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::OnMapReady(
  vtkObject* vtkNotUsed(caller), unsigned long vtkNotUsed(event),
  void* vtkNotUsed(data))
{
  this->AttachLayers();
  this->FlushPending();
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::OnMapPoll(vtkObject* vtkNotUsed(caller),
  unsigned long vtkNotUsed(event), void* vtkNotUsed(data))
{
  this->FlushPending();
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::OnMapInteraction(
  vtkObject* vtkNotUsed(caller), unsigned long event, void* data)
{
  const double* displayCoords = static_cast<const double*>(data);
  if (!displayCoords)
  {
    return;
  }

  const vtkPointMapType::Interaction kind = event == vtkPointMap::DisplayClickEvent
    ? vtkPointMapType::Interaction::Click
    : vtkPointMapType::Interaction::Hover;
  this->DispatchInteraction(kind, displayCoords);
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::ForwardMapEvent(
  vtkObject* vtkNotUsed(caller), unsigned long event, void* data)
{
  this->InvokeEvent(event, data);
}

//----------------------------------------------------------------------------
int vtkViewportLifecycleManager::GetZoom()
{
  return this->Map ? this->Map->GetZoom() : 0;
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::ComputeDisplayCoords(
  const double latLngCoords[2], double displayCoords[2])
{
  if (!this->Map)
  {
    return false;
  }
  this->Map->ComputeDisplayCoords(latLngCoords, displayCoords);
  return true;
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::ComputeLatLngCoords(
  const double displayCoords[2], double latLngCoords[2])
{
  if (!this->Map)
  {
    return false;
  }
  this->Map->ComputeLatLngCoords(displayCoords, latLngCoords);
  return true;
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::EaseTo(
  double latitude, double longitude, int zoom)
{
  if (this->Map)
  {
    this->Map->EaseTo(latitude, longitude, zoom);
  }
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::StopAnimation()
{
  if (this->Map)
  {
    this->Map->StopAnimation();
  }
}

//----------------------------------------------------------------------------
bool vtkViewportLifecycleManager::IsAnimating()
{
  return this->Map && this->Map->IsAnimating();
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::SetAnimationDuration(int milliseconds)
{
  if (this->Map)
  {
    this->Map->SetAnimationDuration(milliseconds);
  }
}

//----------------------------------------------------------------------------
void vtkViewportLifecycleManager::Update()
{
  if (this->Map)
  {
    this->Map->Update();
  }
}
