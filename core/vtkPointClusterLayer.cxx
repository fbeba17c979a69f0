/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include "vtkPointClusterLayer.h"
#include "vtkPointClusterIndex.h"

#include <vtkIdList.h>
#include <vtkNew.h>
#include <vtkObjectFactory.h>

#include <utility>

vtkStandardNewMacro(vtkPointClusterLayer);

//----------------------------------------------------------------------------
vtkPointClusterLayer::vtkPointClusterLayer()
  : Index(vtkSmartPointer<vtkPointClusterIndex>::New())
{
  this->SetName("clusters");
}

//----------------------------------------------------------------------------
vtkPointClusterLayer::~vtkPointClusterLayer() {}

//----------------------------------------------------------------------------
void vtkPointClusterLayer::PrintSelf(ostream& os, vtkIndent indent)
{
  this->Superclass::PrintSelf(os, indent);
  os << indent << "Pending Requests: " << this->PendingRequests.size() << "\n";
  os << indent << "Index:\n";
  this->Index->PrintSelf(os, indent.GetNextIndent());
}

//----------------------------------------------------------------------------
vtkPointClusterIndex* vtkPointClusterLayer::GetIndex()
{
  return this->Index;
}

//----------------------------------------------------------------------------
void vtkPointClusterLayer::RequestExpansionZoom(
  vtkIdType clusterId, ExpansionCallback callback)
{
  Request request;
  request.ClusterId = clusterId;
  request.Limit = 0;
  request.Offset = 0;
  request.OnExpansion = std::move(callback);
  this->PendingRequests.push_back(std::move(request));
}

//----------------------------------------------------------------------------
void vtkPointClusterLayer::RequestLeaves(vtkIdType clusterId, vtkIdType limit,
  vtkIdType offset, LeavesCallback callback)
{
  Request request;
  request.ClusterId = clusterId;
  request.Limit = limit;
  request.Offset = offset;
  request.OnLeaves = std::move(callback);
  this->PendingRequests.push_back(std::move(request));
}

//----------------------------------------------------------------------------
std::size_t vtkPointClusterLayer::GetNumberOfPendingRequests() const
{
  return this->PendingRequests.size();
}

//----------------------------------------------------------------------------
void vtkPointClusterLayer::CancelPendingRequests()
{
  this->PendingRequests.clear();
}

//----------------------------------------------------------------------------
vtkPointMap::AsyncState vtkPointClusterLayer::ResolveAsync()
{
  if (this->PendingRequests.empty())
  {
    return vtkPointMap::AsyncIdle;
  }

  // Callbacks may queue new requests or release this layer
  vtkSmartPointer<vtkPointClusterLayer> self = this;
  std::deque<Request> requests;
  requests.swap(this->PendingRequests);
  for (const auto& request : requests)
  {
    this->ProcessRequest(request);
  }

  return vtkPointMap::AsyncFullUpdate;
}

//----------------------------------------------------------------------------
void vtkPointClusterLayer::ProcessRequest(const Request& request)
{
  const bool known = this->Index->HasCluster(request.ClusterId);
  if (request.OnExpansion)
  {
    const int zoom = known ? this->Index->GetExpansionZoom(request.ClusterId)
                           : vtkPointClusterIndex::InvalidCluster;
    vtkDebugMacro("Expansion zoom of " << request.ClusterId << ": " << zoom);
    request.OnExpansion(known, zoom);
    return;
  }

  std::vector<vtkPointMapType::JitteredFeature> leaves;
  if (known)
  {
    vtkNew<vtkIdList> ids;
    this->Index->GetLeaves(
      request.ClusterId, request.Limit, request.Offset, ids.GetPointer());
    leaves.reserve(static_cast<size_t>(ids->GetNumberOfIds()));
    for (vtkIdType i = 0; i < ids->GetNumberOfIds(); ++i)
    {
      const vtkPointMapType::JitteredFeature* feature =
        this->Index->GetFeature(ids->GetId(i));
      if (feature)
      {
        leaves.push_back(*feature);
      }
    }
  }
  if (request.OnLeaves)
  {
    request.OnLeaves(known, leaves);
  }
}
