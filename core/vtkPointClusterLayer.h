/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointClusterLayer - asynchronous feature layer over a cluster index
// .SECTION Description
// Holds the vtkPointClusterIndex of the clustered point set together with
// the features drawing it. Queries on the index that interactive code
// issues (expansion zoom, leaves) are queued and answered from
// ResolveAsync(), which vtkPointMap calls on every poll. A request is
// answered with a failure when its cluster id is unknown to the index at
// the time the request is resolved.
//
// Requests issued from inside a callback are answered on the next poll.
//

#ifndef __vtkPointClusterLayer_h
#define __vtkPointClusterLayer_h

#include "vtkFeatureLayer.h"
#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vtkSmartPointer.h>

#include <deque>
#include <functional>
#include <vector>

class vtkPointClusterIndex;

class VTKPOINTMAPCORE_EXPORT vtkPointClusterLayer : public vtkFeatureLayer
{
public:
  static vtkPointClusterLayer* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkPointClusterLayer, vtkFeatureLayer)

  using ExpansionCallback = std::function<void(bool, int)>;
  using LeavesCallback = std::function<void(
    bool, const std::vector<vtkPointMapType::JitteredFeature>&)>;

  // Description:
  // The index queried by this layer
  vtkPointClusterIndex* GetIndex();

  // Description:
  // Queue an expansion zoom query. The callback receives false when the
  // cluster id is unknown.
  void RequestExpansionZoom(vtkIdType clusterId, ExpansionCallback callback);

  // Description:
  // Queue a leaves query. The callback receives false when the cluster id
  // is unknown.
  void RequestLeaves(vtkIdType clusterId, vtkIdType limit, vtkIdType offset,
    LeavesCallback callback);

  std::size_t GetNumberOfPendingRequests() const;

  // Description:
  // Drop every queued request without answering it
  void CancelPendingRequests();

  // Description:
  // Answer the queued requests
  bool IsAsynchronous() override { return true; }
  vtkPointMap::AsyncState ResolveAsync() override;

protected:
  vtkPointClusterLayer();
  ~vtkPointClusterLayer() override;

  struct Request
  {
    vtkIdType ClusterId;
    vtkIdType Limit;
    vtkIdType Offset;
    ExpansionCallback OnExpansion;
    LeavesCallback OnLeaves;
  };

  void ProcessRequest(const Request& request);

  vtkSmartPointer<vtkPointClusterIndex> Index;
  std::deque<Request> PendingRequests;

private:
  vtkPointClusterLayer(const vtkPointClusterLayer&) = delete;
  vtkPointClusterLayer& operator=(const vtkPointClusterLayer&) = delete;
};

#endif // __vtkPointClusterLayer_h
