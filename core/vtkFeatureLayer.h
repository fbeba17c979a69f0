/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkFeatureLayer - layer holding an ordered list of vtkFeature
// .SECTION Description
// Features are kept in insertion order, which is also their drawing and
// (reversed) hit-testing order. A feature is initialized when it is added
// and releases its props when removed, so the layer must be on a map with
// a renderer before features can be added.
//

#ifndef __vtkFeatureLayer_h
#define __vtkFeatureLayer_h

#include "vtkLayer.h"
#include "vtkpointmapcore_export.h"

#include <cstddef>

class vtkFeature;

class VTKPOINTMAPCORE_EXPORT vtkFeatureLayer : public vtkLayer
{
public:
  static vtkFeatureLayer* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkFeatureLayer, vtkLayer)

  // Description:
  // Release the features while they can still reach this layer
  void UnRegister(vtkObjectBase* o) override;

  // Description:
  // Add / remove a feature. Both return false when nothing changed.
  bool AddFeature(vtkFeature* feature);
  bool RemoveFeature(vtkFeature* feature);
  void RemoveAllFeatures();

  bool HasFeature(vtkFeature* feature) const;
  std::size_t GetNumberOfFeatures() const;
  vtkFeature* GetFeature(std::size_t index) const;

  void Update() override;

protected:
  vtkFeatureLayer();
  ~vtkFeatureLayer() override;

  class vtkInternal;
  vtkInternal* Impl;

private:
  vtkFeatureLayer(const vtkFeatureLayer&) = delete;
  vtkFeatureLayer& operator=(const vtkFeatureLayer&) = delete;
};

#endif // __vtkFeatureLayer_h
