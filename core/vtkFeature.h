/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkFeature - base class for content drawn in a vtkFeatureLayer
// .SECTION Description
// A feature owns the props it adds to the renderer. The layer drives its
// lifecycle: Init() when added, Update() on every map update and CleanUp()
// when removed.
//

#ifndef __vtkFeature_h
#define __vtkFeature_h

#include <vtkObject.h>
#include <vtkWeakPointer.h>

#include "vtkFeatureLayer.h"
#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <string>

class VTKPOINTMAPCORE_EXPORT vtkFeature : public vtkObject
{
public:
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkFeature, vtkObject);

  // Description:
  // Shown only when both the feature and its layer are visible
  vtkGetMacro(Visibility, bool);
  vtkSetMacro(Visibility, bool);
  vtkBooleanMacro(Visibility, bool);
  bool IsVisible();

  // Description:
  // Registry key, assigned by vtkViewportLifecycleManager
  const std::string& GetKey() const { return this->Key; }
  void SetKey(const std::string& key) { this->Key = key; }

  // Description:
  // Owning layer. Not reference counted; reset by CleanUp().
  void SetLayer(vtkFeatureLayer* layer) { this->Layer = layer; }
  vtkFeatureLayer* GetLayer() { return this->Layer; }

  // Description:
  // Lifecycle hooks called by vtkFeatureLayer only
  virtual void Init() = 0;
  virtual void Update() = 0;
  virtual void CleanUp() = 0;

  // Description:
  // True when the feature covers the display position. Features made of
  // several items set result.ItemIndex to the item hit.
  virtual bool HitTest(
    const double displayCoords[2], vtkPointMapType::PickResult& result);

protected:
  vtkFeature();
  ~vtkFeature() override;

  // Map of the owning layer, or nullptr when detached
  vtkPointMap* GetMap();

  // Base z coordinate of the owning layer
  double GetLayerZCoord();

  bool Visibility;
  std::string Key;

  vtkTimeStamp BuildTime;
  vtkTimeStamp UpdateTime;

  vtkWeakPointer<vtkFeatureLayer> Layer;

private:
  vtkFeature(const vtkFeature&) = delete;
  vtkFeature& operator=(const vtkFeature&) = delete;
};

#endif // __vtkFeature_h
