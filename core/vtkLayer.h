/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkLayer - ordered group of map content
// .SECTION Description
//
// A vtkLayer owns no geometry itself; it registers the props of its
// content with the renderer of the vtkPointMap it belongs to. Layers are
// stacked in the order they were added to the map: vtkPointMap assigns
// every layer a base z coordinate (GetZCoord) which content uses to place
// its actors, so later layers draw on top.
//
// Layers whose content is computed outside Update() report themselves as
// asynchronous and are polled through ResolveAsync() by the map.
//

#ifndef __vtkLayer_h
#define __vtkLayer_h

#include "vtkPointMap.h"
#include "vtkpointmapcore_export.h"

#include <vtkObject.h>
#include <vtkRenderer.h>

#include <string>

class vtkProp;

class VTKPOINTMAPCORE_EXPORT vtkLayer : public vtkObject
{
public:
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkLayer, vtkObject)

  // Description:
  // Name used to look the layer up with vtkPointMap::FindLayer()
  const std::string& GetName() const { return this->Name; }
  void SetName(const std::string& name);

  // Description:
  // Hidden layers keep their content but do not show it
  vtkBooleanMacro(Visibility, bool)
  vtkGetMacro(Visibility, bool)
  vtkSetMacro(Visibility, bool)

  // Description:
  // Base z coordinate of the layer content
  vtkGetMacro(ZCoord, double)
  vtkSetMacro(ZCoord, double)

  // Description:
  // Map the layer was added to, and that map's renderer
  vtkGetObjectMacro(Map, vtkPointMap)
  virtual void SetMap(vtkPointMap* map);
  vtkGetMacro(Renderer, vtkRenderer*)

  // Description:
  // Asynchronous layers are polled by the map with ResolveAsync()
  virtual bool IsAsynchronous() { return false; }
  virtual vtkPointMap::AsyncState ResolveAsync();

  virtual void Update() = 0;

  // Description:
  // Register / unregister content props with the map renderer. Returns
  // false when the layer is not on a map.
  bool AddActor(vtkProp* prop);
  bool AddActor2D(vtkProp* prop);
  bool RemoveActor(vtkProp* prop);

protected:
  vtkLayer();
  ~vtkLayer() override;

  bool CanRegister(vtkProp* prop, const char* action);

  std::string Name;
  bool Visibility;
  double ZCoord;

  vtkPointMap* Map;
  vtkRenderer* Renderer;

private:
  vtkLayer(const vtkLayer&) = delete;
  vtkLayer& operator=(const vtkLayer&) = delete;
};

#endif // __vtkLayer_h
