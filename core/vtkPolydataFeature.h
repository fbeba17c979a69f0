/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPolydataFeature - base of features drawn by one polydata actor
// .SECTION Description
// Subclasses give the mapper its input in map plane coordinates
// (longitude, lat2y(latitude)) and then call Superclass::Init(), which
// places the actor at the base z coordinate of the layer and registers it
// with the renderer. The actor follows the feature visibility on every
// Update() and is unregistered by CleanUp().
//
// The actor is flat shaded and does not take part in VTK picking; hit
// testing goes through HitTest().
//

#ifndef __vtkPolydataFeature_h
#define __vtkPolydataFeature_h

#include <vtkActor.h>
#include <vtkPolyDataMapper.h>

#include "vtkFeature.h"
#include "vtkpointmapcore_export.h"

#include <string>

class VTKPOINTMAPCORE_EXPORT vtkPolydataFeature : public vtkFeature
{
public:
  static vtkPolydataFeature* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkPolydataFeature, vtkFeature);

  vtkGetObjectMacro(Actor, vtkActor);
  vtkGetObjectMacro(Mapper, vtkPolyDataMapper);

  // Description:
  // Actor color as "#rrggbb", and opacity
  void SetColor(const std::string& hex);
  void SetOpacity(double opacity);

  void Init() override;
  void Update() override;
  void CleanUp() override;

protected:
  vtkPolydataFeature();
  ~vtkPolydataFeature() override;

  vtkActor* Actor;
  vtkPolyDataMapper* Mapper;

private:
  vtkPolydataFeature(const vtkPolydataFeature&) = delete;
  vtkPolydataFeature& operator=(const vtkPolydataFeature&) = delete;
};

#endif // __vtkPolydataFeature_h
