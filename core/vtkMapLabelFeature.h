/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkMapLabelFeature - text anchored at a map position
// .SECTION Description
// 2D text drawn at the display position of a lat-lon anchor, shifted by a
// pixel offset. Used for popups, hover previews and the spider overflow
// indicator. The display position follows the map on every update.
//

#ifndef __vtkMapLabelFeature_h
#define __vtkMapLabelFeature_h

#include "vtkFeature.h"
#include "vtkpointmapcore_export.h"

#include <vtkSmartPointer.h>

#include <string>

class vtkTextActor;
class vtkTextProperty;

class VTKPOINTMAPCORE_EXPORT vtkMapLabelFeature : public vtkFeature
{
public:
  static vtkMapLabelFeature* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkMapLabelFeature, vtkFeature);

  void SetText(const std::string& text);
  const std::string& GetText() const { return this->Text; }

  // Description:
  // Anchor position as [longitude, latitude]
  vtkSetVector2Macro(Anchor, double);
  vtkGetVector2Macro(Anchor, double);

  // Description:
  // Offset from the anchor in display pixels, y up
  vtkSetVector2Macro(DisplayOffset, double);
  vtkGetVector2Macro(DisplayOffset, double);

  vtkTextProperty* GetTextProperty();

  void Init() override;
  void Update() override;
  void CleanUp() override;

protected:
  vtkMapLabelFeature();
  ~vtkMapLabelFeature() override;

  std::string Text;
  double Anchor[2];
  double DisplayOffset[2];
  vtkSmartPointer<vtkTextActor> TextActor;

private:
  vtkMapLabelFeature(const vtkMapLabelFeature&) = delete;
  vtkMapLabelFeature& operator=(const vtkMapLabelFeature&) = delete;
};

#endif // __vtkMapLabelFeature_h
