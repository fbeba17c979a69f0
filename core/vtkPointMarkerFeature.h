/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
// .NAME vtkPointMarkerFeature - individually interactive point marker
// .SECTION Description
// Disc of constant screen size drawn for one point feature. The disc is
// anchored at a lat-lon position, by default the position of the point,
// and may be shifted by an offset in display pixels, which is how spider
// markers are placed around their cluster.
//
// Featured points get a larger disc with a gold outline. The fill color
// follows the evidence layer of the point unless set explicitly.
//

#ifndef __vtkPointMarkerFeature_h
#define __vtkPointMarkerFeature_h

#include "vtkPolydataFeature.h"
#include "vtkPointMap_typedef.h"
#include "vtkpointmapcore_export.h"

#include <vtkSmartPointer.h>

#include <string>

class VTKPOINTMAPCORE_EXPORT vtkPointMarkerFeature : public vtkPolydataFeature
{
public:
  static vtkPointMarkerFeature* New();
  void PrintSelf(ostream &os, vtkIndent indent) override;
  vtkTypeMacro(vtkPointMarkerFeature, vtkPolydataFeature);

  // Description:
  // Point represented by the marker. Resets anchor, size, outline and
  // fill color to the defaults for the kind of point.
  void SetPointFeature(const vtkPointMapType::JitteredFeature& feature);
  const vtkPointMapType::JitteredFeature& GetPointFeature() const
  {
    return this->PointFeature;
  }

  // Description:
  // Anchor position as [longitude, latitude]
  vtkSetVector2Macro(Anchor, double);
  vtkGetVector2Macro(Anchor, double);

  // Description:
  // Offset from the anchor in display pixels, y up
  vtkSetVector2Macro(DisplayOffset, double);
  vtkGetVector2Macro(DisplayOffset, double);

  // Description:
  // Marker diameter in pixels
  vtkSetClampMacro(MarkerSize, double, 1.0, 512.0);
  vtkGetMacro(MarkerSize, double);

  vtkSetMacro(Outline, bool);
  vtkGetMacro(Outline, bool);
  vtkBooleanMacro(Outline, bool);

  // Description:
  // Fill color as "#rrggbb"
  void SetFillColor(const std::string& hex);
  const std::string& GetFillColor() const { return this->FillColor; }

  void Init() override;
  void Update() override;
  void CleanUp() override;

  bool HitTest(const double displayCoords[2],
    vtkPointMapType::PickResult& result) override;

  // Description:
  // Display position of the marker center
  bool ComputeDisplayPosition(double display[2]);

protected:
  vtkPointMarkerFeature();
  ~vtkPointMarkerFeature() override;

  vtkPointMapType::JitteredFeature PointFeature;
  double Anchor[2];
  double DisplayOffset[2];
  double MarkerSize;
  bool Outline;
  std::string FillColor;

  vtkSmartPointer<vtkActor> OutlineActor;

private:
  vtkPointMarkerFeature(const vtkPointMarkerFeature&) = delete;
  vtkPointMarkerFeature& operator=(const vtkPointMarkerFeature&) = delete;
};

#endif // __vtkPointMarkerFeature_h
