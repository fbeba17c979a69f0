/*=========================================================================

  Program:   Visualization Toolkit

  Copyright (c) Ken Martin, Will Schroeder, Bill Lorensen
  All rights reserved.
  See Copyright.txt or http://www.kitware.com/Copyright.htm for details.

   This software is distributed WITHOUT ANY WARRANTY; without even
   the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
   PURPOSE.  See the above copyright notice for more information.

=========================================================================*/
#include <fstream>
#include <iostream>

#include <vtkCellData.h>
#include <vtkCommand.h>
#include <vtkGeoJSONReader.h>
#include <vtkIdList.h>
#include <vtkNew.h>
#include <vtkPolyData.h>
#include <vtkRenderWindow.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>
#include <vtkStringArray.h>
#include <vtkVariant.h>
#include <vtksys/CommandLineArguments.hxx>
#include <vtksys/SystemTools.hxx>

#include "vtkPointMap.h"
#include "vtkPointMapEngine.h"
#include "vtkPointMapSettings.h"

// ------------------------------------------------------------
class EngineCallback : public vtkCommand
{
public:
  static EngineCallback* New() { return new EngineCallback; }

  void Execute(vtkObject* vtkNotUsed(caller), unsigned long event, void* data) override
  {
    switch (event)
    {
      case vtkPointMapEngine::RenderPlanChangedEvent:
      {
        auto counts = static_cast<const vtkPointMapType::RenderPlanCounts*>(data);
        std::cout << counts->Locations << " locations, " << counts->Events
                  << " events: " << counts->Markers << " markers, "
                  << counts->Clustered << " clustered, " << counts->Dropped
                  << " dropped" << std::endl;
      }
      break;

      case vtkPointMapEngine::PointActivatedEvent:
      {
        auto point = static_cast<const vtkPointMapType::PointFeature*>(data);
        std::cout << "Activated " << point->Id << " \"" << point->Name << "\" at "
                  << point->Position[1] << ", " << point->Position[0] << std::endl;
      }
      break;

      case vtkPointMapEngine::ClusterActivatedEvent:
      {
        auto preview = static_cast<const vtkPointMapType::ClusterPreview*>(data);
        std::cout << "Cluster " << preview->ClusterId << ": "
                  << preview->MemberCount << " locations" << std::endl;
      }
      break;

      default:
        break;
    }
  }
};

// ------------------------------------------------------------
// Point features with optional id, name and category properties
bool ReadGeoJSON(const std::string& fileName,
  std::vector<vtkPointMapType::BulkLocation>& locations)
{
  vtkNew<vtkGeoJSONReader> reader;
  reader->SetFileName(fileName.c_str());
  reader->AddFeatureProperty("id", vtkVariant(""));
  reader->AddFeatureProperty("name", vtkVariant(""));
  reader->AddFeatureProperty("category", vtkVariant(""));
  reader->Update();

  vtkPolyData* polyData = reader->GetOutput();
  if (!polyData || polyData->GetNumberOfCells() == 0)
  {
    std::cerr << "No features read from " << fileName << std::endl;
    return false;
  }

  vtkCellData* cellData = polyData->GetCellData();
  auto ids = vtkStringArray::SafeDownCast(cellData->GetAbstractArray("id"));
  auto names = vtkStringArray::SafeDownCast(cellData->GetAbstractArray("name"));
  auto categories =
    vtkStringArray::SafeDownCast(cellData->GetAbstractArray("category"));

  vtkNew<vtkIdList> pointIds;
  for (vtkIdType i = 0; i < polyData->GetNumberOfCells(); ++i)
  {
    if (polyData->GetCellType(i) != VTK_VERTEX)
    {
      continue;
    }
    polyData->GetCellPoints(i, pointIds.GetPointer());
    if (pointIds->GetNumberOfIds() < 1)
    {
      continue;
    }

    double xyz[3];
    polyData->GetPoint(pointIds->GetId(0), xyz);

    vtkPointMapType::BulkLocation location;
    location.Id = ids ? ids->GetValue(i) : std::string();
    if (location.Id.empty())
    {
      location.Id = vtkVariant(i).ToString();
    }
    location.Name = names ? names->GetValue(i) : std::string();
    location.Category = categories ? categories->GetValue(i) : std::string();
    location.Coordinates.push_back(xyz[0]);
    location.Coordinates.push_back(xyz[1]);
    locations.push_back(location);
  }
  return true;
}

// ------------------------------------------------------------
// One "lat lon" pair per line
bool ReadLatLonFile(const std::string& fileName,
  std::vector<vtkPointMapType::BulkLocation>& locations)
{
  std::ifstream in(fileName.c_str());
  if (!in)
  {
    std::cerr << "Cannot open " << fileName << std::endl;
    return false;
  }

  double lat;
  double lon;
  while (in >> lat >> lon)
  {
    vtkPointMapType::BulkLocation location;
    location.Id = vtkVariant(static_cast<vtkIdType>(locations.size())).ToString();
    location.Coordinates.push_back(lon);
    location.Coordinates.push_back(lat);
    locations.push_back(location);
  }
  return true;
}

// ------------------------------------------------------------
void AddDemoData(std::vector<vtkPointMapType::FeaturedFactoid>& factoids,
  std::vector<vtkPointMapType::JourneyRoute>& routes)
{
  struct DemoFactoid
  {
    const char* Id;
    const char* Summary;
    double Lon;
    double Lat;
    vtkPointMapType::EvidenceLayer Layer;
    double Confidence;
    double RadiusKm;
  };
  const DemoFactoid demo[] = {
    { "gaugamela", "Battle of Gaugamela", 43.4, 36.4,
      vtkPointMapType::EvidenceLayer::Documented, 0.95, 5.0 },
    { "alexandria", "Founding of Alexandria", 29.9187, 31.2001,
      vtkPointMapType::EvidenceLayer::Documented, 0.9, 0.0 },
    { "goshen", "Settlement in Goshen", 31.5, 30.9,
      vtkPointMapType::EvidenceLayer::Attested, 0.4, 50.0 },
    { "rome", "Founding of Rome", 12.4964, 41.9028,
      vtkPointMapType::EvidenceLayer::Inferred, 0.6, 0.0 }
  };
  for (const auto& item : demo)
  {
    vtkPointMapType::FeaturedFactoid factoid;
    factoid.Id = item.Id;
    factoid.Summary = item.Summary;
    factoid.Layer = item.Layer;
    factoid.Confidence = item.Confidence;
    factoid.UncertaintyRadiusKm = item.RadiusKm;
    factoid.Coordinates.push_back(item.Lon);
    factoid.Coordinates.push_back(item.Lat);
    factoids.push_back(factoid);
  }

  vtkPointMapType::JourneyRoute campaign;
  campaign.Id = "alexander";
  campaign.Name = "Campaign of Alexander";
  campaign.RouteType = "campaign";
  campaign.Coordinates.push_back({ { 29.9187, 31.2001 } });
  campaign.Coordinates.push_back({ { 36.2, 33.5 } });
  campaign.Coordinates.push_back({ { 43.4, 36.4 } });
  routes.push_back(campaign);

  vtkPointMapType::JourneyRoute exodus;
  exodus.Id = "exodus";
  exodus.Name = "Exodus";
  exodus.RouteType = "migration";
  exodus.Coordinates.push_back({ { 31.5, 30.9 } });
  exodus.Coordinates.push_back({ { 33.97, 28.54 } });
  exodus.Coordinates.push_back({ { 35.44, 31.76 } });
  routes.push_back(exodus);
}

// ------------------------------------------------------------
int main(int argc, char* argv[])
{
  // Setup command line arguments
  std::string inputFile;
  bool showHelp = false;
  int zoomLevel = 5;
  double centerLat = 33.0;
  double centerLon = 30.0;
  bool hideUncertainty = false;

  vtkNew<vtkPointMapSettings> defaults;
  int clusterThreshold = defaults->GetClusterThresholdCount();
  int maxDomMarkers = defaults->GetMaxDomMarkers();
  int maxFeaturedMarkers = defaults->GetMaxFeaturedMarkers();
  int maxUnclustered = defaults->GetMaxUnclusteredPoints();
  int clusterRadius = defaults->GetClusterRadiusPixels();
  int maxClusterZoom = defaults->GetMaxClusterZoom();
  double jitterRadius = defaults->GetJitterBaseRadiusDegrees();
  double jitterCap = defaults->GetJitterCapFactor();
  int precision = defaults->GetCoordinatePrecision();
  int maxSpiderMarkers = defaults->GetMaxSpiderMarkers();
  int hoverLeafLimit = defaults->GetHoverLeafLimit();
  int hoverSampleNames = defaults->GetHoverSampleNames();
  int maxReadyRetries = defaults->GetMaxReadyRetries();
  int animationDuration = defaults->GetAnimationDuration();

  typedef vtksys::CommandLineArguments argT;
  argT arg;
  arg.Initialize(argc, argv);
  arg.StoreUnusedArguments(true);
  arg.AddArgument("-h", argT::NO_ARGUMENT, &showHelp, "show help message");
  arg.AddArgument("--help", argT::NO_ARGUMENT, &showHelp, "show help message");
  arg.AddArgument("-i", argT::SPACE_ARGUMENT, &inputFile,
    "input file, GeoJSON (.geojson/.json) or one \"lat lon\" pair per line");
  arg.AddArgument("-z", argT::SPACE_ARGUMENT, &zoomLevel, "initial zoom level (0-19)");
  arg.AddArgument("--lat", argT::SPACE_ARGUMENT, &centerLat, "initial center latitude");
  arg.AddArgument("--lon", argT::SPACE_ARGUMENT, &centerLon, "initial center longitude");
  arg.AddArgument("--cluster-threshold", argT::SPACE_ARGUMENT, &clusterThreshold,
    "bulk count above which bulk points are always clustered");
  arg.AddArgument("--max-markers", argT::SPACE_ARGUMENT, &maxDomMarkers,
    "maximum number of individual markers");
  arg.AddArgument("--max-featured", argT::SPACE_ARGUMENT, &maxFeaturedMarkers,
    "maximum number of featured markers");
  arg.AddArgument("--max-unclustered", argT::SPACE_ARGUMENT, &maxUnclustered,
    "clustered point count at or below which clustering is disabled");
  arg.AddArgument("--cluster-radius", argT::SPACE_ARGUMENT, &clusterRadius,
    "cluster radius in pixels");
  arg.AddArgument("--max-cluster-zoom", argT::SPACE_ARGUMENT, &maxClusterZoom,
    "highest zoom level at which points are clustered");
  arg.AddArgument("--jitter-radius", argT::SPACE_ARGUMENT, &jitterRadius,
    "base jitter radius in degrees");
  arg.AddArgument("--jitter-cap", argT::SPACE_ARGUMENT, &jitterCap,
    "cap of the jitter radius growth factor");
  arg.AddArgument("--precision", argT::SPACE_ARGUMENT, &precision,
    "decimals used to detect coincident coordinates");
  arg.AddArgument("--hide-uncertainty", argT::NO_ARGUMENT, &hideUncertainty,
    "do not draw uncertainty circles");
  arg.AddArgument("--max-spider", argT::SPACE_ARGUMENT, &maxSpiderMarkers,
    "maximum number of spider markers");
  arg.AddArgument("--hover-leaves", argT::SPACE_ARGUMENT, &hoverLeafLimit,
    "leaves fetched for a cluster hover preview");
  arg.AddArgument("--hover-names", argT::SPACE_ARGUMENT, &hoverSampleNames,
    "names shown in a cluster hover preview");
  arg.AddArgument("--ready-retries", argT::SPACE_ARGUMENT, &maxReadyRetries,
    "readiness checks before reporting the renderer as not ready");
  arg.AddArgument("--animation", argT::SPACE_ARGUMENT, &animationDuration,
    "zoom animation duration in milliseconds");

  if (!arg.Parse() || showHelp)
  {
    std::cout << "\n" << arg.GetHelp() << std::endl;
    return -1;
  }

  std::vector<vtkPointMapType::BulkLocation> locations;
  std::vector<vtkPointMapType::FeaturedFactoid> factoids;
  std::vector<vtkPointMapType::JourneyRoute> routes;
  if (inputFile.empty())
  {
    AddDemoData(factoids, routes);
  }
  else
  {
    const std::string ext =
      vtksys::SystemTools::LowerCase(vtksys::SystemTools::GetFilenameLastExtension(inputFile));
    const bool ok = (ext == ".geojson" || ext == ".json") ?
      ReadGeoJSON(inputFile, locations) :
      ReadLatLonFile(inputFile, locations);
    if (!ok)
    {
      return EXIT_FAILURE;
    }
    std::cout << "Read " << locations.size() << " locations from " << inputFile
              << std::endl;
  }

  vtkNew<vtkPointMap> map;
  vtkNew<vtkRenderer> rend;
  map->SetRenderer(rend.GetPointer());
  map->SetCenter(centerLat, centerLon);
  map->SetZoom(zoomLevel);

  vtkNew<vtkRenderWindow> wind;
  wind->AddRenderer(rend.GetPointer());
  wind->SetSize(1024, 768);
  wind->SetWindowName("pointmap");

  vtkNew<vtkRenderWindowInteractor> intr;
  intr->SetRenderWindow(wind.GetPointer());
  map->SetInteractor(intr.GetPointer());
  intr->Initialize();

  vtkNew<vtkPointMapEngine> engine;
  vtkPointMapSettings* settings = engine->GetSettings();
  settings->SetClusterThresholdCount(clusterThreshold);
  settings->SetMaxDomMarkers(maxDomMarkers);
  settings->SetMaxFeaturedMarkers(maxFeaturedMarkers);
  settings->SetMaxUnclusteredPoints(maxUnclustered);
  settings->SetClusterRadiusPixels(clusterRadius);
  settings->SetMaxClusterZoom(maxClusterZoom);
  settings->SetJitterBaseRadiusDegrees(jitterRadius);
  settings->SetJitterCapFactor(jitterCap);
  settings->SetCoordinatePrecision(precision);
  settings->SetShowUncertainty(!hideUncertainty);
  settings->SetMaxSpiderMarkers(maxSpiderMarkers);
  settings->SetHoverLeafLimit(hoverLeafLimit);
  settings->SetHoverSampleNames(hoverSampleNames);
  settings->SetMaxReadyRetries(maxReadyRetries);
  settings->SetAnimationDuration(animationDuration);

  vtkNew<EngineCallback> callback;
  engine->AddObserver(vtkPointMapEngine::RenderPlanChangedEvent, callback.GetPointer());
  engine->AddObserver(vtkPointMapEngine::PointActivatedEvent, callback.GetPointer());
  engine->AddObserver(vtkPointMapEngine::ClusterActivatedEvent, callback.GetPointer());

  engine->SetBulkLocations(locations);
  engine->SetFeaturedFactoids(factoids);
  engine->SetJourneyRoutes(routes);
  engine->Attach(map.GetPointer());
  engine->Update();
  map->Draw();

  intr->Start();

  engine->Detach();
  return EXIT_SUCCESS;
}
