#include "vterra/FbmHeightSource.hpp"
#include "vterra/HeightSynthesizer.hpp"
#include "vterra/TerrainError.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <limits>

using namespace vterra;
using Catch::Approx;

namespace
{
// height = slope * x
class RampHeightSource : public HeightSource
{
 public:
  explicit RampHeightSource(double slope)
    : slope(slope)
  {
  }

  double height(size_t, double x, double) const override { return slope * x; }

 private:
  double slope;
};

class NanHeightSource : public HeightSource
{
 public:
  double height(size_t, double, double) const override { return std::numeric_limits<double>::quiet_NaN(); }
};
}

TEST_CASE("Heights are taken from the height source", "[HeightSynthesizer]")
{
  std::vector<Point<2>> vertices = { { 0.0, 0.0 }, { 2.0, 0.0 }, { 2.0, 3.0 } };
  SynthesizedTerrain terrain = synthesize(vertices, { { 0, 1, 2 } }, RampHeightSource(0.5), 1);

  REQUIRE(terrain.positions.size() == 3);
  REQUIRE(terrain.positions[1].x() == Approx(2.0));
  REQUIRE(terrain.positions[1].y() == Approx(0.0));
  REQUIRE(terrain.positions[1].z() == Approx(1.0));
  REQUIRE(terrain.positions[2].z() == Approx(1.0));
}

TEST_CASE("Flat counter-clockwise cells face upwards", "[HeightSynthesizer]")
{
  std::vector<Point<2>> vertices = { { 0.0, 0.0 }, { 1.0, 0.0 }, { 1.0, 1.0 }, { 0.0, 1.0 } };
  SynthesizedTerrain terrain = synthesize(vertices, { { 0, 1, 2, 3 } }, RampHeightSource(0.0), 1);

  REQUIRE(terrain.region_normals[0].x() == Approx(0.0));
  REQUIRE(terrain.region_normals[0].y() == Approx(0.0));
  REQUIRE(terrain.region_normals[0].z() == Approx(1.0));

  REQUIRE(terrain.region_centers[0].x() == Approx(0.5));
  REQUIRE(terrain.region_centers[0].y() == Approx(0.5));
  REQUIRE(terrain.region_centers[0].z() == Approx(0.0));
}

TEST_CASE("Region normal follows the slope of its first three vertices", "[HeightSynthesizer]")
{
  std::vector<Point<2>> vertices = { { 0.0, 0.0 }, { 1.0, 0.0 }, { 0.0, 1.0 } };
  SynthesizedTerrain terrain = synthesize(vertices, { { 0, 1, 2 } }, RampHeightSource(1.0), 1);

  // plane z = x has normal (-1, 0, 1) / sqrt(2)
  const Eigen::Vector3d& normal = terrain.region_normals[0];
  REQUIRE(normal.norm() == Approx(1.0));
  REQUIRE(normal.x() == Approx(-1.0 / std::sqrt(2.0)));
  REQUIRE(normal.y() == Approx(0.0).margin(1e-12));
  REQUIRE(normal.z() == Approx(1.0 / std::sqrt(2.0)));
}

TEST_CASE("Vertex normals average the normals of their regions", "[HeightSynthesizer]")
{
  //  3 --- 2 --- 5
  //  |  A  |  B  |
  //  0 --- 1 --- 4
  std::vector<Point<2>> vertices
    = { { 0.0, 0.0 }, { 1.0, 0.0 }, { 1.0, 1.0 }, { 0.0, 1.0 }, { 2.0, 0.0 }, { 2.0, 1.0 } };
  std::vector<Cell> cells = { { 0, 1, 2, 3 }, { 1, 4, 5, 2 } };
  SynthesizedTerrain terrain = synthesize(vertices, cells, RampHeightSource(0.0), 1);

  for (const auto& normal : terrain.vertex_normals)
  {
    REQUIRE(normal.z() == Approx(1.0));
  }
}

TEST_CASE("Vertices outside of all cells keep a zero normal", "[HeightSynthesizer]")
{
  std::vector<Point<2>> vertices = { { 0.0, 0.0 }, { 1.0, 0.0 }, { 0.0, 1.0 }, { 5.0, 5.0 } };
  SynthesizedTerrain terrain = synthesize(vertices, { { 0, 1, 2 } }, RampHeightSource(0.0), 1);

  REQUIRE(terrain.vertex_normals[3].isZero());
}

TEST_CASE("Non finite heights are a dependency failure", "[HeightSynthesizer]")
{
  std::vector<Point<2>> vertices = { { 0.0, 0.0 }, { 1.0, 0.0 }, { 0.0, 1.0 } };

  REQUIRE_THROWS_AS(synthesize(vertices, { { 0, 1, 2 } }, NanHeightSource(), 1), DependencyFailureError);
}

TEST_CASE("Collinear leading vertices are a topology inconsistency", "[HeightSynthesizer]")
{
  std::vector<Point<2>> vertices = { { 0.0, 0.0 }, { 1.0, 0.0 }, { 2.0, 0.0 }, { 1.0, 1.0 } };

  REQUIRE_THROWS_AS(
    synthesize(vertices, { { 0, 1, 2, 3 } }, RampHeightSource(0.0), 1), TopologyInconsistencyError);
}

TEST_CASE("Fractal noise is deterministic and seeded", "[FbmHeightSource]")
{
  FbmHeightSource source;

  REQUIRE(source.height(42, 12.3, 45.6) == source.height(42, 12.3, 45.6));

  bool differs = false;
  for (int i = 0; i < 16 && !differs; ++i)
  {
    double x = 3.7 + 1.3 * i;
    double y = 5.1 + 0.7 * i;
    differs = source.height(1, x, y) != source.height(2, x, y);
  }
  REQUIRE(differs);
}

TEST_CASE("Seeds wider than 32 bits are folded", "[FbmHeightSource]")
{
  REQUIRE(FbmHeightSource::foldSeed(7) == 7);
  REQUIRE(FbmHeightSource::foldSeed((size_t(1) << 32) | 7) == 6);
}

TEST_CASE("Fractal noise needs an octave", "[FbmHeightSource]")
{
  FbmHeightSource::Settings settings;
  settings.octaves = 0;

  REQUIRE_THROWS_AS(FbmHeightSource(settings), InvalidInputError);
}
