#include "common.hpp"
#include "util.hpp"

#include <iostream>

using pyramid::util::pixels_to_meters;
using pyramid::util::meters_to_lnglat;
using pyramid::util::projected_point;
using pyramid::util::lnglat;

namespace {

const double HALF_WORLD = 20037508.342789244;
// latitude of the top edge of the zoom 0 tile.
const double MAX_LAT = 85.0511287798066;

void test_pixels_origin() {
  projected_point p = pixels_to_meters(0, 0, 0);
  test::assert_near(p.x, -HALF_WORLD, 1.0e-6, "x");
  test::assert_near(p.y, HALF_WORLD, 1.0e-6, "y");
}

void test_pixels_far_corner() {
  projected_point p = pixels_to_meters(0, 256, 256);
  test::assert_near(p.x, HALF_WORLD, 1.0e-6, "x");
  test::assert_near(p.y, -HALF_WORLD, 1.0e-6, "y");
}

// the centre of the world is exactly zero, at any zoom.
void test_pixels_centre() {
  for (int z = 1; z <= 20; ++z) {
    const double centre = 128.0 * (1 << z);
    projected_point p = pixels_to_meters(z, centre, centre);
    test::assert_equal<double>(p.x, 0.0, (boost::format("z%1% x") % z).str());
    test::assert_equal<double>(p.y, 0.0, (boost::format("z%1% y") % z).str());
  }
}

// each zoom level doubles the number of pixels.
void test_pixels_resolution() {
  for (int z = 0; z < 10; ++z) {
    projected_point a = pixels_to_meters(z, 1, 1);
    projected_point b = pixels_to_meters(z + 1, 2, 2);
    test::assert_near(a.x, b.x, 1.0e-6, "x");
    test::assert_near(a.y, b.y, 1.0e-6, "y");
  }
}

void test_lnglat_origin() {
  lnglat ll = meters_to_lnglat(projected_point(0, 0));
  test::assert_equal<double>(ll.lng, 0.0, "lng");
  test::assert_equal<double>(ll.lat, 0.0, "lat");
}

void test_lnglat_corners() {
  lnglat max = meters_to_lnglat(projected_point(HALF_WORLD, HALF_WORLD));
  test::assert_near(max.lng, 180.0, 1.0e-9, "max lng");
  test::assert_near(max.lat, MAX_LAT, 1.0e-9, "max lat");

  lnglat min = meters_to_lnglat(projected_point(-HALF_WORLD, -HALF_WORLD));
  test::assert_near(min.lng, -180.0, 1.0e-9, "min lng");
  test::assert_near(min.lat, -MAX_LAT, 1.0e-9, "min lat");
}

// longitude is linear in x, latitude is not linear in y.
void test_lnglat_quarter() {
  lnglat ll = meters_to_lnglat(projected_point(0.5 * HALF_WORLD, 0.5 * HALF_WORLD));
  test::assert_near(ll.lng, 90.0, 1.0e-9, "lng");
  test::assert_near(ll.lat, 66.51326044311186, 1.0e-9, "lat");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing projection ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }

  RUN_TEST(test_pixels_origin);
  RUN_TEST(test_pixels_far_corner);
  RUN_TEST(test_pixels_centre);
  RUN_TEST(test_pixels_resolution);
  RUN_TEST(test_lnglat_origin);
  RUN_TEST(test_lnglat_corners);
  RUN_TEST(test_lnglat_quarter);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
