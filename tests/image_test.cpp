#define BOOST_TEST_MODULE ImageTests
#include <boost/test/unit_test.hpp>

#include <corona/common/errors.hpp>
#include <corona/renderer/image.hpp>

using namespace corona;

namespace
{
void fill(const Image& image, int x, int y, int w, int h, SDL_Color c)
{
  SDL_Rect r = {x, y, w, h};
  SDL_FillRect(image.get(), &r, SDL_MapRGBA(image->format, c.r, c.g, c.b, c.a));
}

const SDL_Color black = {0, 0, 0, 255};
const SDL_Color red = {255, 0, 0, 255};
}

BOOST_AUTO_TEST_SUITE(ImageTransformTests)

BOOST_AUTO_TEST_CASE(MakeImageIsSolidAndOpaque)
{
  auto image = make_image(8, 4, red);
  BOOST_REQUIRE(image);
  BOOST_CHECK_EQUAL(image->w, 8);
  BOOST_CHECK_EQUAL(image->h, 4);
  const auto c = pixel_at(image, 7, 3);
  BOOST_CHECK_EQUAL(c.r, 255);
  BOOST_CHECK_EQUAL(c.g, 0);
  BOOST_CHECK_EQUAL(c.a, 255);
}

BOOST_AUTO_TEST_CASE(ScaleRoundsTheSize)
{
  auto image = make_image(51, 26);
  auto scaled = scale_image(image, 1.5);
  BOOST_CHECK_EQUAL(scaled->w, 77);
  BOOST_CHECK_EQUAL(scaled->h, 39);

  auto halved = scale_image(make_image(380, 94), 0.5);
  BOOST_CHECK_EQUAL(halved->w, 190);
  BOOST_CHECK_EQUAL(halved->h, 47);
}

BOOST_AUTO_TEST_CASE(ScaleRejectsNonPositiveFactors)
{
  auto image = make_image(4, 4);
  BOOST_CHECK_THROW(scale_image(image, 0), ConfigurationError);
  BOOST_CHECK_THROW(scale_image(image, -1), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(FlipMirrorsColumns)
{
  auto image = make_image(4, 2);
  fill(image, 0, 0, 1, 2, red);
  auto flipped = flip_horizontal(image);
  BOOST_CHECK_EQUAL(pixel_at(flipped, 3, 0).g, 0);
  BOOST_CHECK_EQUAL(pixel_at(flipped, 0, 0).g, 255);
  BOOST_CHECK_EQUAL(pixel_at(image, 0, 0).g, 0);
}

BOOST_AUTO_TEST_CASE(CropCopiesTheRegion)
{
  auto image = make_image(10, 10);
  fill(image, 5, 5, 5, 5, red);
  auto cropped = crop_image(image, {4, 4, 4, 4});
  BOOST_CHECK_EQUAL(cropped->w, 4);
  BOOST_CHECK_EQUAL(pixel_at(cropped, 0, 0).g, 255);
  BOOST_CHECK_EQUAL(pixel_at(cropped, 1, 1).g, 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(MaskTests)

BOOST_AUTO_TEST_CASE(BlackIsTransparent)
{
  auto image = make_image(4, 4);
  fill(image, 0, 0, 2, 4, black);
  auto mask = Mask::from_image(image);
  BOOST_CHECK_EQUAL(mask.w, 4);
  BOOST_CHECK_EQUAL(mask.count(), 8u);
  BOOST_CHECK(!mask.get(0, 0));
  BOOST_CHECK(mask.get(3, 3));
}

BOOST_AUTO_TEST_CASE(ZeroAlphaIsTransparent)
{
  auto image = make_image(3, 3, {255, 255, 255, 0});
  BOOST_CHECK_EQUAL(Mask::from_image(image).count(), 0u);
}

BOOST_AUTO_TEST_CASE(MissingImageGivesEmptyMask)
{
  auto mask = Mask::from_image(nullptr);
  BOOST_CHECK(mask.bits.empty());
  BOOST_CHECK(!mask.get(0, 0));
}

BOOST_AUTO_TEST_CASE(OverlapRespectsOffsets)
{
  Mask a(4, 4);
  Mask b(4, 4);
  a.set(3, 3, true);
  b.set(0, 0, true);

  BOOST_CHECK(a.overlaps(b, 3, 3));
  BOOST_CHECK(!a.overlaps(b, 4, 3));
  BOOST_CHECK(!a.overlaps(b, 0, 0));
  BOOST_CHECK(b.overlaps(a, -3, -3));
}

BOOST_AUTO_TEST_CASE(BoxesThatTouchWithoutOpaquePixelsDoNotOverlap)
{
  // Two images whose bounding boxes overlap only where one is transparent
  auto left = make_image(10, 10);
  fill(left, 5, 0, 5, 10, black);
  auto right = make_image(10, 10);

  const auto a = Mask::from_image(left);
  const auto b = Mask::from_image(right);
  BOOST_CHECK(!a.overlaps(b, 5, 0));
  BOOST_CHECK(a.overlaps(b, 4, 0));
}

BOOST_AUTO_TEST_SUITE_END()
