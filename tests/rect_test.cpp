#define BOOST_TEST_MODULE RectTests
#include <boost/test/unit_test.hpp>

#include <corona/common/rect.hpp>

using namespace corona;

BOOST_AUTO_TEST_SUITE(RectEdgeTests)

BOOST_AUTO_TEST_CASE(EdgesFollowPositionAndSize)
{
  Rect r(10, 20, 30, 40);
  BOOST_CHECK_EQUAL(r.left(), 10);
  BOOST_CHECK_EQUAL(r.right(), 40);
  BOOST_CHECK_EQUAL(r.top(), 20);
  BOOST_CHECK_EQUAL(r.bottom(), 60);
  BOOST_CHECK_EQUAL(r.centerx(), 25);
  BOOST_CHECK_EQUAL(r.centery(), 40);
}

BOOST_AUTO_TEST_CASE(SettersKeepTheSize)
{
  Rect r(0, 0, 30, 40);
  r.set_right(100);
  BOOST_CHECK_EQUAL(r.left(), 70);
  BOOST_CHECK_EQUAL(r.w, 30);

  r.set_bottom(200);
  BOOST_CHECK_EQUAL(r.top(), 160);
  BOOST_CHECK_EQUAL(r.h, 40);

  r.set_midbottom({50.5, 300.25});
  BOOST_CHECK_CLOSE(r.centerx(), 50.5, 1e-9);
  BOOST_CHECK_CLOSE(r.bottom(), 300.25, 1e-9);
  BOOST_CHECK(r.midbottom() == Point({50.5, 300.25}));
}

BOOST_AUTO_TEST_CASE(MoveShiftsBothAxes)
{
  Rect r(1, 2, 3, 4);
  r.move(-5, 2.5);
  BOOST_CHECK(r == Rect(-4, 4.5, 3, 4));
}

BOOST_AUTO_TEST_CASE(PointArithmetic)
{
  Point a{1, 2};
  Point b{0.5, -1};
  BOOST_CHECK(a + b == Point({1.5, 1}));
  BOOST_CHECK(a - b == Point({0.5, 3}));
  BOOST_CHECK(b - a == Point({-0.5, -3}));
  BOOST_CHECK(a * 0.5 == Point({0.5, 1}));
  a += b;
  BOOST_CHECK(a == Point({1.5, 1}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RectIntersectionTests)

BOOST_AUTO_TEST_CASE(OverlappingRectsIntersect)
{
  Rect a(0, 0, 10, 10);
  Rect b(9.5, 9.5, 10, 10);
  BOOST_CHECK(a.intersects(b));
  BOOST_CHECK(b.intersects(a));
}

BOOST_AUTO_TEST_CASE(TouchingEdgesDoNotIntersect)
{
  Rect a(0, 0, 10, 10);
  BOOST_CHECK(!a.intersects(Rect(10, 0, 10, 10)));
  BOOST_CHECK(!a.intersects(Rect(0, 10, 10, 10)));
  BOOST_CHECK(!a.intersects(Rect(-10, -10, 10, 10)));
}

BOOST_AUTO_TEST_CASE(ContainedRectIntersects)
{
  Rect outer(0, 0, 100, 100);
  Rect inner(40, 40, 2, 2);
  BOOST_CHECK(outer.intersects(inner));
  BOOST_CHECK(inner.intersects(outer));
}

BOOST_AUTO_TEST_CASE(EmptyRectsNeverIntersect)
{
  Rect a(0, 0, 10, 10);
  Rect flat(2, 2, 5, 0);
  BOOST_CHECK(rect_empty(flat));
  BOOST_CHECK(!rect_empty(a));
  BOOST_CHECK(!a.intersects(flat));
  BOOST_CHECK(!flat.intersects(a));
}

BOOST_AUTO_TEST_SUITE_END()
