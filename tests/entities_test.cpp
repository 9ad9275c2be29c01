#define BOOST_TEST_MODULE EntityTests
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>

#include <corona/common/errors.hpp>
#include <corona/game/scenery.hpp>
#include <corona/game/slime.hpp>

#include "test_helpers.hpp"

using namespace corona;

struct EntityFixture
{
  EntityFixture()
    : art(testing::artwork()),
      rng(1234)
  {
  }

  Settings settings;
  std::shared_ptr<Artwork> art;
  std::mt19937 rng;
};

BOOST_FIXTURE_TEST_SUITE(SlimeTests, EntityFixture)

BOOST_AUTO_TEST_CASE(SpawnsOffTheRightEdgeInTheGround)
{
  Slime slime(art->slime, settings, 2);
  BOOST_CHECK_CLOSE(slime.visual.rect.left(), 1280.0, 1e-9);
  BOOST_CHECK_CLOSE(slime.visual.rect.bottom(), 720.0 - 60.0 + 5.0, 1e-9);
  BOOST_CHECK_EQUAL(slime.visual.layer, settings.layers.enemy);
  BOOST_CHECK(slime.visual.image == art->slime->walk[0]);
  BOOST_CHECK(!slime.visual.mask.bits.empty());
}

BOOST_AUTO_TEST_CASE(WalksLeftAtItsSpeed)
{
  Slime slime(art->slime, settings, 3);
  BOOST_CHECK(slime.update(0));
  BOOST_CHECK_CLOSE(slime.visual.rect.left(), 1277.0, 1e-9);
  BOOST_CHECK(slime.update(0));
  BOOST_CHECK_CLOSE(slime.visual.rect.left(), 1274.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(WalkCycleRunsOnItsOwnTimer)
{
  Slime slime(art->slime, settings, 1);
  const auto bottom = slime.visual.rect.bottom();

  slime.animate(180);
  BOOST_CHECK_EQUAL(slime.current_frame, 0u);

  slime.animate(181);
  BOOST_CHECK_EQUAL(slime.current_frame, 1u);
  BOOST_CHECK(slime.visual.image == art->slime->walk[1]);
  BOOST_CHECK_CLOSE(slime.visual.rect.bottom(), bottom, 1e-9);

  slime.animate(362);
  BOOST_CHECK_EQUAL(slime.current_frame, 0u);
  BOOST_CHECK(slime.visual.image == art->slime->walk[0]);
}

BOOST_AUTO_TEST_CASE(LeavesOnlyOnceFullyOffScreen)
{
  Slime slime(art->slime, settings, 1);
  slime.visual.rect.set_right(1);

  BOOST_CHECK(slime.update(0));
  BOOST_CHECK_CLOSE(slime.visual.rect.right(), 0.0, 1e-9);
  BOOST_CHECK(!slime.off_screen());

  BOOST_CHECK(!slime.update(0));
  BOOST_CHECK(slime.off_screen());
}

BOOST_AUTO_TEST_CASE(SpeedsComeFromTheConfiguredRange)
{
  std::set<int32_t> speeds;
  for (int i = 0; i < 200; ++i) {
    speeds.insert(Slime::spawn(art->slime, settings, rng).speed);
  }
  BOOST_CHECK(speeds == std::set<int32_t>({1, 2, 3}));
}

BOOST_AUTO_TEST_CASE(NoWalkFramesThrows)
{
  auto frames = std::make_shared<SlimeFrames>();
  BOOST_CHECK_THROW(Slime s(frames, settings, 1), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CloudTests, EntityFixture)

BOOST_AUTO_TEST_CASE(SpawnsScaledToTheRightInTheUpperTwoThirds)
{
  for (int i = 0; i < 100; ++i) {
    auto cloud = Cloud::random(art->clouds, settings, rng);
    const auto& r = cloud.visual.rect;

    BOOST_CHECK_GE(cloud.scale, 0.5);
    BOOST_CHECK_LE(cloud.scale, 1.0);
    BOOST_CHECK_CLOSE(std::round(cloud.scale * 100), cloud.scale * 100, 1e-6);

    BOOST_CHECK_GE(r.left(), 1280.0);
    BOOST_CHECK_LT(r.left(), 1280.0 + r.w);
    BOOST_CHECK_GE(r.top(), 0.0);
    BOOST_CHECK_LT(r.top(), 480.0);

    BOOST_CHECK_EQUAL(r.w, cloud.visual.image->w);
    BOOST_CHECK_EQUAL(cloud.visual.layer, settings.layers.cloud);
  }
}

BOOST_AUTO_TEST_CASE(ScaleComesFromTheImage)
{
  std::vector<Image> one = {make_image(200, 100)};
  auto cloud = Cloud::random(one, settings, rng);
  BOOST_CHECK_EQUAL(cloud.visual.image->w, std::lround(200 * cloud.scale));
  BOOST_CHECK_EQUAL(cloud.visual.image->h, std::lround(100 * cloud.scale));
}

BOOST_AUTO_TEST_CASE(LivesUntilFullyOffScreen)
{
  auto cloud = Cloud::random(art->clouds, settings, rng);
  cloud.visual.rect.set_right(0);
  BOOST_CHECK(cloud.update());
  cloud.visual.rect.move(-0.5, 0);
  BOOST_CHECK(!cloud.update());
}

BOOST_AUTO_TEST_CASE(NoImagesThrows)
{
  BOOST_CHECK_THROW(Cloud::random({}, settings, rng), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TerrainTests, EntityFixture)

BOOST_AUTO_TEST_CASE(PlatformSitsWhereItIsPlaced)
{
  auto platform = Platform::random(art->platforms, 350, 540, 1, rng);
  BOOST_CHECK_CLOSE(platform.visual.rect.left(), 350.0, 1e-9);
  BOOST_CHECK_CLOSE(platform.visual.rect.top(), 540.0, 1e-9);
  BOOST_CHECK_EQUAL(platform.visual.layer, 1);
  BOOST_CHECK(std::find(art->platforms.begin(), art->platforms.end(), platform.visual.image) != art->platforms.end());
}

BOOST_AUTO_TEST_CASE(PlatformImagesAreAllUsed)
{
  std::set<SDL_Surface*> seen;
  for (int i = 0; i < 200; ++i) {
    seen.insert(Platform::random(art->platforms, 0, 0, 1, rng).visual.image.get());
  }
  BOOST_CHECK_EQUAL(seen.size(), art->platforms.size());
}

BOOST_AUTO_TEST_CASE(PlatformWithoutImagesThrows)
{
  BOOST_CHECK_THROW(Platform::random({}, 0, 0, 1, rng), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(BaseSitsOnTheBottom)
{
  Base base(art->base, 800, settings);
  BOOST_CHECK_CLOSE(base.visual.rect.left(), 800.0, 1e-9);
  BOOST_CHECK_CLOSE(base.visual.rect.top(), 660.0, 1e-9);
  BOOST_CHECK_CLOSE(base.visual.rect.w, 400.0, 1e-9);
  BOOST_CHECK_EQUAL(base.visual.layer, settings.layers.platform);
  BOOST_CHECK_THROW(Base(nullptr, 0, settings), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(GroupTests)

BOOST_AUTO_TEST_CASE(GroupsHaveReadableNames)
{
  BOOST_CHECK_EQUAL(std::string(group_name(Group::all)), "all");
  BOOST_CHECK_EQUAL(std::string(group_name(Group::platforms)), "platforms");
  BOOST_CHECK_EQUAL(std::string(group_name(Group::bases)), "bases");
  BOOST_CHECK_EQUAL(std::string(group_name(Group::enemies)), "enemies");
  BOOST_CHECK_EQUAL(std::string(group_name(Group::clouds)), "clouds");
}

BOOST_AUTO_TEST_SUITE_END()
