#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include <corona/common/errors.hpp>
#include <corona/common/logging.hpp>
#include <corona/game/session.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);

template <class T, class Y>
void erase(T& container, const Y& v)
{
  auto it = std::remove(container.begin(), container.end(), v);
  container.erase(it, container.end());
};
}

namespace corona
{
Visual& visual_of(Entity& entity)
{
  return std::visit([](auto& e) -> Visual& { return e.visual; }, entity);
}

const Visual& visual_of(const Entity& entity)
{
  return std::visit([](const auto& e) -> const Visual& { return e.visual; }, entity);
}

Session::Session(std::shared_ptr<const Artwork> artwork_, const Settings& settings_, uint32_t seed)
  : settings(settings_),
    artwork(std::move(artwork_)),
    rng(seed),
    scrolled(0)
{
  if (!artwork) {
    throw ConfigurationError("A session needs artwork");
  }
}

void Session::start()
{
  player_handle = this->spawn_player();

  const auto base_width = artwork->base ? artwork->base->w : 0;
  if (base_width <= 0) {
    throw ConfigurationError("The base image has no width");
  }

  size_t bases = 0;
  for (double x = 0; x < settings.terrain.level_width; x += base_width) {
    this->spawn_base(x);
    ++bases;
  }

  for (const auto& placement : settings.terrain.platforms) {
    this->spawn_platform(placement.x, placement.y);
  }

  for (int32_t i = 0; i < settings.cloud.initial_count; ++i) {
    this->spawn_cloud();
  }

  logger->info("Started a session with {} bases, {} platforms and {} clouds", bases,
               settings.terrain.platforms.size(), settings.cloud.initial_count);
}

EntityHandle Session::spawn(Entity entity, std::initializer_list<Group> groups)
{
  uint32_t index;
  if (!free_slots.empty()) {
    index = free_slots.back();
    free_slots.pop_back();
  } else {
    index = static_cast<uint32_t>(slots.size());
    slots.emplace_back();
  }

  auto& slot = slots[index];
  slot.entity = std::move(entity);
  slot.groups.clear();
  slot.groups.push_back(Group::all);
  for (const auto group : groups) {
    if (group != Group::all) {
      slot.groups.push_back(group);
    }
  }

  const EntityHandle handle{index, slot.generation};
  for (const auto group : slot.groups) {
    collections[static_cast<size_t>(group)].push_back(handle);
  }
  return handle;
}

EntityHandle Session::spawn_player()
{
  return this->spawn(Player(artwork->player, settings));
}

EntityHandle Session::spawn_slime()
{
  auto handle = this->spawn(Slime::spawn(artwork->slime, settings, rng), {Group::enemies});
  logger->debug("Spawned slime {} moving at {}", handle.index, get_as<Slime>(handle)->speed);
  return handle;
}

EntityHandle Session::spawn_cloud()
{
  return this->spawn(Cloud::random(artwork->clouds, settings, rng), {Group::clouds});
}

EntityHandle Session::spawn_platform(double x, double y)
{
  return this->spawn(Platform::random(artwork->platforms, x, y, settings.layers.platform, rng), {Group::platforms});
}

EntityHandle Session::spawn_base(double x)
{
  return this->spawn(Base(artwork->base, x, settings), {Group::bases});
}

bool Session::kill(EntityHandle handle)
{
  if (!this->alive(handle)) {
    return false;
  }

  auto& slot = slots[handle.index];
  for (const auto group : slot.groups) {
    erase(collections[static_cast<size_t>(group)], handle);
  }

  slot.groups.clear();
  slot.entity.reset();
  ++slot.generation;
  free_slots.push_back(handle.index);
  return true;
}

bool Session::alive(EntityHandle handle) const
{
  return handle.index < slots.size() &&
      slots[handle.index].generation == handle.generation &&
      slots[handle.index].entity.has_value();
}

Entity* Session::get(EntityHandle handle)
{
  if (!this->alive(handle)) {
    return nullptr;
  }
  return &*slots[handle.index].entity;
}

const Entity* Session::get(EntityHandle handle) const
{
  if (!this->alive(handle)) {
    return nullptr;
  }
  return &*slots[handle.index].entity;
}

Player* Session::player()
{
  return get_as<Player>(player_handle);
}

const Player* Session::player() const
{
  return get_as<Player>(player_handle);
}

const std::vector<EntityHandle>& Session::members(Group group) const
{
  return collections[static_cast<size_t>(group)];
}

size_t Session::size() const
{
  return this->members(Group::all).size();
}

bool Session::probe(const Rect& rect, Group group) const
{
  for (const auto& handle : this->members(group)) {
    if (visual_of(*this->get(handle)).rect.intersects(rect)) {
      return true;
    }
  }
  return false;
}

std::vector<Rect> Session::overlapping(const Rect& rect, Group group) const
{
  std::vector<Rect> found;
  for (const auto& handle : this->members(group)) {
    const auto& other = visual_of(*this->get(handle)).rect;
    if (other.intersects(rect)) {
      found.push_back(other);
    }
  }
  return found;
}

std::vector<EntityHandle> Session::hits(const Rect& rect, Group group) const
{
  std::vector<EntityHandle> found;
  for (const auto& handle : this->members(group)) {
    if (visual_of(*this->get(handle)).rect.intersects(rect)) {
      found.push_back(handle);
    }
  }
  return found;
}

std::vector<EntityHandle> Session::collide_precise(EntityHandle handle, Group group) const
{
  std::vector<EntityHandle> found;
  const auto entity = this->get(handle);
  if (!entity) {
    return found;
  }

  const auto& self = visual_of(*entity);
  for (const auto& other_handle : this->hits(self.rect, group)) {
    if (other_handle == handle) {
      continue;
    }

    const auto& other = visual_of(*this->get(other_handle));
    if (self.mask.bits.empty() || other.mask.bits.empty()) {
      found.push_back(other_handle);
      continue;
    }

    const auto dx = static_cast<int32_t>(std::lround(other.rect.x - self.rect.x));
    const auto dy = static_cast<int32_t>(std::lround(other.rect.y - self.rect.y));
    if (self.mask.overlaps(other.mask, dx, dy)) {
      found.push_back(other_handle);
    }
  }
  return found;
}

void Session::update(const InputState& input, int64_t now_ms)
{
  if (auto player = this->player()) {
    player->update(input, now_ms);

    if (input.jump_pressed && player->jump(*this)) {
      if (on_sound) {
        on_sound("jump");
      }
    }

    if (input.jump_released) {
      player->jump_cut();
    }

    const auto was_jumping = player->is_jumping;
    if (player->land(*this) && was_jumping) {
      logger->debug("Landed at {}, {}", player->pos.x, player->pos.y);
    }
  }

  // Copies, updating may kill members
  const auto enemies = this->members(Group::enemies);
  for (const auto& handle : enemies) {
    auto slime = get_as<Slime>(handle);
    if (slime && !slime->update(now_ms)) {
      logger->debug("Slime {} left the screen, dropping it from {}", handle.index, group_name(Group::enemies));
      this->kill(handle);
    }
  }

  const auto clouds = this->members(Group::clouds);
  for (const auto& handle : clouds) {
    auto cloud = get_as<Cloud>(handle);
    if (cloud && !cloud->update()) {
      logger->debug("Cloud {} left the screen, dropping it from {}", handle.index, group_name(Group::clouds));
      this->kill(handle);
    }
  }

  const auto player = this->player();
  const auto threshold = settings.world.scroll_threshold * settings.screen.width;
  if (player && settings.world.scroll_threshold > 0 && player->visual.rect.right() >= threshold) {
    this->scroll(std::max(std::fabs(player->vel.x), settings.world.min_scroll));
  }
}

void Session::scroll(double dx)
{
  if (auto player = this->player()) {
    player->place({player->pos.x - dx, player->pos.y});
  }

  for (const auto group : {Group::platforms, Group::bases, Group::enemies}) {
    for (const auto& handle : this->members(group)) {
      visual_of(*this->get(handle)).rect.move(-dx, 0);
    }
  }

  for (const auto& handle : this->members(Group::clouds)) {
    visual_of(*this->get(handle)).rect.move(-dx * settings.cloud.parallax, 0);
  }

  scrolled += dx;
}

std::vector<const Visual*> Session::render_list() const
{
  std::vector<const Visual*> visuals;
  for (const auto& handle : this->members(Group::all)) {
    visuals.push_back(&visual_of(*this->get(handle)));
  }

  std::stable_sort(visuals.begin(), visuals.end(), [](const Visual* a, const Visual* b)
  {
    return a->layer < b->layer;
  });
  return visuals;
}
} // namespace corona
