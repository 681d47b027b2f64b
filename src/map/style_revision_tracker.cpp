#include "map/style_revision_tracker.hpp"
#include <algorithm>
#include <iostream>

namespace site_mapper
{

auto style_revision_tracker_t::begin_request() -> token_t
{
  m_pending = m_next_token++;
  return m_pending;
}

auto style_revision_tracker_t::complete(token_t token) -> bool
{
  if (token == 0 || token != m_pending)
    return false;

  m_pending = 0;
  m_revision++;
  std::cout << "Style revision " << m_revision << std::endl;

  // Subscribers may unsubscribe while being notified
  auto subscribers = m_subscribers;
  for (const auto &[handle, subscriber] : subscribers)
  {
    if (subscriber)
      subscriber(m_revision);
  }
  return true;
}

auto style_revision_tracker_t::cancel() -> void
{
  m_pending = 0;
}

auto style_revision_tracker_t::subscribe(subscriber_t subscriber) -> size_t
{
  auto handle = m_next_handle++;
  m_subscribers.emplace_back(handle, std::move(subscriber));
  return handle;
}

auto style_revision_tracker_t::unsubscribe(size_t handle) -> void
{
  std::erase_if(m_subscribers, [handle](const auto &entry) { return entry.first == handle; });
}

} // namespace site_mapper
