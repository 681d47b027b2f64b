#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace site_mapper
{

// Monotonic counter bumped once per completed basemap swap. Every domain
// effect depends on it, so a bump re-runs all of them against the fresh style.
class style_revision_tracker_t
{
public:
  using token_t = uint64_t;
  using subscriber_t = std::function<void(uint64_t revision)>;

  // Start a swap. Any token handed out earlier becomes stale.
  auto begin_request() -> token_t;

  // Bumps the revision only when token is the latest outstanding request.
  // Returns true when the revision changed.
  auto complete(token_t token) -> bool;

  // Invalidate the outstanding request, if any
  auto cancel() -> void;

  auto has_pending() const -> bool
  {
    return m_pending != 0;
  }
  auto get_revision() const -> uint64_t
  {
    return m_revision;
  }

  auto subscribe(subscriber_t subscriber) -> size_t;
  auto unsubscribe(size_t handle) -> void;

private:
  uint64_t m_revision = 0;
  token_t m_next_token = 1;
  token_t m_pending = 0;

  std::vector<std::pair<size_t, subscriber_t>> m_subscribers;
  size_t m_next_handle = 1;
};

} // namespace site_mapper
