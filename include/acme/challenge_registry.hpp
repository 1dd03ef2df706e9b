#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace challtestsrv::acme {

// TLS-ALPN-01 key authorizations keyed by hostname.
//
// Lookups take a shared lock and run in parallel with each other; add and
// remove take the exclusive lock. A lookup racing a remove observes either
// state, never a partially written value.
class ChallengeRegistry {
public:
  ChallengeRegistry() = default;
  ChallengeRegistry(const ChallengeRegistry &) = delete;
  ChallengeRegistry &operator=(const ChallengeRegistry &) = delete;

  // Upsert: a later registration for the same host replaces the earlier one.
  void add(const std::string &host, std::string key_authorization) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    challenges_[host] = std::move(key_authorization);
  }

  void remove(const std::string &host) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    challenges_.erase(host);
  }

  // std::nullopt means no active challenge for host; not an error.
  std::optional<std::string> get(const std::string &host) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = challenges_.find(host);
    if (it == challenges_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::size_t size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return challenges_.size();
  }

  std::vector<std::string> hosts() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<std::string> out;
    out.reserve(challenges_.size());
    for (const auto &[host, _] : challenges_) {
      out.push_back(host);
    }
    return out;
  }

private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::string> challenges_;
};

} // namespace challtestsrv::acme
