/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for scheduler collaborators.
 * @author Dimitris Kafetzis
 *
 * The resource monitor is sampled on every admission check, so it is
 * injected as a template parameter constrained by a concept instead of
 * through a virtual interface.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>

namespace backup_scheduler {

// ─────────────────────────────────────────────
// ResourceMonitorLike
// ─────────────────────────────────────────────

/**
 * @concept ResourceMonitorLike
 * @brief Constrains types that can provide resource snapshots.
 */
template <typename T>
concept ResourceMonitorLike = requires(T monitor) {
    { monitor.read() } -> std::same_as<Result<ResourceSnapshot>>;
    { monitor.cpu_usage() } -> std::convertible_to<float>;
    { monitor.disk_free() } -> std::convertible_to<uint64_t>;
    { monitor.load_average() } -> std::convertible_to<double>;
    { monitor.start() } -> std::same_as<void>;
    { monitor.stop() } -> std::same_as<void>;
};

}  // namespace backup_scheduler
