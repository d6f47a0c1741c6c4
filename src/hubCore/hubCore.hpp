#pragma once

/**
 * @file hubCore.hpp
 * @brief Main header for hubCore - event envelopes for the hub
 *
 * Header-only, no RTTI, no exceptions, no dynamic allocation.
 * Depends only on ETL (Embedded Template Library).
 *
 * @version 1.0.0
 * @date 2026
 */

#include "hubCore/core/types.hpp"
#include "hubCore/core/config.hpp"
#include "hubCore/error/result.hpp"
#include "hubCore/error/error_handler.hpp"
#include "hubCore/platform/platform.hpp"
#include "hubCore/hub/hub_types.hpp"
#include "hubCore/hub/event_id.hpp"
#include "hubCore/hub/hub_publisher.hpp"
#include "hubCore/hub/hub_event.hpp"
#include "hubCore/hub/hub_data.hpp"

/**
 * @namespace hubCore
 * @brief Main namespace for the hub event library
 */
namespace hubCore {

    /**
     * @brief Get library version
     */
    constexpr const char* version() noexcept {
        return "1.0.0";
    }

} // namespace hubCore
