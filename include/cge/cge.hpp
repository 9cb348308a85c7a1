#pragma once

/// @file cge.hpp
/// @brief Convenience header pulling in the whole public engine API.

#include "cge/version.hpp"

#include "cge/core/result.hpp"
#include "cge/foundation/config_manager.hpp"
#include "cge/foundation/error_code.hpp"
#include "cge/foundation/game_error.hpp"
#include "cge/foundation/game_logger.hpp"
#include "cge/foundation/game_result.hpp"
#include "cge/foundation/signal.hpp"
#include "cge/foundation/types.hpp"

#include "cge/game/action_system.hpp"
#include "cge/game/action_types.hpp"
#include "cge/game/character.hpp"
#include "cge/game/character_components.hpp"
#include "cge/game/difficulty.hpp"
#include "cge/game/event_log.hpp"
#include "cge/game/progression_types.hpp"
#include "cge/game/rule_engine.hpp"

#include "cge/service/achievement_tracker.hpp"
#include "cge/service/session_manager.hpp"
#include "cge/service/session_types.hpp"
