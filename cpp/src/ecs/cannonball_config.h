#ifndef CANNONBALL_CONFIG_H
#define CANNONBALL_CONFIG_H

#include "cannonball_components.h"
#include <string>

namespace cannonball {

// Parses a game_config.json document over `out`.
// Sections: field, ball, cannons, projectiles, match, host.
// Missing sections/keys keep their current value.
// Syntax error or wrongly-typed value: logs, returns false, `out` untouched.
// Out-of-range value: warns and keeps the previous value for that knob only.
bool parse_game_config(const std::string &text, GameConfig &out);

} // namespace cannonball

#endif // CANNONBALL_CONFIG_H
