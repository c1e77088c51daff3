#include "engine/Input.hpp"

#include <raylib.h>

namespace delve {

bool Input::isKeyPressed(Key key) const {
    return IsKeyPressed(static_cast<int>(key));
}

bool Input::isKeyDown(Key key) const {
    return IsKeyDown(static_cast<int>(key));
}

bool Input::isKeyRepeated(Key key) const {
    return IsKeyPressedRepeat(static_cast<int>(key));
}

} // namespace delve
