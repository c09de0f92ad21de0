#pragma once

namespace lstree::platform {

// False when NO_COLOR is set or stdout is not a terminal.
bool stdout_supports_color();

} // namespace lstree::platform
