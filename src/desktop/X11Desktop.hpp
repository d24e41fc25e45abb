#pragma once

#include <memory>
#include <string>

#include "desktop/IDesktop.hpp"

namespace winshot {

// Opens a connection to $DISPLAY. Returns nullptr (and fills `err`) when no
// X server is reachable.
std::unique_ptr<IDesktop> CreateX11Desktop(std::string* err);

}  // namespace winshot
