// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Gbium.
//
// Gbium is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Gbium is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Gbium.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef GBIUM_MACHINES_HPP
#define GBIUM_MACHINES_HPP

#include "Machine.hpp"
#include "DmgHardware.hpp"

namespace gbium {

// Convenience type aliases for machine configurations.

// Monochrome Game Boy (DMG-01)
using Dmg = Machine<DmgHardware>;

} // namespace gbium

#endif // GBIUM_MACHINES_HPP
