// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <strata/core/config.hpp>
#include <strata/core/result.hpp>

#include <nlohmann/json.hpp>

STRATA_NAMESPACE_BEGIN

class InMemoryStateReader;

/**
 * Loads deployed contracts from a document of the form
 *
 *   {
 *     "0x100": {
 *       "class_hash": "0x110",
 *       "nonce": "0x1",
 *       "storage": {"0x5": "0x2"}
 *     }
 *   }
 *
 * where "nonce" and "storage" may be omitted. Malformed documents fail with
 * ConfigError::InvalidConfig and leave the reader untouched.
 */
Result<void> load_state(nlohmann::json const &, InMemoryStateReader &);

STRATA_NAMESPACE_END
