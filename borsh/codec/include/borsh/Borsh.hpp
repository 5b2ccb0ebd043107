/*
 * Borsh
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of Borsh.
 *
 * Borsh is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * Borsh is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with Borsh.  If not, see <https://www.gnu.org/licenses/>.
 */

// borsh/codec/include/borsh/Borsh.hpp
#pragma once

/**
 * Borsh Public API
 *
 * Two front ends over one wire format:
 *  - typed: borsh::serialization::to_bytes / from_bytes for C++ types
 *    (integers, strings, std containers, std::variant, BORSH_FIELDS structs)
 *  - schema-driven: borsh::layout::Codec for schemas only known at runtime,
 *    with dynamic borsh::layout::Value trees
 */

#include "borsh/serialization/Fields.hpp"
#include "borsh/serialization/Serialization.hpp"
#include "borsh/layout/Layout.hpp"
#include "borsh/layout/Value.hpp"
#include "borsh/layout/Codec.hpp"
#include "borsh/layout/SizeProbe.hpp"
