/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file tabula.h
 * @brief Tabula Library - Main Header with Declarations
 *
 * A C++20 header-only library for assembling, validating and serializing
 * tabular and key-value request data.
 *
 * This header includes all Tabula component declarations:
 * - Value, Record: dynamic cell values and their canonical encoding
 * - DeepCopier: boundary safe copies of value graphs
 * - Options: process wide conversion hook and defaults
 * - Table: typed in-memory table
 * - Wrapper: keyed container of strings and Tables
 */

#include <iostream>
#include <string>

// Core definitions first
#include "definitions.h"
#include "errors.h"

// Core component declarations
#include "value.h"
#include "options.h"
#include "deep_copy.h"
#include "canonical_reader.h"
#include "table.h"
#include "wrapper.h"

// Include implementations
#include "value.hpp"
#include "deep_copy.hpp"
#include "table.hpp"
#include "wrapper.hpp"
