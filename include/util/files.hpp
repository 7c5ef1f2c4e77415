// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>

namespace chainquery {
namespace util {

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: $HOME/.chainquery, or ./.chainquery when HOME is
 * unset
 */
std::filesystem::path get_default_datadir();

/**
 * Default Bitcoin Core block directory: $HOME/.bitcoin/blocks
 */
std::filesystem::path get_default_blocksdir();

} // namespace util
} // namespace chainquery
