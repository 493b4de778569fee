/*
 *
 *    Copyright (c) 2021 Project CHIP Authors
 *
 *    Licensed under the Apache License, Version 2.0 (the "License");
 *    you may not use this file except in compliance with the License.
 *    You may obtain a copy of the License at
 *
 *        http://www.apache.org/licenses/LICENSE-2.0
 *
 *    Unless required by applicable law or agreed to in writing, software
 *    distributed under the License is distributed on an "AS IS" BASIS,
 *    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *    See the License for the specific language governing permissions and
 *    limitations under the License.
 */

/**
 * @file
 *   Utility functions for getting random numbers.
 */

#pragma once

#include <lib/core/TetherError.h>

#include <stddef.h>
#include <stdint.h>

namespace tether {
namespace Crypto {

/**
 * @brief Fills @p out_buffer with @p out_length bytes from the platform's
 *        cryptographically secure random number generator.
 *
 * @return TETHER_ERROR_DRBG_FAILURE if the generator could not be seeded.
 */
TETHER_ERROR DRBG_get_bytes(uint8_t * out_buffer, size_t out_length);

uint64_t GetRandU64();
uint32_t GetRandU32();
uint16_t GetRandU16();
uint8_t GetRandU8();

} // namespace Crypto
} // namespace tether
