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
 *   Random number helpers on top of the OpenSSL DRBG.
 */

#include <crypto/RandUtils.h>

#include <lib/support/CodeUtils.h>

#include <limits.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace tether {
namespace Crypto {

TETHER_ERROR DRBG_get_bytes(uint8_t * out_buffer, size_t out_length)
{
    VerifyOrReturnError(out_buffer != nullptr, TETHER_ERROR_INVALID_ARGUMENT);
    VerifyOrReturnError(out_length > 0 && out_length <= INT_MAX, TETHER_ERROR_INVALID_ARGUMENT);

    if (RAND_bytes(out_buffer, static_cast<int>(out_length)) != 1)
    {
        TetherLogError(Crypto, "RAND_bytes failed: %lu", ERR_get_error());
        return TETHER_ERROR_DRBG_FAILURE;
    }

    return TETHER_NO_ERROR;
}

uint64_t GetRandU64()
{
    uint64_t tmp = 0;
    VerifyOrDie(DRBG_get_bytes(reinterpret_cast<uint8_t *>(&tmp), sizeof(tmp)) == TETHER_NO_ERROR);
    return tmp;
}

uint32_t GetRandU32()
{
    uint32_t tmp = 0;
    VerifyOrDie(DRBG_get_bytes(reinterpret_cast<uint8_t *>(&tmp), sizeof(tmp)) == TETHER_NO_ERROR);
    return tmp;
}

uint16_t GetRandU16()
{
    uint16_t tmp = 0;
    VerifyOrDie(DRBG_get_bytes(reinterpret_cast<uint8_t *>(&tmp), sizeof(tmp)) == TETHER_NO_ERROR);
    return tmp;
}

uint8_t GetRandU8()
{
    uint8_t tmp = 0;
    VerifyOrDie(DRBG_get_bytes(&tmp, sizeof(tmp)) == TETHER_NO_ERROR);
    return tmp;
}

} // namespace Crypto
} // namespace tether
