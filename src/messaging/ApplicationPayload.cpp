/*
 *
 *    Copyright (c) 2021 Project CHIP Authors
 *    All rights reserved.
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

#include <messaging/ApplicationPayload.h>

#include <lib/support/CodeUtils.h>

#include <algorithm>
#include <string.h>

namespace tether {
namespace Messaging {

TETHER_ERROR PlainPayload::EncodeInto(MutableByteSpan & buffer)
{
    VerifyOrReturnError(mData.size() <= buffer.size(), TETHER_ERROR_MESSAGE_TOO_LONG);
    return CopySpanToMutableSpan(ByteSpan(mData.data(), mData.size()), buffer);
}

TETHER_ERROR ByteChunkedPayload::EncodeInto(MutableByteSpan & buffer)
{
    VerifyOrReturnError(!buffer.empty() || !HasMoreChunks(), TETHER_ERROR_BUFFER_TOO_SMALL);

    size_t length = std::min(buffer.size(), mData.size() - mOffset);
    if (length > 0)
    {
        memcpy(buffer.data(), mData.data() + mOffset, length);
    }
    buffer.reduce_size(length);
    mOffset += length;
    return TETHER_NO_ERROR;
}

} // namespace Messaging
} // namespace tether
